#include "host/scene_document.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"

namespace hostbridge::host {

namespace {

constexpr std::array<std::array<int, 3>, 6> kLayerPalette{{{0, 0, 0},
                                                          {255, 0, 0},
                                                          {0, 128, 0},
                                                          {0, 0, 255},
                                                          {255, 191, 0},
                                                          {128, 0, 128}}};

std::tm to_utc(const std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc;
}

}  // namespace

std::string format_iso8601(const std::chrono::system_clock::time_point time) {
    const std::tm utc = to_utc(time);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool wildcard_match(const std::string& pattern, const std::string& text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string::npos;
    std::size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

SceneDocument::SceneDocument()
    : version_("hostbridge-sim 1.0"), file_path_(""), units_("Millimeters") {
    ensure_layer("Default");
}

const Layer* SceneDocument::find_layer(const std::string& name) const {
    for (const auto& layer : layers_) {
        if (layer.name == name) {
            return &layer;
        }
    }
    return nullptr;
}

const Layer& SceneDocument::ensure_layer(const std::string& name) {
    if (const Layer* existing = find_layer(name)) {
        return *existing;
    }
    Layer layer;
    layer.id = core::config::generate_id("layer", 12);
    layer.name = name;
    layer.color = kLayerPalette[layers_.size() % kLayerPalette.size()];
    layers_.push_back(std::move(layer));
    return layers_.back();
}

bool SceneDocument::set_current_layer(const std::string& name) {
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i].name == name) {
            current_layer_ = i;
            return true;
        }
    }
    return false;
}

SceneObject* SceneDocument::find_object(const std::string& id) {
    for (auto& object : objects_) {
        if (object.id == id) {
            return &object;
        }
    }
    return nullptr;
}

const SceneObject* SceneDocument::find_object(const std::string& id) const {
    for (const auto& object : objects_) {
        if (object.id == id) {
            return &object;
        }
    }
    return nullptr;
}

std::string SceneDocument::make_short_id(
    const std::chrono::system_clock::time_point created) const {
    const std::tm utc = to_utc(created);
    std::ostringstream out;
    out << std::put_time(&utc, "%d%H%M%S");
    const std::string base = out.str();

    std::string candidate = base;
    int suffix = 1;
    bool taken = true;
    while (taken) {
        taken = false;
        for (const auto& object : objects_) {
            if (object.short_id == candidate) {
                taken = true;
                candidate = base + "-" + std::to_string(++suffix);
                break;
            }
        }
    }
    return candidate;
}

const SceneObject& SceneDocument::add_box(const Point3& origin, const double size,
                                          const std::string& name,
                                          const std::string& layer,
                                          const std::chrono::system_clock::time_point created) {
    const std::string layer_name = layer.empty() ? current_layer().name : ensure_layer(layer).name;

    SceneObject object;
    object.id = "obj-" + std::to_string(next_object_++);
    object.short_id = make_short_id(created);
    object.created_at = format_iso8601(created);
    object.type = "Box";
    object.name = name.empty() ? "Box_" + object.short_id : name;
    object.layer = layer_name;
    object.min_corner = origin;
    object.max_corner = {origin[0] + size, origin[1] + size, origin[2] + size};
    objects_.push_back(std::move(object));
    return objects_.back();
}

}  // namespace hostbridge::host
