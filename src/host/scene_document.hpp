#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hostbridge::host {

using Point3 = std::array<double, 3>;

struct Layer {
    std::string id;
    std::string name;
    std::array<int, 3> color{0, 0, 0};
    bool visible = true;
    bool locked = false;
};

struct SceneObject {
    std::string id;
    std::string short_id;    // DDHHMMSS of creation, suffixed on collision
    std::string created_at;  // ISO-8601 UTC
    std::string name;
    std::string description;
    std::string type;
    std::string layer;
    Point3 min_corner{0.0, 0.0, 0.0};
    Point3 max_corner{0.0, 0.0, 0.0};
    bool visible = true;
};

// In-memory stand-in for the modeling application's active document. Not
// thread safe: only the host's execution turn may touch it.
class SceneDocument {
public:
    SceneDocument();

    const std::string& version() const { return version_; }
    const std::string& file_path() const { return file_path_; }
    const std::string& units() const { return units_; }
    void set_file_path(std::string path) { file_path_ = std::move(path); }

    const std::vector<Layer>& layers() const { return layers_; }
    const Layer& current_layer() const { return layers_[current_layer_]; }
    const Layer* find_layer(const std::string& name) const;

    // Returns the named layer, creating it with the next palette colour when
    // it does not exist yet.
    const Layer& ensure_layer(const std::string& name);
    bool set_current_layer(const std::string& name);

    const std::vector<SceneObject>& objects() const { return objects_; }
    SceneObject* find_object(const std::string& id);
    const SceneObject* find_object(const std::string& id) const;

    // Adds an axis-aligned box with edge `size` whose minimum corner is
    // `origin`. An empty layer means the current layer; an empty name gets
    // "Box_<short_id>".
    const SceneObject& add_box(const Point3& origin, double size,
                               const std::string& name = "",
                               const std::string& layer = "",
                               std::chrono::system_clock::time_point created =
                                   std::chrono::system_clock::now());

private:
    std::string make_short_id(std::chrono::system_clock::time_point created) const;

    std::string version_;
    std::string file_path_;
    std::string units_;
    std::vector<Layer> layers_;
    std::size_t current_layer_ = 0;
    std::vector<SceneObject> objects_;
    std::size_t next_object_ = 1;
};

// "2024-05-01T12:00:00Z"
std::string format_iso8601(std::chrono::system_clock::time_point time);

// Glob match supporting '*' and '?', case-sensitive.
bool wildcard_match(const std::string& pattern, const std::string& text);

}  // namespace hostbridge::host
