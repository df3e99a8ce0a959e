#include "host/viewport_capture.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace hostbridge::host {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

using Rgb = std::array<int, 3>;

constexpr Rgb kBackground{190, 190, 190};
constexpr Rgb kMarker{255, 255, 255};
constexpr double kPaddingRatio = 0.1;
constexpr int kMarkerRadius = 1;

constexpr const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

struct Extents {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

class Canvas {
public:
    Canvas(const int width, const int height, const Extents& world, const double scale)
        : width_(width), height_(height), world_(world), scale_(scale) {}

    int to_x(const double x) const {
        return clamp_pixel(std::floor((x - world_.min_x) * scale_), width_);
    }

    int to_y(const double y) const {
        return clamp_pixel(std::floor((world_.max_y - y) * scale_), height_);
    }

    void fill(ViewportImage& image, int x0, int y0, int x1, int y1, const Rgb& color) const {
        x0 = std::max(0, x0);
        y0 = std::max(0, y0);
        x1 = std::min(width_ - 1, x1);
        y1 = std::min(height_ - 1, y1);
        for (int y = y0; y <= y1; ++y) {
            for (int x = x0; x <= x1; ++x) {
                set(image, x, y, color);
            }
        }
    }

    void outline(ViewportImage& image, const int x0, const int y0, const int x1, const int y1,
                 const Rgb& color) const {
        fill(image, x0, y0, x1, y0, color);
        fill(image, x0, y1, x1, y1, color);
        fill(image, x0, y0, x0, y1, color);
        fill(image, x1, y0, x1, y1, color);
    }

private:
    static int clamp_pixel(const double value, const int limit) {
        if (value < 0.0) {
            return 0;
        }
        if (value >= static_cast<double>(limit - 1)) {
            return limit - 1;
        }
        return static_cast<int>(value);
    }

    void set(ViewportImage& image, const int x, const int y, const Rgb& color) const {
        const std::size_t at =
            (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
             static_cast<std::size_t>(x)) *
            3;
        image.rgb[at] = static_cast<std::uint8_t>(color[0]);
        image.rgb[at + 1] = static_cast<std::uint8_t>(color[1]);
        image.rgb[at + 2] = static_cast<std::uint8_t>(color[2]);
    }

    int width_;
    int height_;
    Extents world_;
    double scale_;
};

bool is_drawn(const SceneDocument& document, const SceneObject& object) {
    if (!object.visible) {
        return false;
    }
    const Layer* layer = document.find_layer(object.layer);
    return layer == nullptr || layer->visible;
}

Extents padded_extents(const SceneDocument& document) {
    Extents extents{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                    std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    bool any = false;
    for (const auto& object : document.objects()) {
        if (!is_drawn(document, object)) {
            continue;
        }
        any = true;
        extents.min_x = std::min(extents.min_x, object.min_corner[0]);
        extents.min_y = std::min(extents.min_y, object.min_corner[1]);
        extents.max_x = std::max(extents.max_x, object.max_corner[0]);
        extents.max_y = std::max(extents.max_y, object.max_corner[1]);
    }
    if (!any) {
        return Extents{-1.0, -1.0, 1.0, 1.0};
    }

    double pad = std::max(extents.max_x - extents.min_x, extents.max_y - extents.min_y) *
                 kPaddingRatio;
    if (!(pad > 0.0)) {
        pad = 1.0;
    }
    extents.min_x -= pad;
    extents.min_y -= pad;
    extents.max_x += pad;
    extents.max_y += pad;
    return extents;
}

Rgb darker(const Rgb& color) {
    return Rgb{color[0] / 2, color[1] / 2, color[2] / 2};
}

}  // namespace

core::errors::Result<ViewportImage> capture_viewport(const SceneDocument& document,
                                                     const ViewportOptions& options) {
    if (options.max_size < kMinViewportSize || options.max_size > kMaxViewportSize) {
        return BridgeError{ErrorKind::Shape,
                           "capture_viewport: max_size must be between " +
                               std::to_string(kMinViewportSize) + " and " +
                               std::to_string(kMaxViewportSize),
                           "param_out_of_range"};
    }

    // 1. Fit the drawn objects into the longer image side
    const Extents world = padded_extents(document);
    const double world_w = world.max_x - world.min_x;
    const double world_h = world.max_y - world.min_y;
    const int longest = static_cast<int>(options.max_size);

    ViewportImage image;
    double scale = 0.0;
    if (world_w >= world_h) {
        scale = longest / world_w;
        image.width = longest;
        image.height = std::max(1, static_cast<int>(std::lround(world_h * scale)));
    } else {
        scale = longest / world_h;
        image.height = longest;
        image.width = std::max(1, static_cast<int>(std::lround(world_w * scale)));
    }
    image.rgb.resize(static_cast<std::size_t>(image.width) *
                     static_cast<std::size_t>(image.height) * 3);

    const Canvas canvas(image.width, image.height, world, scale);
    canvas.fill(image, 0, 0, image.width - 1, image.height - 1, kBackground);

    // 2. Footprints in document order, later objects on top
    for (const auto& object : document.objects()) {
        if (!is_drawn(document, object)) {
            continue;
        }
        const Layer* layer = document.find_layer(object.layer);
        const Rgb color = layer != nullptr ? layer->color : Rgb{0, 0, 0};
        const int x0 = canvas.to_x(object.min_corner[0]);
        const int x1 = canvas.to_x(object.max_corner[0]);
        const int y0 = canvas.to_y(object.max_corner[1]);
        const int y1 = canvas.to_y(object.min_corner[1]);
        canvas.fill(image, x0, y0, x1, y1, color);
        canvas.outline(image, x0, y0, x1, y1, darker(color));
    }

    // 3. Annotation markers, drawn last so boxes never hide them
    if (!options.show_annotations) {
        return image;
    }
    for (const auto& object : document.objects()) {
        if (!is_drawn(document, object)) {
            continue;
        }
        if (options.layer && object.layer != *options.layer) {
            continue;
        }
        ViewportAnnotation annotation;
        annotation.object_id = object.id;
        annotation.short_id = object.short_id;
        annotation.text =
            (object.name.empty() ? std::string("Unnamed") : object.name) + "\n" + object.short_id;
        annotation.x = canvas.to_x(object.max_corner[0]);
        annotation.y = canvas.to_y(object.max_corner[1]);
        canvas.fill(image, annotation.x - kMarkerRadius, annotation.y - kMarkerRadius,
                    annotation.x + kMarkerRadius, annotation.y + kMarkerRadius, kMarker);
        image.annotations.push_back(std::move(annotation));
    }
    return image;
}

std::string encode_ppm(const ViewportImage& image) {
    std::string out = "P6\n" + std::to_string(image.width) + " " +
                      std::to_string(image.height) + "\n255\n";
    out.append(reinterpret_cast<const char*>(image.rgb.data()), image.rgb.size());
    return out;
}

std::string base64_encode(const std::string& bytes) {
    std::string result;
    result.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const std::uint8_t*>(bytes.data());
    const std::size_t len = bytes.size();
    for (std::size_t i = 0; i < len; i += 3) {
        const std::uint32_t b0 = data[i];
        const std::uint32_t b1 = (i + 1 < len) ? data[i + 1] : 0;
        const std::uint32_t b2 = (i + 2 < len) ? data[i + 2] : 0;
        const std::uint32_t triple = (b0 << 16) | (b1 << 8) | b2;

        result.push_back(kBase64Chars[(triple >> 18) & 0x3F]);
        result.push_back(kBase64Chars[(triple >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? kBase64Chars[(triple >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? kBase64Chars[triple & 0x3F] : '=');
    }
    return result;
}

}  // namespace hostbridge::host
