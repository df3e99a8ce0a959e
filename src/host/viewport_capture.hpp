#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "host/scene_document.hpp"

namespace hostbridge::host {

struct ViewportOptions {
    // Only objects on this layer are annotated; all visible objects are drawn.
    std::optional<std::string> layer;
    bool show_annotations = true;
    // Length of the longer image side in pixels.
    std::int64_t max_size = 800;
};

struct ViewportAnnotation {
    std::string object_id;
    std::string short_id;
    std::string text;  // "<name>\n<short_id>"
    int x = 0;
    int y = 0;
};

struct ViewportImage {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgb;  // row-major, 3 bytes per pixel
    std::vector<ViewportAnnotation> annotations;
};

inline constexpr std::int64_t kMinViewportSize = 16;
inline constexpr std::int64_t kMaxViewportSize = 4096;

// Renders the document from above (world XY, Y up). Each visible box fills
// its footprint in its layer colour with a darker outline. Annotated
// objects get a white marker at the top corner of their bounding box.
core::errors::Result<ViewportImage> capture_viewport(const SceneDocument& document,
                                                     const ViewportOptions& options);

// Binary PPM (P6).
std::string encode_ppm(const ViewportImage& image);

std::string base64_encode(const std::string& bytes);

}  // namespace hostbridge::host
