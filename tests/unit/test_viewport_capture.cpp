#include <array>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "host/scene_document.hpp"
#include "host/viewport_capture.hpp"

namespace {

using hostbridge::core::errors::ErrorKind;
using hostbridge::core::errors::get_error;
using hostbridge::core::errors::get_value;
using hostbridge::core::errors::is_error;
using hostbridge::host::Point3;
using hostbridge::host::SceneDocument;
using hostbridge::host::ViewportImage;
using hostbridge::host::ViewportOptions;
using hostbridge::host::base64_encode;
using hostbridge::host::capture_viewport;
using hostbridge::host::encode_ppm;

using Rgb = std::array<int, 3>;

Rgb pixel(const ViewportImage& image, const int x, const int y) {
    const std::size_t at = (static_cast<std::size_t>(y) * image.width + x) * 3;
    return Rgb{image.rgb[at], image.rgb[at + 1], image.rgb[at + 2]};
}

ViewportImage capture(const SceneDocument& document, const ViewportOptions& options) {
    auto captured = capture_viewport(document, options);
    EXPECT_FALSE(is_error(captured));
    return is_error(captured) ? ViewportImage{} : get_value(captured);
}

// One red 10x10 footprint; with max_size 120 one world unit is ten pixels
// and the padded view spans [-1, 11] on both axes.
class ViewportCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        document.add_box(Point3{0.0, 0.0, 0.0}, 10.0, "Wall", "Walls");
        options.max_size = 120;
    }

    SceneDocument document;
    ViewportOptions options;
};

TEST_F(ViewportCaptureTest, DrawsFootprintInLayerColour) {
    const auto image = capture(document, options);
    ASSERT_EQ(image.width, 120);
    ASSERT_EQ(image.height, 120);
    ASSERT_EQ(image.rgb.size(), 120u * 120u * 3u);

    EXPECT_EQ(pixel(image, 60, 60), (Rgb{255, 0, 0}));
    EXPECT_EQ(pixel(image, 10, 60), (Rgb{127, 0, 0}));
    EXPECT_EQ(pixel(image, 2, 2), (Rgb{190, 190, 190}));
    EXPECT_EQ(pixel(image, 60, 115), (Rgb{190, 190, 190}));
}

TEST_F(ViewportCaptureTest, AnnotatesTopCornerWithShortId) {
    const auto image = capture(document, options);
    ASSERT_EQ(image.annotations.size(), 1u);
    const auto& note = image.annotations.front();
    EXPECT_EQ(note.object_id, document.objects().front().id);
    EXPECT_EQ(note.short_id, document.objects().front().short_id);
    EXPECT_EQ(note.text, "Wall\n" + note.short_id);
    EXPECT_EQ(note.x, 110);
    EXPECT_EQ(note.y, 10);
    EXPECT_EQ(pixel(image, 110, 10), (Rgb{255, 255, 255}));
}

TEST_F(ViewportCaptureTest, WithoutAnnotationsNoMarkerIsDrawn) {
    options.show_annotations = false;
    const auto image = capture(document, options);
    EXPECT_TRUE(image.annotations.empty());
    EXPECT_EQ(pixel(image, 110, 10), (Rgb{127, 0, 0}));
}

TEST_F(ViewportCaptureTest, LayerFilterOnlyNarrowsAnnotations) {
    document.add_box(Point3{2.0, 2.0, 0.0}, 1.0, "Slab", "Floors");
    options.layer = "Floors";
    const auto image = capture(document, options);
    ASSERT_EQ(image.annotations.size(), 1u);
    EXPECT_EQ(image.annotations.front().text.rfind("Slab\n", 0), 0u);
    // The Walls box is still drawn.
    EXPECT_EQ(pixel(image, 80, 40), (Rgb{255, 0, 0}));

    options.layer = "Roof";
    EXPECT_TRUE(capture(document, options).annotations.empty());
}

TEST_F(ViewportCaptureTest, HiddenObjectsAreSkipped) {
    document.add_box(Point3{100.0, 100.0, 0.0}, 5.0, "Far");
    document.find_object(document.objects().back().id)->visible = false;

    const auto image = capture(document, options);
    EXPECT_EQ(image.annotations.size(), 1u);
    EXPECT_EQ(pixel(image, 60, 60), (Rgb{255, 0, 0}));
}

TEST(ViewportCaptureShapeTest, LongerWorldSideGetsMaxSize) {
    SceneDocument document;
    document.add_box(Point3{0.0, 0.0, 0.0}, 1.0);
    document.add_box(Point3{9.0, 0.0, 0.0}, 1.0);

    ViewportOptions options;
    options.max_size = 120;
    auto captured = capture_viewport(document, options);
    ASSERT_FALSE(is_error(captured));
    EXPECT_EQ(get_value(captured).width, 120);
    EXPECT_EQ(get_value(captured).height, 30);
}

TEST(ViewportCaptureShapeTest, EmptyDocumentIsSquareBackground) {
    SceneDocument document;
    ViewportOptions options;
    options.max_size = 32;
    auto captured = capture_viewport(document, options);
    ASSERT_FALSE(is_error(captured));
    const auto& image = get_value(captured);
    EXPECT_EQ(image.width, 32);
    EXPECT_EQ(image.height, 32);
    EXPECT_TRUE(image.annotations.empty());
    EXPECT_EQ(pixel(image, 16, 16), (Rgb{190, 190, 190}));
}

TEST(ViewportCaptureShapeTest, RejectsOutOfRangeSize) {
    SceneDocument document;
    ViewportOptions options;
    options.max_size = 8;
    auto small = capture_viewport(document, options);
    ASSERT_TRUE(is_error(small));
    EXPECT_EQ(get_error(small).kind, ErrorKind::Shape);
    EXPECT_EQ(get_error(small).code, "param_out_of_range");

    options.max_size = 5000;
    EXPECT_TRUE(is_error(capture_viewport(document, options)));
}

TEST(ViewportEncodingTest, PpmCarriesHeaderAndPixels) {
    ViewportImage image;
    image.width = 2;
    image.height = 1;
    image.rgb = {255, 0, 0, 0, 0, 255};
    const std::string ppm = encode_ppm(image);
    EXPECT_EQ(ppm, std::string("P6\n2 1\n255\n\xff\x00\x00\x00\x00\xff", 17));
}

TEST(ViewportEncodingTest, Base64PadsPartialGroups) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64_encode(std::string("\xff\x00", 2)), "/wA=");
}

}  // namespace
