#include <catch2/catch.hpp>

#include "core/transform.h"

#include <cstdint>
#include <vector>

using namespace inkcomp;

namespace {

    static GrayImage make_grid(int w, int h, const std::vector<std::uint8_t>& px) {
        GrayImage img(w, h);
        img.pixels = px;
        return img;
    }

    // 0, 1, 2, ... in row-major order.
    static GrayImage make_ramp(int w, int h) {
        GrayImage img(w, h);
        for (size_t i = 0; i < img.pixels.size(); ++i)
            img.pixels[i] = (std::uint8_t)i;
        return img;
    }

} // namespace

TEST_CASE("Rotate90Ccw turns a quarter counter-clockwise", "[transform]") {
    // 1 2 3          3 6
    // 4 5 6   ->     2 5
    //                1 4
    const GrayImage src = make_grid(3, 2, {1, 2, 3, 4, 5, 6});
    const GrayImage out = transform::Rotate90Ccw(src);

    REQUIRE(out.width == 2);
    REQUIRE(out.height == 3);
    CHECK(out.pixels == std::vector<std::uint8_t>{3, 6, 2, 5, 1, 4});
}

TEST_CASE("Four quarter turns are the identity", "[transform]") {
    const GrayImage src = make_ramp(7, 3);
    GrayImage img = src;
    for (int i = 0; i < 4; ++i)
        img = transform::Rotate90Ccw(img);
    CHECK(img == src);

    CHECK(transform::RotateCcw(src, 360) == src);
    CHECK(transform::RotateCcw(src, 0) == src);
    CHECK(transform::RotateCcw(src, -90) == transform::RotateCcw(src, 270));
}

TEST_CASE("Flips are self-inverse", "[transform]") {
    const GrayImage src = make_ramp(5, 4);

    const GrayImage h = transform::FlipHorizontal(src);
    CHECK(h.At(0, 0) == src.At(4, 0));
    CHECK(h.At(4, 3) == src.At(0, 3));
    CHECK(transform::FlipHorizontal(h) == src);

    const GrayImage v = transform::FlipVertical(src);
    CHECK(v.At(2, 0) == src.At(2, 3));
    CHECK(transform::FlipVertical(v) == src);
}

TEST_CASE("Invert and brightness/contrast", "[transform]") {
    const GrayImage src = make_grid(4, 1, {0, 100, 200, 255});

    CHECK(transform::Invert(src).pixels == std::vector<std::uint8_t>{255, 155, 55, 0});

    SECTION("identity parameters leave pixels unchanged") {
        CHECK(transform::AdjustBrightnessContrast(src, 1.0f, 0.0f) == src);
    }
    SECTION("brightness multiplies and clamps") {
        const GrayImage out = transform::AdjustBrightnessContrast(src, 1.5f, 0.0f);
        CHECK(out.pixels == std::vector<std::uint8_t>{0, 150, 255, 255});
    }
    SECTION("contrast offsets in units of full scale and truncates") {
        const GrayImage out = transform::AdjustBrightnessContrast(src, 1.0f, 0.1f);
        // 100 + 25.5 = 125.5 -> 125
        CHECK(out.At(1, 0) == 125);
        const GrayImage dark = transform::AdjustBrightnessContrast(src, 1.0f, -0.5f);
        CHECK(dark.At(1, 0) == 0);
        CHECK(dark.At(3, 0) == 127);
    }
}

TEST_CASE("Resize stretch samples nearest neighbour", "[transform][resize]") {
    const GrayImage src = make_grid(2, 2, {10, 20, 30, 40});
    GrayImage out;
    Error err;

    REQUIRE(transform::Resize(src, 4, 4, transform::ResizeMode::Stretch, {}, out, err));
    REQUIRE(out.width == 4);
    REQUIRE(out.height == 4);
    CHECK(out.pixels == std::vector<std::uint8_t>{
        10, 10, 20, 20,
        10, 10, 20, 20,
        30, 30, 40, 40,
        30, 30, 40, 40,
    });
}

TEST_CASE("Resize fit preserves aspect and pads with white", "[transform][resize]") {
    const GrayImage src(4, 2, 0);
    GrayImage out;
    Error err;

    REQUIRE(transform::Resize(src, 8, 8, transform::ResizeMode::Fit, {}, out, err));
    REQUIRE(out.width == 8);
    REQUIRE(out.height == 8);
    for (int y = 0; y < 8; ++y) {
        const std::uint8_t expected = (y >= 2 && y < 6) ? 0 : 255;
        for (int x = 0; x < 8; ++x)
            CHECK(out.At(x, y) == expected);
    }
}

TEST_CASE("Resize crop covers the target and honours the anchor", "[transform][resize]") {
    // Left half black, right half white.
    const GrayImage src = make_grid(4, 2, {0, 0, 255, 255, 0, 0, 255, 255});
    GrayImage out;
    Error err;

    SECTION("absent anchor centers the window") {
        REQUIRE(transform::Resize(src, 2, 2, transform::ResizeMode::Crop, {}, out, err));
        CHECK(out.pixels == std::vector<std::uint8_t>{0, 255, 0, 255});
    }
    SECTION("explicit anchor selects the window") {
        transform::CropAnchor anchor;
        anchor.x = 0;
        REQUIRE(transform::Resize(src, 2, 2, transform::ResizeMode::Crop, anchor, out, err));
        CHECK(out.pixels == std::vector<std::uint8_t>{0, 0, 0, 0});
    }
    SECTION("anchor past the edge is clamped") {
        transform::CropAnchor anchor;
        anchor.x = 100;
        anchor.y = -5;
        REQUIRE(transform::Resize(src, 2, 2, transform::ResizeMode::Crop, anchor, out, err));
        CHECK(out.pixels == std::vector<std::uint8_t>{255, 255, 255, 255});
    }
}

TEST_CASE("Resize rejects bad targets and empty sources", "[transform][resize]") {
    GrayImage out;
    Error err;

    CHECK_FALSE(transform::Resize(GrayImage(2, 2), 0, 5, transform::ResizeMode::Stretch, {}, out, err));
    CHECK(err.kind == ErrorKind::InvalidDimension);

    CHECK_FALSE(transform::Resize(GrayImage(2, 2), 5, -1, transform::ResizeMode::Fit, {}, out, err));
    CHECK(err.kind == ErrorKind::InvalidDimension);

    CHECK_FALSE(transform::Resize(GrayImage(), 5, 5, transform::ResizeMode::Crop, {}, out, err));
    CHECK(err.kind == ErrorKind::InvalidInput);
}

TEST_CASE("Resize stays within the pixel limit", "[transform][resize]") {
    GrayImage out;
    Error err;

    SECTION("over-limit targets are rejected") {
        CHECK_FALSE(transform::Resize(GrayImage(2, 2), 1 << 20, 1 << 20, transform::ResizeMode::Stretch, {}, out, err));
        CHECK(err.kind == ErrorKind::InvalidDimension);
    }
    SECTION("a steep crop samples only the window") {
        // 1x1000 column covering a 1000x1 row scales to 1000x1000000 before cropping.
        // The centered window lands on the middle source rows.
        GrayImage src(1, 1000, 255);
        src.pixels[499] = 0;
        src.pixels[500] = 0;
        REQUIRE(transform::Resize(src, 1000, 1, transform::ResizeMode::Crop, {}, out, err));
        CHECK(out.width == 1000);
        CHECK(out.height == 1);
        for (std::uint8_t p : out.pixels)
            REQUIRE(p == 0);
    }
}

TEST_CASE("Canvas transform names round-trip", "[transform]") {
    for (auto t : {transform::CanvasTransform::FlipH,
                   transform::CanvasTransform::FlipV,
                   transform::CanvasTransform::Rotate90,
                   transform::CanvasTransform::Invert}) {
        transform::CanvasTransform parsed{};
        REQUIRE(transform::CanvasTransformFromString(transform::CanvasTransformToString(t), parsed));
        CHECK(parsed == t);
    }
    transform::CanvasTransform t{};
    CHECK_FALSE(transform::CanvasTransformFromString("rotate-45", t));
}
