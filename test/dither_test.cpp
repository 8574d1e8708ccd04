#include <catch2/catch.hpp>

#include "core/dither.h"

#include <cstdint>
#include <vector>

using namespace inkcomp;

namespace {

    static GrayImage make_gradient(int w, int h) {
        GrayImage img(w, h);
        for (int y = 0; y < h; ++y)
            for (int x = 0; x < w; ++x)
                img.At(x, y) = (std::uint8_t)((x * 255) / (w - 1));
        return img;
    }

    static int count_white(const GrayImage& img) {
        int n = 0;
        for (std::uint8_t v : img.pixels)
            n += (v == 255) ? 1 : 0;
        return n;
    }

} // namespace

TEST_CASE("Threshold splits strictly above 128", "[dither]") {
    GrayImage src(4, 1);
    src.pixels = {0, 128, 129, 255};

    GrayImage out;
    Error err;
    REQUIRE(dither::Threshold(src, out, err));
    CHECK(out.pixels == std::vector<std::uint8_t>{0, 0, 255, 255});
}

TEST_CASE("Threshold is idempotent", "[dither]") {
    const GrayImage src = make_gradient(32, 4);
    GrayImage once, twice;
    Error err;
    REQUIRE(dither::Threshold(src, once, err));
    REQUIRE(dither::Threshold(once, twice, err));
    CHECK(once == twice);
    CHECK(once.IsBinary());
}

TEST_CASE("Floyd-Steinberg output is binary and keeps the input shape", "[dither]") {
    const GrayImage src = make_gradient(40, 12);
    GrayImage out;
    Error err;
    REQUIRE(dither::FloydSteinberg(src, out, err));
    CHECK(out.width == 40);
    CHECK(out.height == 12);
    CHECK(out.IsBinary());
}

TEST_CASE("Floyd-Steinberg leaves pure black and pure white untouched", "[dither]") {
    GrayImage out;
    Error err;

    const GrayImage black(9, 7, 0);
    REQUIRE(dither::FloydSteinberg(black, out, err));
    CHECK(out == black);

    const GrayImage white(9, 7, 255);
    REQUIRE(dither::FloydSteinberg(white, out, err));
    CHECK(out == white);
}

TEST_CASE("Floyd-Steinberg pushes error east before the next decision", "[dither]") {
    // 100 -> 0 (error +100); east neighbour becomes 100 + 100 * 7/16 = 143.75 -> 255.
    GrayImage src(2, 1);
    src.pixels = {100, 100};

    GrayImage out;
    Error err;
    REQUIRE(dither::FloydSteinberg(src, out, err));
    CHECK(out.pixels == std::vector<std::uint8_t>{0, 255});
}

TEST_CASE("Floyd-Steinberg treats 128 as white", "[dither]") {
    GrayImage src(1, 1, 128);
    GrayImage out;
    Error err;
    REQUIRE(dither::FloydSteinberg(src, out, err));
    CHECK(out.At(0, 0) == 255);
}

TEST_CASE("Floyd-Steinberg preserves mean tone of mid gray", "[dither]") {
    const GrayImage src(32, 32, 128);
    GrayImage out;
    Error err;
    REQUIRE(dither::FloydSteinberg(src, out, err));

    const int whites = count_white(out);
    CHECK(whites > 32 * 32 * 40 / 100);
    CHECK(whites < 32 * 32 * 60 / 100);
}

TEST_CASE("Dither may write into its own input", "[dither]") {
    const GrayImage src = make_gradient(16, 3);

    GrayImage expected;
    Error err;
    REQUIRE(dither::FloydSteinberg(src, expected, err));

    GrayImage img = src;
    REQUIRE(dither::Apply(dither::DitherMode::FloydSteinberg, img, img, err));
    CHECK(img == expected);
}

TEST_CASE("DitherMode::None copies the input", "[dither]") {
    const GrayImage src = make_gradient(8, 2);
    GrayImage out;
    Error err;
    REQUIRE(dither::Apply(dither::DitherMode::None, src, out, err));
    CHECK(out == src);
}

TEST_CASE("Dithering an empty grid fails with InvalidInput", "[dither]") {
    GrayImage out;
    Error err;
    CHECK_FALSE(dither::Threshold(GrayImage(), out, err));
    CHECK(err.kind == ErrorKind::InvalidInput);

    err.Clear();
    CHECK_FALSE(dither::FloydSteinberg(GrayImage(), out, err));
    CHECK(err.kind == ErrorKind::InvalidInput);
}

TEST_CASE("Dither mode spellings", "[dither]") {
    dither::DitherMode m{};
    REQUIRE(dither::DitherModeFromString("error-diffusion", m));
    CHECK(m == dither::DitherMode::FloydSteinberg);
    REQUIRE(dither::DitherModeFromString("threshold", m));
    CHECK(m == dither::DitherMode::Threshold);
    REQUIRE(dither::DitherModeFromString("none", m));
    CHECK(m == dither::DitherMode::None);
    CHECK_FALSE(dither::DitherModeFromString("ordered", m));
}
