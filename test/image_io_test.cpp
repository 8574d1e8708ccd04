#include <catch2/catch.hpp>

#include "io/image_loader.h"
#include "io/image_writer.h"
#include "io/render_export.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace inkcomp;
namespace fs = std::filesystem;

namespace {

    // Removes the file on scope exit.
    struct TempFile {
        fs::path path;
        explicit TempFile(const char* name) : path(fs::temp_directory_path() / name) {}
        ~TempFile() {
            std::error_code ec;
            fs::remove(path, ec);
        }
        std::string str() const { return path.string(); }
    };

    static std::vector<std::uint8_t> read_all(const std::string& path) {
        std::ifstream f(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    static GrayImage make_ramp(int w, int h) {
        GrayImage img(w, h);
        for (size_t i = 0; i < img.pixels.size(); ++i)
            img.pixels[i] = (std::uint8_t)((i * 37) & 0xFF);
        return img;
    }

} // namespace

TEST_CASE("Output format from file extension", "[io]") {
    image_writer::OutputFormat f{};
    REQUIRE(image_writer::OutputFormatFromPath("out/panel.PNG", f));
    CHECK(f == image_writer::OutputFormat::Png);
    REQUIRE(image_writer::OutputFormatFromPath("panel.bmp", f));
    CHECK(f == image_writer::OutputFormat::Bmp);
    REQUIRE(image_writer::OutputFormatFromPath("panel.bin", f));
    CHECK(f == image_writer::OutputFormat::Binary);
    CHECK_FALSE(image_writer::OutputFormatFromPath("panel.txt", f));
    CHECK_FALSE(image_writer::OutputFormatFromPath("panel", f));
}

TEST_CASE("Grayscale PNG keeps every pixel value", "[io][png]") {
    const GrayImage src = make_ramp(17, 9);

    std::vector<std::uint8_t> png;
    Error err;
    REQUIRE(image_writer::EncodePngGray8(src, png, err));
    REQUIRE(png.size() > 8);
    CHECK(png[1] == 'P');
    CHECK(png[2] == 'N');
    CHECK(png[3] == 'G');

    GrayImage back;
    REQUIRE(image_loader::LoadImageFromMemoryAsGray8(png, back, err));
    CHECK(back == src);
}

TEST_CASE("Monochrome BMP is thresholded on write", "[io][bmp]") {
    GrayImage src(4, 2);
    src.pixels = {0, 128, 129, 255, 255, 129, 128, 0};

    TempFile tmp("inkcomp_image_io_test.bmp");
    Error err;
    REQUIRE(image_writer::WriteBmpMono(tmp.str(), src, err));

    GrayImage back;
    REQUIRE(image_loader::LoadImageAsGray8(tmp.str(), back, err));
    REQUIRE(back.width == 4);
    REQUIRE(back.height == 2);
    CHECK(back.pixels == std::vector<std::uint8_t>{0, 0, 255, 255, 255, 255, 0, 0});
}

TEST_CASE("Monochrome BMP is a 24-bpp black/white file", "[io][bmp]") {
    GrayImage src(3, 2);
    src.pixels = {0, 200, 90, 255, 128, 129};

    TempFile tmp("inkcomp_image_io_depth_test.bmp");
    Error err;
    REQUIRE(image_writer::WriteBmpMono(tmp.str(), src, err));

    const std::vector<std::uint8_t> bmp = read_all(tmp.str());
    REQUIRE(bmp.size() > 54);
    CHECK(bmp[0] == 'B');
    CHECK(bmp[1] == 'M');
    // BITMAPINFOHEADER biBitCount, little-endian.
    CHECK((bmp[28] | (bmp[29] << 8)) == 24);

    // Every sample in the pixel array is pure black or pure white.
    const std::uint32_t data_offset = bmp[10] | (bmp[11] << 8) | (bmp[12] << 16) | ((std::uint32_t)bmp[13] << 24);
    REQUIRE(data_offset < bmp.size());
    // Rows are 3 bytes per pixel padded to 4: 9 -> 12.
    for (int row = 0; row < 2; ++row)
        for (int i = 0; i < 9; ++i) {
            const std::uint8_t v = bmp[data_offset + (size_t)row * 12 + (size_t)i];
            CHECK((v == 0 || v == 255));
        }
}

TEST_CASE("Loading reports unreadable sources", "[io]") {
    GrayImage out;
    Error err;
    CHECK_FALSE(image_loader::LoadImageAsGray8("/nonexistent/inkcomp/missing.png", out, err));
    CHECK(err.kind == ErrorKind::LoadError);

    CHECK_FALSE(image_loader::LoadImageFromMemoryAsGray8({'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'}, out, err));
    CHECK(err.kind == ErrorKind::LoadError);
}

TEST_CASE("Composer decodes path-backed layers from disk", "[io][composer]") {
    TempFile tmp("inkcomp_image_io_layer.png");
    Error err;
    REQUIRE(image_writer::WritePngGray8(tmp.str(), GrayImage(6, 6, 0), err));

    Composer c(12, 12);
    ImageLayer l;
    l.path = tmp.str();
    l.x = 6;
    l.y = 6;
    l.resize_mode = transform::ResizeMode::Stretch;
    l.dither_mode = dither::DitherMode::None;
    std::string id;
    REQUIRE(c.AddLayer(l, id, err));

    GrayImage out;
    REQUIRE(c.Render({}, out, err));
    CHECK(out.At(5, 5) == 255);
    CHECK(out.At(6, 6) == 0);
    CHECK(out.At(11, 11) == 0);
}

TEST_CASE("SaveRender writes packed panel bytes", "[io][export]") {
    Composer c(16, 2);
    RectangleLayer r;
    r.width = 8;
    r.height = 2;
    std::string id;
    Error err;
    REQUIRE(c.AddLayer(r, id, err));

    TempFile tmp("inkcomp_image_io_panel.bin");
    bit_pack::PackOptions pack;
    pack.white_bit = 0;
    REQUIRE(SaveRender(c, tmp.str(), image_writer::OutputFormat::Binary, {}, err, pack));
    CHECK(read_all(tmp.str()) == std::vector<std::uint8_t>{0xFF, 0x00, 0xFF, 0x00});
}

TEST_CASE("SaveRender refuses to pack a grayscale canvas", "[io][export]") {
    Composer c(8, 8);
    RectangleLayer r;
    r.color = 90;
    std::string id;
    Error err;
    REQUIRE(c.AddLayer(r, id, err));

    TempFile tmp("inkcomp_image_io_gray.bin");
    CHECK_FALSE(SaveRender(c, tmp.str(), image_writer::OutputFormat::Binary, {}, err));
    CHECK(err.kind == ErrorKind::InvalidInput);

    RenderOptions opt;
    opt.final_dither = dither::DitherMode::FloydSteinberg;
    REQUIRE(SaveRender(c, tmp.str(), image_writer::OutputFormat::Binary, opt, err));
    CHECK(read_all(tmp.str()).size() == 8);
}

TEST_CASE("Writing to an unwritable path fails with WriteError", "[io][export]") {
    Composer c(4, 4);
    Error err;
    CHECK_FALSE(SaveRender(c, "/nonexistent/inkcomp/out.png", image_writer::OutputFormat::Png, {}, err));
    CHECK(err.kind == ErrorKind::WriteError);
}
