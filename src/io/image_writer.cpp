#include "io/image_writer.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// LodePNG is compiled via src/io/lodepng_unit.cpp.
#include <lodepng.h>

// stb_image_write implementation must live in exactly one translation unit.
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace inkcomp::image_writer
{
namespace
{
static std::string FileExtLower(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(ext.begin());
    for (char& c : ext)
        c = (char)std::tolower((unsigned char)c);
    return ext;
}

static void ConfigurePngCompression(LodePNGState& state, int compression)
{
    // lodepng doesn't expose a single "compression level" knob like zlib, so we approximate.
    const int lvl = std::clamp(compression, 0, 9);
    if (lvl <= 0)
    {
        state.encoder.zlibsettings.btype = 0;    // uncompressed blocks
        state.encoder.zlibsettings.use_lz77 = 0; // no LZ77
        return;
    }
    state.encoder.zlibsettings.btype = 2; // dynamic Huffman
    state.encoder.zlibsettings.use_lz77 = 1;
    state.encoder.zlibsettings.windowsize = (lvl >= 6) ? 32768u : 2048u;
    state.encoder.zlibsettings.minmatch = 3;
    state.encoder.zlibsettings.nicematch = (lvl >= 7) ? 258u : 128u;
    state.encoder.zlibsettings.lazymatching = 1;
}
} // namespace

bool OutputFormatFromPath(const std::string& path, OutputFormat& out)
{
    return OutputFormatFromString(FileExtLower(path), out);
}

bool EncodePngGray8(const GrayImage& img, std::vector<std::uint8_t>& out, Error& err, int compression)
{
    err.Clear();
    out.clear();
    if (!img.Valid())
        return err.Set(ErrorKind::InvalidInput, "Cannot encode an empty pixel grid.");

    LodePNGState state;
    lodepng_state_init(&state);
    state.info_raw.colortype = LCT_GREY;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = LCT_GREY;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;
    ConfigurePngCompression(state, compression);

    unsigned char* png = nullptr;
    size_t png_size = 0;
    const unsigned enc_err =
        lodepng_encode(&png, &png_size, img.pixels.data(), (unsigned)img.width, (unsigned)img.height, &state);
    lodepng_state_cleanup(&state);
    if (enc_err != 0)
    {
        std::free(png);
        return err.Set(ErrorKind::WriteError, std::string("lodepng_encode failed: ") + lodepng_error_text(enc_err));
    }

    out.assign(png, png + png_size);
    std::free(png);
    return true;
}

bool WritePngGray8(const std::string& path, const GrayImage& img, Error& err, int compression)
{
    std::vector<std::uint8_t> png;
    if (!EncodePngGray8(img, png, err, compression))
        return false;

    const unsigned save_err = lodepng_save_file(png.data(), png.size(), path.c_str());
    if (save_err != 0)
    {
        return err.Set(ErrorKind::WriteError,
                       "lodepng_save_file failed for '" + path + "': " + lodepng_error_text(save_err));
    }
    return true;
}

bool WriteBmpMono(const std::string& path, const GrayImage& img, Error& err)
{
    err.Clear();
    if (!img.Valid())
        return err.Set(ErrorKind::InvalidInput, "Cannot write an empty pixel grid.");

    std::vector<std::uint8_t> mono(img.pixels.size());
    for (size_t i = 0; i < img.pixels.size(); ++i)
        mono[i] = (img.pixels[i] > 128) ? 255 : 0;

    const int ok = stbi_write_bmp(path.c_str(), img.width, img.height, 1, mono.data());
    if (!ok)
        return err.Set(ErrorKind::WriteError, "stbi_write_bmp() failed for '" + path + "'.");
    return true;
}

bool WriteBinary(const std::string& path, const std::vector<std::uint8_t>& bytes, Error& err)
{
    err.Clear();
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        return err.Set(ErrorKind::WriteError, "Failed to open '" + path + "' for writing.");
    f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    if (!f)
        return err.Set(ErrorKind::WriteError, "Failed to write '" + path + "'.");
    return true;
}
} // namespace inkcomp::image_writer
