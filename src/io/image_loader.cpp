#include "io/image_loader.h"

#include <limits>
#include <string>
#include <utility>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace inkcomp::image_loader
{
namespace
{
// Takes ownership of a stb grey+alpha buffer and flattens it over white.
static bool AdoptGreyAlpha(unsigned char* data, int w, int h, GrayImage& out, Error& err)
{
    if (!data)
    {
        return err.Set(ErrorKind::LoadError,
                       std::string("Failed to load image: ") +
                           (stbi_failure_reason() ? stbi_failure_reason() : "unknown error"));
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        return err.Set(ErrorKind::LoadError, "Invalid image dimensions.");
    }

    GrayImage img(w, h);
    const size_t n = (size_t)w * (size_t)h;
    for (size_t i = 0; i < n; ++i)
    {
        const unsigned g = data[i * 2u + 0];
        const unsigned a = data[i * 2u + 1];
        img.pixels[i] = (std::uint8_t)((g * a + 255u * (255u - a) + 127u) / 255u);
    }

    stbi_image_free(data);
    out = std::move(img);
    return true;
}
} // namespace

bool LoadImageAsGray8(const std::string& path, GrayImage& out, Error& err)
{
    err.Clear();

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 2 channels so we always get grey + alpha.
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 2);
    if (!data)
    {
        return err.Set(ErrorKind::LoadError,
                       "Failed to load image '" + path + "': " +
                           (stbi_failure_reason() ? stbi_failure_reason() : "unknown error"));
    }
    return AdoptGreyAlpha(data, w, h, out, err);
}

bool LoadImageFromMemoryAsGray8(const std::vector<std::uint8_t>& bytes, GrayImage& out, Error& err)
{
    err.Clear();
    if (bytes.empty())
        return err.Set(ErrorKind::LoadError, "Empty image buffer.");
    if (bytes.size() > (size_t)std::numeric_limits<int>::max())
        return err.Set(ErrorKind::LoadError, "Image buffer too large.");

    int w = 0;
    int h = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 2);
    return AdoptGreyAlpha(data, w, h, out, err);
}
} // namespace inkcomp::image_loader
