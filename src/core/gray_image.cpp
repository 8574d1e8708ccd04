#include "core/gray_image.h"

#include <algorithm>

namespace inkcomp
{
bool GrayImage::IsBinary() const
{
    return std::all_of(pixels.begin(), pixels.end(), [](std::uint8_t v) { return v == 0 || v == 255; });
}
} // namespace inkcomp
