#include "core/layer.h"

#include "core/text_raster.h"

#include <string>

namespace inkcomp
{
bool NormalizeRotation(int degrees, int& out)
{
    if (degrees % 90 != 0)
        return false;
    out = ((degrees % 360) + 360) % 360;
    return true;
}

bool ValidatePatch(const ImagePatch& p, Error& err)
{
    err.Clear();
    if (p.rotate)
    {
        int norm = 0;
        if (!NormalizeRotation(*p.rotate, norm))
        {
            return err.Set(ErrorKind::InvalidInput,
                           "Rotation must be a multiple of 90 degrees (got " + std::to_string(*p.rotate) + ").");
        }
    }
    if (p.pixels && !p.pixels->Valid())
        return err.Set(ErrorKind::InvalidInput, "Image layer pixels must be a non-empty 2D grid.");
    return true;
}

bool ValidatePatch(const TextPatch& p, Error& err)
{
    err.Clear();
    if (p.font_size && (*p.font_size < 1 || *p.font_size > text::kMaxFontSize))
    {
        return err.Set(ErrorKind::InvalidInput,
                       "Font size must be within 1.." + std::to_string(text::kMaxFontSize) + " (got " +
                           std::to_string(*p.font_size) + ").");
    }
    return true;
}

bool ValidatePatch(const RectanglePatch& p, Error& err)
{
    // Zero or negative sizes are legal: they clip to nothing at render time.
    (void)p;
    err.Clear();
    return true;
}

void ApplyPatch(LayerCommon& l, const LayerPatch& p)
{
    if (p.visible) l.visible = *p.visible;
    if (p.x) l.x = *p.x;
    if (p.y) l.y = *p.y;
}

void ApplyPatch(ImageLayer& l, const ImagePatch& p)
{
    ApplyPatch(static_cast<LayerCommon&>(l), static_cast<const LayerPatch&>(p));
    if (p.pixels) l.pixels = *p.pixels;
    if (p.path) l.path = *p.path;
    if (p.resize_mode) l.resize_mode = *p.resize_mode;
    if (p.dither_mode) l.dither_mode = *p.dither_mode;
    if (p.brightness) l.brightness = *p.brightness;
    if (p.contrast) l.contrast = *p.contrast;
    if (p.rotate) NormalizeRotation(*p.rotate, l.rotate);
    if (p.flip_h) l.flip_h = *p.flip_h;
    if (p.flip_v) l.flip_v = *p.flip_v;
    if (p.crop) l.crop = *p.crop;
}

void ApplyPatch(TextLayer& l, const TextPatch& p)
{
    ApplyPatch(static_cast<LayerCommon&>(l), static_cast<const LayerPatch&>(p));
    if (p.text) l.text = *p.text;
    if (p.color) l.color = *p.color;
    if (p.font_size) l.font_size = *p.font_size;
}

void ApplyPatch(RectangleLayer& l, const RectanglePatch& p)
{
    ApplyPatch(static_cast<LayerCommon&>(l), static_cast<const LayerPatch&>(p));
    if (p.width) l.width = *p.width;
    if (p.height) l.height = *p.height;
    if (p.filled) l.filled = *p.filled;
    if (p.color) l.color = *p.color;
}
} // namespace inkcomp
