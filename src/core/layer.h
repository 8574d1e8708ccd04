// Layer model: a closed set of drawable units sharing placement and visibility.
#pragma once

#include "core/dither.h"
#include "core/error.h"
#include "core/gray_image.h"
#include "core/transform.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace inkcomp
{
enum class LayerKind : std::uint8_t
{
    Image = 0,
    Text,
    Rectangle,
};

inline constexpr const char* LayerKindToString(LayerKind k)
{
    switch (k)
    {
        case LayerKind::Image:     return "image";
        case LayerKind::Text:      return "text";
        case LayerKind::Rectangle: return "rectangle";
    }
    return "image";
}

inline bool LayerKindFromString(std::string_view s, LayerKind& out)
{
    if (s == "image")                   { out = LayerKind::Image; return true; }
    if (s == "text")                    { out = LayerKind::Text; return true; }
    if (s == "rectangle" || s == "rect") { out = LayerKind::Rectangle; return true; }
    return false;
}

// Fields every layer type carries.
struct LayerCommon
{
    // Not enforced unique: id lookup resolves to the most recently added match.
    std::string id;
    bool        visible = true;
    int         x = 0;
    int         y = 0;
};

struct ImageLayer : LayerCommon
{
    // In-memory pixels take precedence over `path`. With neither, the layer draws nothing.
    std::optional<GrayImage> pixels;
    std::string              path;

    transform::ResizeMode resize_mode = transform::ResizeMode::Fit;
    dither::DitherMode    dither_mode = dither::DitherMode::FloydSteinberg;

    float brightness = 1.0f; // multiplier, 1 = unchanged
    float contrast = 0.0f;   // additive offset in units of full scale, 0 = unchanged

    int  rotate = 0; // counter-clockwise degrees, one of 0/90/180/270
    bool flip_h = false;
    bool flip_v = false;

    transform::CropAnchor crop; // used by ResizeMode::Crop only
};

struct TextLayer : LayerCommon
{
    std::string  text;
    std::uint8_t color = 0; // 0 = black ink, 255 = white ink
    int          font_size = 1;
};

struct RectangleLayer : LayerCommon
{
    int          width = 10;
    int          height = 10;
    bool         filled = true;
    std::uint8_t color = 0;
};

using Layer = std::variant<ImageLayer, TextLayer, RectangleLayer>;

inline LayerCommon& Common(Layer& layer)
{
    return std::visit([](auto& l) -> LayerCommon& { return l; }, layer);
}

inline const LayerCommon& Common(const Layer& layer)
{
    return std::visit([](const auto& l) -> const LayerCommon& { return l; }, layer);
}

inline LayerKind KindOf(const Layer& layer)
{
    return (LayerKind)layer.index();
}

// Rotation accepted by image layers: any multiple of 90, normalized into [0, 360).
// Returns false (and leaves `out` untouched) for anything else.
bool NormalizeRotation(int degrees, int& out);

// ---------------------------------------------------------------------------
// Typed patches: only fields the target type supports can be expressed.
// Unset optionals leave the corresponding field unchanged.
// ---------------------------------------------------------------------------
struct LayerPatch
{
    std::optional<bool> visible;
    std::optional<int>  x;
    std::optional<int>  y;
};

struct ImagePatch : LayerPatch
{
    std::optional<GrayImage>             pixels;
    std::optional<std::string>           path;
    std::optional<transform::ResizeMode> resize_mode;
    std::optional<dither::DitherMode>    dither_mode;
    std::optional<float>                 brightness;
    std::optional<float>                 contrast;
    std::optional<int>                   rotate;
    std::optional<bool>                  flip_h;
    std::optional<bool>                  flip_v;
    std::optional<transform::CropAnchor> crop;
};

struct TextPatch : LayerPatch
{
    std::optional<std::string>  text;
    std::optional<std::uint8_t> color;
    std::optional<int>          font_size;
};

struct RectanglePatch : LayerPatch
{
    std::optional<int>          width;
    std::optional<int>          height;
    std::optional<bool>         filled;
    std::optional<std::uint8_t> color;
};

// Field-level validation shared by add and update paths (InvalidInput on failure).
bool ValidatePatch(const ImagePatch& p, Error& err);
bool ValidatePatch(const TextPatch& p, Error& err);
bool ValidatePatch(const RectanglePatch& p, Error& err);

void ApplyPatch(LayerCommon& l, const LayerPatch& p);
void ApplyPatch(ImageLayer& l, const ImagePatch& p);
void ApplyPatch(TextLayer& l, const TextPatch& p);
void ApplyPatch(RectangleLayer& l, const RectanglePatch& p);
} // namespace inkcomp
