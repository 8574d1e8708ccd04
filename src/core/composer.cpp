#include "core/composer.h"

#include "core/text_raster.h"
#include "io/image_loader.h"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace inkcomp
{
namespace
{
// Copy `src` onto `canvas` with its top-left at (x, y); both negative and overflow parts are clipped.
static void Blit(const GrayImage& src, int x, int y, GrayImage& canvas)
{
    const long long x0 = std::max<long long>(0, x);
    const long long y0 = std::max<long long>(0, y);
    const long long x1 = std::min<long long>(canvas.width, (long long)x + src.width);
    const long long y1 = std::min<long long>(canvas.height, (long long)y + src.height);
    if (x0 >= x1 || y0 >= y1)
        return;

    for (long long cy = y0; cy < y1; ++cy)
    {
        const std::uint8_t* srow = &src.pixels[(size_t)(cy - y) * (size_t)src.width + (size_t)(x0 - x)];
        std::copy_n(srow, (size_t)(x1 - x0), &canvas.pixels[(size_t)cy * (size_t)canvas.width + (size_t)x0]);
    }
}

static bool ValidateLayer(const Layer& layer, Error& err)
{
    err.Clear();
    if (const ImageLayer* img = std::get_if<ImageLayer>(&layer))
    {
        int rotate = 0;
        if (!NormalizeRotation(img->rotate, rotate))
        {
            return err.Set(ErrorKind::InvalidInput,
                           "Rotation must be a multiple of 90 degrees (got " + std::to_string(img->rotate) + ").");
        }
        if (img->pixels && !img->pixels->Valid())
            return err.Set(ErrorKind::InvalidInput, "Image layer pixels must be a non-empty 2D grid.");
        return true;
    }
    if (const TextLayer* txt = std::get_if<TextLayer>(&layer))
    {
        TextPatch p;
        p.font_size = txt->font_size;
        return ValidatePatch(p, err);
    }
    return true;
}
} // namespace

Composer::Composer(int width, int height)
    : m_width(width)
    , m_height(height)
    , m_decode([](const std::string& path, GrayImage& out, Error& err) {
        return image_loader::LoadImageAsGray8(path, out, err);
    })
{
}

bool Composer::SetSize(int width, int height, Error& err)
{
    err.Clear();
    if (!WithinPixelLimit(width, height))
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Invalid canvas size " + std::to_string(width) + "x" + std::to_string(height) + ".");
    }
    m_width = width;
    m_height = height;
    return true;
}

std::string Composer::NextLayerId()
{
    for (;;)
    {
        std::string id = "layer_" + std::to_string(m_next_layer_id++);
        if (!FindLayer(id))
            return id;
    }
}

bool Composer::AddLayer(Layer layer, std::string& out_id, Error& err)
{
    out_id.clear();
    if (!ValidateLayer(layer, err))
        return false;

    if (ImageLayer* img = std::get_if<ImageLayer>(&layer))
        NormalizeRotation(img->rotate, img->rotate);

    LayerCommon& common = Common(layer);
    if (common.id.empty())
        common.id = NextLayerId();
    out_id = common.id;
    m_layers.push_back(std::move(layer));
    return true;
}

Layer* Composer::FindMutableLayer(std::string_view id)
{
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it)
    {
        if (Common(*it).id == id)
            return &*it;
    }
    return nullptr;
}

const Layer* Composer::FindLayer(std::string_view id) const
{
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it)
    {
        if (Common(*it).id == id)
            return &*it;
    }
    return nullptr;
}

bool Composer::RemoveLayer(std::string_view id)
{
    const size_t before = m_layers.size();
    m_layers.erase(std::remove_if(m_layers.begin(),
                                  m_layers.end(),
                                  [&](const Layer& l) { return Common(l).id == id; }),
                   m_layers.end());
    return m_layers.size() != before;
}

bool Composer::ToggleLayer(std::string_view id)
{
    Layer* layer = FindMutableLayer(id);
    if (!layer)
        return false;
    LayerCommon& c = Common(*layer);
    c.visible = !c.visible;
    return true;
}

bool Composer::SetLayerVisible(std::string_view id, bool visible)
{
    Layer* layer = FindMutableLayer(id);
    if (!layer)
        return false;
    Common(*layer).visible = visible;
    return true;
}

bool Composer::MoveLayer(std::string_view id, int new_index)
{
    Layer* layer = FindMutableLayer(id);
    if (!layer)
        return false;

    const int n = (int)m_layers.size();
    const int from_index = (int)(layer - m_layers.data());
    const int to_index = std::clamp(new_index, 0, n - 1);
    if (from_index == to_index)
        return true;

    Layer moving = std::move(m_layers[(size_t)from_index]);
    m_layers.erase(m_layers.begin() + from_index);
    m_layers.insert(m_layers.begin() + to_index, std::move(moving));
    return true;
}

bool Composer::UpdateLayer(std::string_view id, const LayerPatch& patch, Error& err)
{
    err.Clear();
    Layer* layer = FindMutableLayer(id);
    if (!layer)
        return err.Set(ErrorKind::LayerNotFound, "No layer with id '" + std::string(id) + "'.");
    ApplyPatch(Common(*layer), patch);
    return true;
}

template <typename PatchT, typename LayerT>
bool Composer::UpdateTyped(std::string_view id, const PatchT& patch, Error& err)
{
    err.Clear();
    Layer* layer = FindMutableLayer(id);
    if (!layer)
        return err.Set(ErrorKind::LayerNotFound, "No layer with id '" + std::string(id) + "'.");

    LayerT* typed = std::get_if<LayerT>(layer);
    if (!typed)
    {
        return err.Set(ErrorKind::InvalidInput,
                       "Layer '" + std::string(id) + "' is a " + LayerKindToString(KindOf(*layer)) +
                           " layer; patch does not apply.");
    }
    if (!ValidatePatch(patch, err))
        return false;
    ApplyPatch(*typed, patch);
    return true;
}

bool Composer::UpdateLayer(std::string_view id, const ImagePatch& patch, Error& err)
{
    return UpdateTyped<ImagePatch, ImageLayer>(id, patch, err);
}

bool Composer::UpdateLayer(std::string_view id, const TextPatch& patch, Error& err)
{
    return UpdateTyped<TextPatch, TextLayer>(id, patch, err);
}

bool Composer::UpdateLayer(std::string_view id, const RectanglePatch& patch, Error& err)
{
    return UpdateTyped<RectanglePatch, RectangleLayer>(id, patch, err);
}

void Composer::ClearLayers()
{
    m_layers.clear();
}

void Composer::SetImageDecoder(ImageDecodeFn decode)
{
    m_decode = std::move(decode);
}

bool Composer::LoadImageSource(const ImageLayer& layer, GrayImage& out, bool& has_source, Error& err) const
{
    err.Clear();
    has_source = false;
    if (layer.pixels)
    {
        has_source = true;
        out = *layer.pixels;
        return true;
    }
    if (layer.path.empty())
        return true;

    has_source = true;
    if (!m_decode)
        return err.Set(ErrorKind::LoadError, "No image decoder configured for '" + layer.path + "'.");
    if (!m_decode(layer.path, out, err))
    {
        if (err.Ok())
            err.Set(ErrorKind::LoadError, "Failed to load image '" + layer.path + "'.");
        return false;
    }
    if (!out.Valid())
        return err.Set(ErrorKind::LoadError, "Decoded image '" + layer.path + "' is empty.");
    return true;
}

bool Composer::RenderImageLayer(const ImageLayer& layer, GrayImage& canvas, Error& err) const
{
    GrayImage img;
    bool has_source = false;
    if (!LoadImageSource(layer, img, has_source, err))
        return false;
    if (!has_source)
        return true;

    // Fixed order: flip_h, flip_v, then rotation.
    if (layer.flip_h)
        img = transform::FlipHorizontal(img);
    if (layer.flip_v)
        img = transform::FlipVertical(img);
    if (layer.rotate != 0)
        img = transform::RotateCcw(img, layer.rotate);

    // The footprint always runs from the layer origin to the canvas's bottom-right corner.
    const long long target_w = (long long)m_width - layer.x;
    const long long target_h = (long long)m_height - layer.y;
    if (target_w <= 0 || target_h <= 0)
        return true;
    if (!WithinPixelLimit(target_w, target_h))
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Image footprint " + std::to_string(target_w) + "x" + std::to_string(target_h) +
                           " exceeds the pixel limit.");
    }

    if (img.width != target_w || img.height != target_h)
    {
        GrayImage resized;
        if (!transform::Resize(img, (int)target_w, (int)target_h, layer.resize_mode, layer.crop, resized, err))
            return false;
        img = std::move(resized);
    }

    if (layer.brightness != 1.0f || layer.contrast != 0.0f)
        img = transform::AdjustBrightnessContrast(img, layer.brightness, layer.contrast);

    if (!dither::Apply(layer.dither_mode, img, img, err))
        return false;

    Blit(img, layer.x, layer.y, canvas);
    return true;
}

void Composer::RenderTextLayer(const TextLayer& layer, GrayImage& canvas) const
{
    if (layer.text.empty())
        return;
    text::RenderText(layer.text, layer.x, layer.y, canvas, layer.color, layer.font_size);
}

void Composer::RenderRectangleLayer(const RectangleLayer& layer, GrayImage& canvas) const
{
    const long long cx1 = std::max<long long>(0, layer.x);
    const long long cy1 = std::max<long long>(0, layer.y);
    const long long cx2 = std::min<long long>(canvas.width, (long long)layer.x + layer.width);
    const long long cy2 = std::min<long long>(canvas.height, (long long)layer.y + layer.height);
    if (cx1 >= cx2 || cy1 >= cy2)
        return;

    // Clipped bounds now lie within the canvas.
    const int x1 = (int)cx1;
    const int y1 = (int)cy1;
    const int x2 = (int)cx2;
    const int y2 = (int)cy2;

    auto hline = [&](int y) {
        std::fill_n(&canvas.pixels[(size_t)y * (size_t)canvas.width + (size_t)x1], x2 - x1, layer.color);
    };

    if (layer.filled)
    {
        for (int y = y1; y < y2; ++y)
            hline(y);
        return;
    }

    // 1px outline of the clipped rectangle.
    hline(y1);
    hline(y2 - 1);
    for (int y = y1; y < y2; ++y)
    {
        canvas.At(x1, y) = layer.color;
        canvas.At(x2 - 1, y) = layer.color;
    }
}

bool Composer::Render(const RenderOptions& opt, GrayImage& out, Error& err) const
{
    err.Clear();
    if (!WithinPixelLimit(m_width, m_height))
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Invalid canvas size " + std::to_string(m_width) + "x" + std::to_string(m_height) + ".");
    }

    GrayImage canvas(m_width, m_height, opt.background);

    for (const Layer& layer : m_layers)
    {
        if (!Common(layer).visible)
            continue;

        const bool ok = std::visit(
            [&](const auto& l) -> bool {
                using T = std::decay_t<decltype(l)>;
                if constexpr (std::is_same_v<T, ImageLayer>)
                {
                    return RenderImageLayer(l, canvas, err);
                }
                else if constexpr (std::is_same_v<T, TextLayer>)
                {
                    RenderTextLayer(l, canvas);
                    return true;
                }
                else
                {
                    static_assert(std::is_same_v<T, RectangleLayer>, "Unhandled layer type.");
                    RenderRectangleLayer(l, canvas);
                    return true;
                }
            },
            layer);
        if (!ok)
        {
            err.message = "Layer '" + Common(layer).id + "': " + err.message;
            return false;
        }
    }

    if (!dither::Apply(opt.final_dither, canvas, canvas, err))
        return false;

    for (transform::CanvasTransform t : opt.transforms)
        canvas = transform::ApplyCanvasTransform(canvas, t);

    out = std::move(canvas);
    return true;
}

bool Composer::RenderPacked(const RenderOptions& opt,
                            std::vector<std::uint8_t>& out,
                            Error& err,
                            const bit_pack::PackOptions& pack) const
{
    out.clear();
    GrayImage img;
    if (!Render(opt, img, err))
        return false;
    return bit_pack::PackBits(img, out, err, pack);
}
} // namespace inkcomp
