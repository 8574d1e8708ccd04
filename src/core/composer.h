#pragma once

#include "core/bit_pack.h"
#include "core/dither.h"
#include "core/error.h"
#include "core/gray_image.h"
#include "core/layer.h"
#include "core/transform.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace inkcomp
{
// Options applied after every layer has been composited.
struct RenderOptions
{
    std::uint8_t       background = 255;
    dither::DitherMode final_dither = dither::DitherMode::None;

    // Applied in order, each feeding the next. An odd number of Rotate90 swaps the output dimensions.
    std::vector<transform::CanvasTransform> transforms;
};

// Image decode collaborator: (path) -> 8-bit grayscale grid, or false with a LoadError.
using ImageDecodeFn = std::function<bool(const std::string& path, GrayImage& out, Error& err)>;

// Layered monochrome composition for a fixed-size e-paper canvas.
//
// Layers are painted back-to-front in declaration order; later layers overwrite
// earlier ones wherever they overlap (no alpha). Render() is const: it never
// mutates the layer list, so two renders without an intervening mutation produce
// identical output. The class does no internal locking; callers that share one
// Composer across threads must serialize access themselves.
class Composer
{
public:
    explicit Composer(int width = 250, int height = 128);

    int  Width() const { return m_width; }
    int  Height() const { return m_height; }
    bool SetSize(int width, int height, Error& err);

    // ---------------------------------------------------------------------
    // Layer management
    // ---------------------------------------------------------------------
    // Appends `layer` (painted above every existing layer). An empty id is replaced
    // by a generated "layer_<n>". `out_id` receives the id actually used.
    // Fails with InvalidInput on an invalid field (e.g. rotation not a multiple of 90).
    bool AddLayer(Layer layer, std::string& out_id, Error& err);

    // Removes every layer carrying `id`. Returns false if none did.
    bool RemoveLayer(std::string_view id);

    // Flips visibility. Returns false if `id` is unknown.
    bool ToggleLayer(std::string_view id);
    bool SetLayerVisible(std::string_view id, bool visible);

    // Moves the layer to paint position `new_index` (clamped to [0, count-1]).
    bool MoveLayer(std::string_view id, int new_index);

    // Patch application. Fails with LayerNotFound for an unknown id and
    // InvalidInput if the patch type does not match the layer's type or a field is invalid.
    bool UpdateLayer(std::string_view id, const LayerPatch& patch, Error& err);
    bool UpdateLayer(std::string_view id, const ImagePatch& patch, Error& err);
    bool UpdateLayer(std::string_view id, const TextPatch& patch, Error& err);
    bool UpdateLayer(std::string_view id, const RectanglePatch& patch, Error& err);

    void ClearLayers();

    const Layer*              FindLayer(std::string_view id) const;
    const std::vector<Layer>& Layers() const { return m_layers; }
    int                       LayerCount() const { return (int)m_layers.size(); }

    // Replaces the decoder used for path-backed image layers (defaults to image_loader).
    void SetImageDecoder(ImageDecodeFn decode);

    // ---------------------------------------------------------------------
    // Rendering
    // ---------------------------------------------------------------------
    bool Render(const RenderOptions& opt, GrayImage& out, Error& err) const;

    // Render() followed by bit_pack::PackBits(). The render must end binary
    // (a dithering final pass, or only binary layers), otherwise this fails with InvalidInput.
    bool RenderPacked(const RenderOptions& opt,
                      std::vector<std::uint8_t>& out,
                      Error& err,
                      const bit_pack::PackOptions& pack = {}) const;

private:
    Layer*      FindMutableLayer(std::string_view id);
    std::string NextLayerId();

    bool LoadImageSource(const ImageLayer& layer, GrayImage& out, bool& has_source, Error& err) const;
    bool RenderImageLayer(const ImageLayer& layer, GrayImage& canvas, Error& err) const;
    void RenderTextLayer(const TextLayer& layer, GrayImage& canvas) const;
    void RenderRectangleLayer(const RectangleLayer& layer, GrayImage& canvas) const;

    template <typename PatchT, typename LayerT>
    bool UpdateTyped(std::string_view id, const PatchT& patch, Error& err);

    int                m_width = 0;
    int                m_height = 0;
    std::vector<Layer> m_layers;
    int                m_next_layer_id = 1;
    ImageDecodeFn      m_decode;
};
} // namespace inkcomp
