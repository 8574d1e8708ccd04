#include "io/template_file.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace inkcomp::template_file
{
namespace
{
static std::uint8_t ColorFromJson(const json& item, const char* key, std::uint8_t def)
{
    return (std::uint8_t)std::clamp(item.value(key, (int)def), 0, 255);
}

static std::optional<int> OptionalInt(const json& item, const char* key)
{
    if (!item.contains(key) || item[key].is_null())
        return std::nullopt;
    return item[key].get<int>();
}

static void ReadCommon(const json& item, LayerCommon& c)
{
    c.id = item.value("id", std::string());
    c.visible = item.value("visible", true);
    c.x = item.value("x", 0);
    c.y = item.value("y", 0);
}

static std::string ResolvePath(const std::string& p, const std::string& base_dir)
{
    if (p.empty() || base_dir.empty())
        return p;
    const fs::path path(p);
    if (path.is_absolute())
        return p;
    return (fs::path(base_dir) / path).lexically_normal().string();
}

// Returns false with `err` set on a hard error. `skip` is set for layers that are legal
// but cannot be represented (QR placeholders need an external symbol generator).
static bool LayerFromJson(const json& item, const LoadOptions& opt, Layer& out, bool& skip, Error& err)
{
    skip = false;
    if (!item.is_object())
        return err.Set(ErrorKind::ParseError, "Layer entry is not an object.");

    const std::string type = item.value("type", std::string());
    LayerKind kind{};
    if (!LayerKindFromString(type, kind))
        return err.Set(ErrorKind::ParseError, "Unknown layer type '" + type + "'.");

    const std::string placeholder = item.value("placeholder_type", std::string());
    if (placeholder == "qr")
    {
        std::fprintf(stderr,
                     "[template] layer '%s': QR placeholders are not supported, skipped\n",
                     item.value("id", std::string()).c_str());
        skip = true;
        return true;
    }

    switch (kind)
    {
        case LayerKind::Image:
        {
            ImageLayer l;
            ReadCommon(item, l);
            l.path = ResolvePath(item.value("image_path", std::string()), opt.base_dir);

            const std::string resize = item.value("resize_mode", std::string("fit"));
            if (!transform::ResizeModeFromString(resize, l.resize_mode))
                return err.Set(ErrorKind::ParseError, "Unknown resize_mode '" + resize + "'.");
            const std::string dither = item.value("dither_mode", std::string("floyd-steinberg"));
            if (!dither::DitherModeFromString(dither, l.dither_mode))
                return err.Set(ErrorKind::ParseError, "Unknown dither_mode '" + dither + "'.");

            l.brightness = item.value("brightness", 1.0f);
            l.contrast = item.value("contrast", 0.0f);
            l.rotate = item.value("rotate", 0);
            l.flip_h = item.value("flip_h", false);
            l.flip_v = item.value("flip_v", false);
            l.crop.x = OptionalInt(item, "crop_x");
            l.crop.y = OptionalInt(item, "crop_y");
            out = std::move(l);
            return true;
        }
        case LayerKind::Text:
        {
            TextLayer l;
            ReadCommon(item, l);
            l.text = item.value("text", std::string());
            l.color = ColorFromJson(item, "color", 0);
            l.font_size = item.value("font_size", 1);
            if (!placeholder.empty())
            {
                auto it = opt.bindings.find(placeholder);
                if (it != opt.bindings.end())
                    l.text = it->second;
                else if (l.text.empty())
                    std::fprintf(stderr,
                                 "[template] layer '%s': no value bound for placeholder '%s'\n",
                                 l.id.c_str(),
                                 placeholder.c_str());
            }
            out = std::move(l);
            return true;
        }
        case LayerKind::Rectangle:
        {
            RectangleLayer l;
            ReadCommon(item, l);
            l.width = item.value("width", l.width);
            l.height = item.value("height", l.height);
            l.filled = item.value("filled", l.filled);
            l.color = ColorFromJson(item, "color", 0);
            out = std::move(l);
            return true;
        }
    }
    return err.Set(ErrorKind::ParseError, "Unhandled layer type '" + type + "'.");
}
} // namespace

bool ParseTemplate(std::string_view json_text, const LoadOptions& opt, Composer& out, Error& err)
{
    err.Clear();

    int width = 0;
    int height = 0;
    std::vector<Layer> layers;
    try
    {
        const json j = json::parse(json_text.begin(), json_text.end());
        if (!j.is_object())
            return err.Set(ErrorKind::ParseError, "Expected a top-level JSON object.");

        width = j.value("width", out.Width());
        height = j.value("height", out.Height());

        if (j.contains("layers"))
        {
            const json& lj = j["layers"];
            if (!lj.is_array())
                return err.Set(ErrorKind::ParseError, "\"layers\" must be an array.");
            for (size_t i = 0; i < lj.size(); ++i)
            {
                Layer layer;
                bool skip = false;
                if (!LayerFromJson(lj[i], opt, layer, skip, err))
                {
                    err.message = "layers[" + std::to_string(i) + "]: " + err.message;
                    return false;
                }
                if (!skip)
                    layers.push_back(std::move(layer));
            }
        }
    }
    catch (const json::exception& e)
    {
        return err.Set(ErrorKind::ParseError, e.what());
    }

    // Validate everything against a scratch composer first so `out` is untouched on failure.
    Composer staged(width, height);
    if (!staged.SetSize(width, height, err))
        return false;
    for (Layer& layer : layers)
    {
        std::string id;
        if (!staged.AddLayer(layer, id, err))
        {
            err.message = "Layer '" + Common(layer).id + "': " + err.message;
            return false;
        }
    }

    if (!out.SetSize(width, height, err))
        return false;
    out.ClearLayers();
    for (Layer& layer : layers)
    {
        std::string id;
        if (!out.AddLayer(std::move(layer), id, err))
            return false;
    }
    return true;
}

bool LoadTemplate(const std::string& path, const LoadOptions& opt, Composer& out, Error& err)
{
    err.Clear();
    std::ifstream f(path);
    if (!f)
        return err.Set(ErrorKind::LoadError, "Failed to open " + path);

    std::stringstream ss;
    ss << f.rdbuf();

    LoadOptions resolved = opt;
    if (resolved.base_dir.empty())
        resolved.base_dir = fs::path(path).parent_path().string();

    if (!ParseTemplate(ss.str(), resolved, out, err))
    {
        err.message = path + ": " + err.message;
        return false;
    }
    return true;
}

json LayerToJson(const Layer& layer)
{
    const LayerCommon& c = Common(layer);
    json j;
    j["id"] = c.id;
    j["type"] = LayerKindToString(KindOf(layer));
    j["visible"] = c.visible;
    j["x"] = c.x;
    j["y"] = c.y;

    if (const ImageLayer* l = std::get_if<ImageLayer>(&layer))
    {
        j["image_path"] = l->path;
        j["resize_mode"] = transform::ResizeModeToString(l->resize_mode);
        j["dither_mode"] = dither::DitherModeToString(l->dither_mode);
        j["brightness"] = l->brightness;
        j["contrast"] = l->contrast;
        j["rotate"] = l->rotate;
        j["flip_h"] = l->flip_h;
        j["flip_v"] = l->flip_v;
        j["crop_x"] = l->crop.x ? json(*l->crop.x) : json(nullptr);
        j["crop_y"] = l->crop.y ? json(*l->crop.y) : json(nullptr);
    }
    else if (const TextLayer* l = std::get_if<TextLayer>(&layer))
    {
        j["text"] = l->text;
        j["color"] = (int)l->color;
        j["font_size"] = l->font_size;
    }
    else if (const RectangleLayer* l = std::get_if<RectangleLayer>(&layer))
    {
        j["width"] = l->width;
        j["height"] = l->height;
        j["filled"] = l->filled;
        j["color"] = (int)l->color;
    }
    return j;
}

json DescribeLayers(const Composer& composer)
{
    json arr = json::array();
    for (const Layer& layer : composer.Layers())
        arr.push_back(LayerToJson(layer));
    return arr;
}

json TemplateToJson(const Composer& composer)
{
    json j;
    j["template_version"] = kTemplateVersion;
    j["width"] = composer.Width();
    j["height"] = composer.Height();
    j["layers"] = DescribeLayers(composer);
    return j;
}

bool SaveTemplate(const std::string& path, const Composer& composer, Error& err)
{
    err.Clear();
    std::ofstream f(path, std::ios::trunc);
    if (!f)
        return err.Set(ErrorKind::WriteError, "Failed to open " + path + " for writing.");
    f << TemplateToJson(composer).dump(2) << "\n";
    if (!f)
        return err.Set(ErrorKind::WriteError, "Failed to write " + path);
    return true;
}
} // namespace inkcomp::template_file
