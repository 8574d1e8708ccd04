// JSON composition templates.
//
// Document shape:
//   {
//     "template_version": "1.0",
//     "width": 250, "height": 128,
//     "layers": [
//       { "id": "title", "type": "text", "visible": true, "x": 10, "y": 4,
//         "text": "HELLO", "color": 0, "font_size": 1 },
//       { "id": "addr", "type": "text", "placeholder_type": "ip", "x": 10, "y": 20 },
//       { "id": "frame", "type": "rectangle", "x": 0, "y": 0, "width": 250, "height": 128,
//         "filled": false, "color": 0 },
//       { "id": "logo", "type": "image", "image_path": "logo.png", "x": 0, "y": 30,
//         "resize_mode": "fit", "dither_mode": "floyd-steinberg", "brightness": 1.0,
//         "contrast": 0.0, "rotate": 0, "flip_h": false, "flip_v": false,
//         "crop_x": null, "crop_y": null }
//     ]
//   }
#pragma once

#include "core/composer.h"
#include "core/error.h"
#include "core/layer.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <unordered_map>

namespace inkcomp::template_file
{
inline constexpr const char* kTemplateVersion = "1.0";

// Values substituted into text layers by their "placeholder_type" (e.g. "ip" -> "10.0.0.2").
using Bindings = std::unordered_map<std::string, std::string>;

struct LoadOptions
{
    Bindings bindings;

    // Relative image paths are resolved against this directory (empty = leave as-is).
    std::string base_dir;
};

// Build `out` from a template document. `out` takes the template's canvas size (keeping its
// current size when the document names none) and its previous layers are dropped.
// Fails with ParseError on malformed JSON, an unknown layer type or enum value, or a
// wrongly-typed field; `out` is left untouched on failure.
bool ParseTemplate(std::string_view json_text, const LoadOptions& opt, Composer& out, Error& err);

// Reads `path` and parses it; relative image paths resolve against the file's directory
// unless `opt.base_dir` is set.
bool LoadTemplate(const std::string& path, const LoadOptions& opt, Composer& out, Error& err);

// Per-layer description: id, type, visible, x, y and the type-specific fields.
// Image layers report their path only; in-memory pixels are not serialized.
nlohmann::json LayerToJson(const Layer& layer);
nlohmann::json DescribeLayers(const Composer& composer);

// Whole composition as a template document.
nlohmann::json TemplateToJson(const Composer& composer);
bool           SaveTemplate(const std::string& path, const Composer& composer, Error& err);
} // namespace inkcomp::template_file
