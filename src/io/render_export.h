#pragma once

#include "core/bit_pack.h"
#include "core/composer.h"
#include "core/error.h"
#include "io/image_writer.h"

#include <string>

namespace inkcomp
{
// Render `composer` with `opt` and write it to `path` in `format`.
// Binary output packs with `pack`; it needs a binary render (set a final dither).
bool SaveRender(const Composer& composer,
                const std::string& path,
                image_writer::OutputFormat format,
                const RenderOptions& opt,
                Error& err,
                const bit_pack::PackOptions& pack = {});
} // namespace inkcomp
