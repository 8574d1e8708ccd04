#include "io/render_export.h"

#include <vector>

namespace inkcomp
{
bool SaveRender(const Composer& composer,
                const std::string& path,
                image_writer::OutputFormat format,
                const RenderOptions& opt,
                Error& err,
                const bit_pack::PackOptions& pack)
{
    using image_writer::OutputFormat;

    if (format == OutputFormat::Binary)
    {
        std::vector<std::uint8_t> bytes;
        if (!composer.RenderPacked(opt, bytes, err, pack))
            return false;
        return image_writer::WriteBinary(path, bytes, err);
    }

    GrayImage img;
    if (!composer.Render(opt, img, err))
        return false;
    if (format == OutputFormat::Bmp)
        return image_writer::WriteBmpMono(path, img, err);
    return image_writer::WritePngGray8(path, img, err);
}
} // namespace inkcomp
