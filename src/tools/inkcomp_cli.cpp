#include "core/composer.h"
#include "core/dither.h"
#include "core/transform.h"
#include "io/device_profile.h"
#include "io/image_writer.h"
#include "io/render_export.h"
#include "io/template_file.h"
#include "tools/cli_args.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace inkcomp;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage:\n"
              << "  " << argv0 << " render <template.json> -o <out> [options]\n"
              << "  " << argv0 << " info <template.json> [--set key=value]...\n"
              << "  " << argv0 << " profiles [--profiles <file>]\n"
              << "\n"
              << "Composes a layered template into a monochrome e-paper image.\n"
              << "\n"
              << "Render options:\n"
              << "  -o, --output <file>     Output path (format from extension unless --format)\n"
              << "  --format png|bmp|bin    Output format\n"
              << "  --profiles <file>       Device profiles file (default: <config>/inkcomp/profiles.json)\n"
              << "  --device <name>         Device profile (default: \"default\")\n"
              << "  --width <n>             Override canvas width\n"
              << "  --height <n>            Override canvas height\n"
              << "  --background <0..255>   Background value (default 255)\n"
              << "  --dither none|floyd-steinberg|threshold\n"
              << "                          Final dither pass (default: from profile)\n"
              << "  --transform <t>         flip-h|flip-v|rotate-90|invert; repeatable, applied in order\n"
              << "                          (replaces the profile's transform list)\n"
              << "  --white-bit 0|1         Packed bit value for white pixels\n"
              << "  --set key=value         Bind a text placeholder (e.g. --set ip=10.0.0.2)\n"
              << "  --verbose               Print progress to stderr\n";
}

struct CliOptions
{
    std::string command;
    std::string template_path;
    std::string output_path;
    std::string profiles_path;
    std::string device = "default";

    std::optional<image_writer::OutputFormat> format;
    std::optional<int>                        width;
    std::optional<int>                        height;
    int                                       background = 255;
    std::optional<dither::DitherMode>         dither;
    std::vector<transform::CanvasTransform>   transforms;
    bool                                      transforms_set = false;
    std::optional<int>                        white_bit;
    template_file::Bindings                   bindings;
    bool                                      verbose = false;
};

// Returns 0 on success, 2 on a usage error (message already printed).
static int ParseArgs(int argc, char** argv, CliOptions& opt)
{
    if (argc < 2)
        return 2;
    opt.command = argv[1];

    std::vector<std::string> positional;
    for (int i = 2; i < argc; ++i)
    {
        const std::string a = argv[i];
        auto need_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << a << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;
        if (a == "-o" || a == "--output")
        {
            if (!need_value(opt.output_path))
                return 2;
        }
        else if (a == "--format")
        {
            if (!need_value(v))
                return 2;
            image_writer::OutputFormat f{};
            if (!image_writer::OutputFormatFromString(v, f))
            {
                std::cerr << "Unknown format: " << v << "\n";
                return 2;
            }
            opt.format = f;
        }
        else if (a == "--profiles")
        {
            if (!need_value(opt.profiles_path))
                return 2;
        }
        else if (a == "--device")
        {
            if (!need_value(opt.device))
                return 2;
        }
        else if (a == "--width" || a == "--height" || a == "--background" || a == "--white-bit")
        {
            int n = 0;
            if (!need_value(v) || !cli::ParseInt(v, n))
            {
                std::cerr << "Expected an integer for " << a << "\n";
                return 2;
            }
            if (a == "--width")
                opt.width = n;
            else if (a == "--height")
                opt.height = n;
            else if (a == "--background")
                opt.background = n;
            else
                opt.white_bit = n;
        }
        else if (a == "--dither")
        {
            if (!need_value(v))
                return 2;
            dither::DitherMode m{};
            if (!dither::DitherModeFromString(v, m))
            {
                std::cerr << "Unknown dither mode: " << v << "\n";
                return 2;
            }
            opt.dither = m;
        }
        else if (a == "--transform")
        {
            if (!need_value(v))
                return 2;
            transform::CanvasTransform t{};
            if (!transform::CanvasTransformFromString(v, t))
            {
                std::cerr << "Unknown transform: " << v << "\n";
                return 2;
            }
            opt.transforms.push_back(t);
            opt.transforms_set = true;
        }
        else if (a == "--set")
        {
            if (!need_value(v))
                return 2;
            std::string key;
            std::string value;
            if (!cli::ParseBinding(v, key, value))
            {
                std::cerr << "Expected key=value for --set, got: " << v << "\n";
                return 2;
            }
            opt.bindings[key] = value;
        }
        else if (a == "--verbose" || a == "-v")
        {
            opt.verbose = true;
        }
        else if (a == "-h" || a == "--help")
        {
            return 2;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            return 2;
        }
        else
        {
            positional.push_back(a);
        }
    }

    if (!positional.empty())
        opt.template_path = positional[0];
    if (positional.size() > 1)
    {
        std::cerr << "Unexpected argument: " << positional[1] << "\n";
        return 2;
    }
    if (opt.background < 0 || opt.background > 255)
    {
        std::cerr << "--background must be within 0..255\n";
        return 2;
    }
    return 0;
}

static bool LoadProfileList(const CliOptions& opt, std::vector<device_profile::DeviceProfile>& out)
{
    out.clear();
    const bool explicit_path = !opt.profiles_path.empty();
    const std::string path = explicit_path ? opt.profiles_path : device_profile::DefaultProfilesPath();

    std::error_code ec;
    if (!explicit_path && !fs::exists(path, ec))
        return true; // no user profiles: built-in default only

    Error err;
    if (!device_profile::LoadProfiles(path, out, err))
    {
        std::fprintf(stderr, "[profile] %s\n", err.ToString().c_str());
        return false;
    }
    return true;
}

static int RunRender(const CliOptions& opt)
{
    if (opt.template_path.empty() || opt.output_path.empty())
    {
        std::cerr << "render needs <template.json> and -o <out>\n";
        return 2;
    }

    std::vector<device_profile::DeviceProfile> profiles;
    if (!LoadProfileList(opt, profiles))
        return 1;
    device_profile::DeviceProfile profile;
    if (!device_profile::FindProfile(profiles, opt.device, profile))
    {
        std::fprintf(stderr, "[profile] unknown device profile '%s'\n", opt.device.c_str());
        return 1;
    }

    Composer composer(profile.width, profile.height);
    template_file::LoadOptions load;
    load.bindings = opt.bindings;

    Error err;
    if (!template_file::LoadTemplate(opt.template_path, load, composer, err))
    {
        std::fprintf(stderr, "[template] %s\n", err.ToString().c_str());
        return 1;
    }

    if (opt.width || opt.height)
    {
        if (!composer.SetSize(opt.width.value_or(composer.Width()), opt.height.value_or(composer.Height()), err))
        {
            std::fprintf(stderr, "[inkcomp] %s\n", err.ToString().c_str());
            return 1;
        }
    }

    RenderOptions ropt = device_profile::ToRenderOptions(profile, (std::uint8_t)opt.background);
    if (opt.dither)
        ropt.final_dither = *opt.dither;
    if (opt.transforms_set)
        ropt.transforms = opt.transforms;

    bit_pack::PackOptions pack = device_profile::ToPackOptions(profile);
    if (opt.white_bit)
        pack.white_bit = (*opt.white_bit != 0) ? 1 : 0;

    image_writer::OutputFormat format = image_writer::OutputFormat::Png;
    if (opt.format)
        format = *opt.format;
    else if (!image_writer::OutputFormatFromPath(opt.output_path, format))
        format = image_writer::OutputFormat::Png;

    if (opt.verbose)
    {
        std::fprintf(stderr,
                     "[inkcomp] %s: %dx%d, %d layer(s), device '%s', dither %s, format %s\n",
                     opt.template_path.c_str(),
                     composer.Width(),
                     composer.Height(),
                     composer.LayerCount(),
                     profile.name.c_str(),
                     dither::DitherModeToString(ropt.final_dither),
                     image_writer::OutputFormatToString(format));
    }

    if (!SaveRender(composer, opt.output_path, format, ropt, err, pack))
    {
        std::fprintf(stderr, "[export] %s\n", err.ToString().c_str());
        return 1;
    }

    if (opt.verbose)
        std::fprintf(stderr, "[inkcomp] wrote %s\n", opt.output_path.c_str());
    return 0;
}

static int RunInfo(const CliOptions& opt)
{
    if (opt.template_path.empty())
    {
        std::cerr << "info needs <template.json>\n";
        return 2;
    }

    Composer composer;
    template_file::LoadOptions load;
    load.bindings = opt.bindings;

    Error err;
    if (!template_file::LoadTemplate(opt.template_path, load, composer, err))
    {
        std::fprintf(stderr, "[template] %s\n", err.ToString().c_str());
        return 1;
    }

    nlohmann::json j;
    j["width"] = composer.Width();
    j["height"] = composer.Height();
    j["layers"] = template_file::DescribeLayers(composer);
    std::cout << j.dump(2) << "\n";
    return 0;
}

static int RunProfiles(const CliOptions& opt)
{
    std::vector<device_profile::DeviceProfile> profiles;
    if (!LoadProfileList(opt, profiles))
        return 1;

    bool has_default = false;
    for (const auto& p : profiles)
        has_default = has_default || p.name == "default";
    if (!has_default)
        profiles.insert(profiles.begin(), device_profile::DefaultProfile());

    for (const auto& p : profiles)
    {
        std::cout << p.name << "\t" << p.width << "x" << p.height << "\twhite_bit=" << p.white_bit
                  << "\tdither=" << dither::DitherModeToString(p.final_dither);
        for (transform::CanvasTransform t : p.transforms)
            std::cout << "\t" << transform::CanvasTransformToString(t);
        std::cout << "\n";
    }
    return 0;
}
} // namespace

int main(int argc, char** argv)
{
    CliOptions opt;
    if (ParseArgs(argc, argv, opt) != 0)
    {
        PrintUsage(argv[0]);
        return 2;
    }

    if (opt.command == "render")
        return RunRender(opt);
    if (opt.command == "info")
        return RunInfo(opt);
    if (opt.command == "profiles")
        return RunProfiles(opt);

    std::cerr << "Unknown command: " << opt.command << "\n";
    PrintUsage(argv[0]);
    return 2;
}
