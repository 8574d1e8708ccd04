#include "io/device_profile.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace inkcomp::device_profile
{
namespace
{
static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

static bool ProfileFromJson(const json& item, DeviceProfile& p, Error& err)
{
    if (!item.is_object())
        return err.Set(ErrorKind::ParseError, "Profile entry is not an object.");

    p = DeviceProfile{};
    p.name = item.value("name", std::string());
    if (p.name.empty())
        return err.Set(ErrorKind::ParseError, "Profile entry has no name.");

    p.width = item.value("width", p.width);
    p.height = item.value("height", p.height);
    if (p.width <= 0 || p.height <= 0)
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Profile '" + p.name + "' has invalid size " + std::to_string(p.width) + "x" +
                           std::to_string(p.height) + ".");
    }

    p.white_bit = item.value("white_bit", p.white_bit) != 0 ? 1 : 0;

    const std::string dither = item.value("final_dither", std::string(dither::DitherModeToString(p.final_dither)));
    if (!dither::DitherModeFromString(dither, p.final_dither))
        return err.Set(ErrorKind::ParseError, "Profile '" + p.name + "': unknown final_dither '" + dither + "'.");

    if (item.contains("transforms"))
    {
        const json& tj = item["transforms"];
        if (!tj.is_array())
            return err.Set(ErrorKind::ParseError, "Profile '" + p.name + "': transforms must be an array.");
        for (const auto& t : tj)
        {
            transform::CanvasTransform ct{};
            const std::string s = t.get<std::string>();
            if (!transform::CanvasTransformFromString(s, ct))
                return err.Set(ErrorKind::ParseError, "Profile '" + p.name + "': unknown transform '" + s + "'.");
            p.transforms.push_back(ct);
        }
    }
    return true;
}
} // namespace

DeviceProfile DefaultProfile()
{
    return DeviceProfile{};
}

std::string GetConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/inkcomp";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/inkcomp";

    // Last resort: current directory
    return ".";
}

std::string DefaultProfilesPath()
{
    return (fs::path(GetConfigDir()) / "profiles.json").string();
}

bool ParseProfiles(std::string_view json_text, std::vector<DeviceProfile>& out, Error& err)
{
    err.Clear();
    out.clear();

    try
    {
        const json j = json::parse(json_text.begin(), json_text.end());
        if (!j.is_object() || !j.contains("profiles") || !j["profiles"].is_array())
            return err.Set(ErrorKind::ParseError, "Expected an object with a \"profiles\" array.");

        for (const auto& item : j["profiles"])
        {
            DeviceProfile p;
            if (!ProfileFromJson(item, p, err))
            {
                out.clear();
                return false;
            }
            out.push_back(std::move(p));
        }
    }
    catch (const json::exception& e)
    {
        out.clear();
        return err.Set(ErrorKind::ParseError, e.what());
    }
    return true;
}

bool LoadProfiles(const std::string& path, std::vector<DeviceProfile>& out, Error& err)
{
    err.Clear();
    std::ifstream f(path);
    if (!f)
        return err.Set(ErrorKind::LoadError, "Failed to open " + path);

    std::stringstream ss;
    ss << f.rdbuf();
    if (!ParseProfiles(ss.str(), out, err))
    {
        err.message = path + ": " + err.message;
        return false;
    }
    return true;
}

bool FindProfile(const std::vector<DeviceProfile>& profiles, std::string_view name, DeviceProfile& out)
{
    for (const DeviceProfile& p : profiles)
    {
        if (p.name == name)
        {
            out = p;
            return true;
        }
    }
    if (name == "default")
    {
        out = DefaultProfile();
        return true;
    }
    return false;
}

RenderOptions ToRenderOptions(const DeviceProfile& p, std::uint8_t background)
{
    RenderOptions opt;
    opt.background = background;
    opt.final_dither = p.final_dither;
    opt.transforms = p.transforms;
    return opt;
}

bit_pack::PackOptions ToPackOptions(const DeviceProfile& p)
{
    bit_pack::PackOptions opt;
    opt.white_bit = p.white_bit;
    return opt;
}
} // namespace inkcomp::device_profile
