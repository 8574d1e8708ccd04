#pragma once

#include "core/bit_pack.h"
#include "core/composer.h"
#include "core/dither.h"
#include "core/error.h"
#include "core/transform.h"

#include <string>
#include <string_view>
#include <vector>

// Panel descriptions: canvas size, bit polarity and the final passes a panel needs.
//
// Profiles file (JSON):
//   { "profiles": [ { "name": "...", "width": 250, "height": 128, "white_bit": 1,
//                     "final_dither": "threshold", "transforms": ["rotate-90"] } ] }
namespace inkcomp::device_profile
{
struct DeviceProfile
{
    std::string name = "default";
    int         width = 250;
    int         height = 128;

    // Bit written for a white pixel when packing (see bit_pack::PackOptions).
    int white_bit = 1;

    dither::DitherMode                      final_dither = dither::DitherMode::Threshold;
    std::vector<transform::CanvasTransform> transforms;
};

// Built-in 250x128 panel profile; always available as "default".
DeviceProfile DefaultProfile();

// "<config_dir>/inkcomp" where config_dir is $XDG_CONFIG_HOME or $HOME/.config (falls back to ".").
std::string GetConfigDir();

// "<GetConfigDir()>/profiles.json"
std::string DefaultProfilesPath();

// Parse a profiles document. The built-in default is not added. Fails with ParseError
// on malformed JSON or a wrongly-typed field and InvalidDimension on a non-positive size.
bool ParseProfiles(std::string_view json_text, std::vector<DeviceProfile>& out, Error& err);

bool LoadProfiles(const std::string& path, std::vector<DeviceProfile>& out, Error& err);

// Looks `name` up in `profiles`, falling back to the built-in default for "default".
bool FindProfile(const std::vector<DeviceProfile>& profiles, std::string_view name, DeviceProfile& out);

RenderOptions        ToRenderOptions(const DeviceProfile& p, std::uint8_t background = 255);
bit_pack::PackOptions ToPackOptions(const DeviceProfile& p);
} // namespace inkcomp::device_profile
