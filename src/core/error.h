// Error reporting shared by every inkcomp module.
// Fallible calls return bool and fill an Error out-parameter; nothing throws across module boundaries.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace inkcomp
{
enum class ErrorKind : std::uint8_t
{
    None = 0,
    InvalidDimension, // non-positive or nonsensical width/height/target size
    InvalidInput,     // wrong-shaped or wrong-valued pixel grid / parameter
    LoadError,        // source image unreadable
    LayerNotFound,    // id-keyed layer operation on an unknown id
    ParseError,       // malformed template / profile document
    WriteError,       // output file could not be written
};

inline constexpr const char* ErrorKindToString(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::None:             return "none";
        case ErrorKind::InvalidDimension: return "invalid_dimension";
        case ErrorKind::InvalidInput:     return "invalid_input";
        case ErrorKind::LoadError:        return "load_error";
        case ErrorKind::LayerNotFound:    return "layer_not_found";
        case ErrorKind::ParseError:       return "parse_error";
        case ErrorKind::WriteError:       return "write_error";
    }
    return "none";
}

struct Error
{
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    void Clear()
    {
        kind = ErrorKind::None;
        message.clear();
    }

    // Always returns false so call sites can `return err.Set(...);`.
    bool Set(ErrorKind k, std::string msg)
    {
        kind = k;
        message = std::move(msg);
        return false;
    }

    bool Ok() const { return kind == ErrorKind::None; }

    // "invalid_input: Empty pixel grid."
    std::string ToString() const
    {
        if (kind == ErrorKind::None)
            return {};
        return std::string(ErrorKindToString(kind)) + ": " + message;
    }
};
} // namespace inkcomp
