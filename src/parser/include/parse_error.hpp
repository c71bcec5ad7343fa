#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace avr::parse
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN         = 0U,

            INVALID_VALUE   = 1U,
            OUT_OF_RANGE    = 2U,
            TYPE_MISMATCH   = 3U,
            MISSING_FIELD   = 4U,
            IO_ERROR        = 5U
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<avr::parse::Error::Kind> : std::formatter<std::string> {
    auto format(const avr::parse::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case avr::parse::Error::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);
            case avr::parse::Error::Kind::OUT_OF_RANGE : return formatter<string>::format("Out of range", ctx);
            case avr::parse::Error::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);
            case avr::parse::Error::Kind::MISSING_FIELD : return formatter<string>::format("Missing field", ctx);
            case avr::parse::Error::Kind::IO_ERROR : return formatter<string>::format("I/O error", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
    }
};
