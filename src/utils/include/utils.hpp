#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace avr::utils
{
    std::string currentTimestamp();

    bool equalsIgnoreCase(const std::string & a, const std::string & b);

    std::string toLower(std::string value);

    std::string trim(std::string_view value);

    std::string stripHexPrefix(const std::string & value);

    std::string withHexPrefix(std::string value);

    std::string toHexQuantity(std::uint64_t value);

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value);

    std::optional<std::uint64_t> parseDecimal(std::string_view value);

    /**
     * @brief Checks that `bytes` is well-formed UTF-8.
     *
     * Overlong encodings, surrogate code points and code points above U+10FFFF are rejected.
     */
    bool isValidUtf8(const std::vector<std::uint8_t> & bytes);
}
