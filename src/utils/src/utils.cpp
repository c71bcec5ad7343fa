#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace avr::utils
{
    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(std::string_view value)
    {
        const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

        std::size_t first = 0;
        while(first < value.size() && is_space(value[first]))
        {
            ++first;
        }

        std::size_t last = value.size();
        while(last > first && is_space(value[last - 1]))
        {
            --last;
        }

        return std::string(value.substr(first, last - first));
    }

    std::string stripHexPrefix(const std::string & value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value.substr(2);
        }
        return value;
    }

    std::string withHexPrefix(std::string value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value;
        }
        return std::string("0x") + value;
    }

    std::string toHexQuantity(const std::uint64_t value)
    {
        return std::format("0x{:x}", value);
    }

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        const std::string digits = stripHexPrefix(value);
        if(digits.empty())
        {
            return 0;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out, 16);
        if(ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return out;
    }

    std::optional<std::uint64_t> parseDecimal(std::string_view value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out, 10);
        if(ec != std::errc{} || ptr != value.data() + value.size())
        {
            return std::nullopt;
        }
        return out;
    }

    bool isValidUtf8(const std::vector<std::uint8_t> & bytes)
    {
        std::size_t i = 0;
        const std::size_t size = bytes.size();

        while(i < size)
        {
            const std::uint8_t lead = bytes[i];
            if(lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t continuation = 0;
            std::uint32_t code_point = 0;
            std::uint32_t min_code_point = 0;

            if((lead & 0xE0) == 0xC0)
            {
                continuation = 1;
                code_point = lead & 0x1F;
                min_code_point = 0x80;
            }
            else if((lead & 0xF0) == 0xE0)
            {
                continuation = 2;
                code_point = lead & 0x0F;
                min_code_point = 0x800;
            }
            else if((lead & 0xF8) == 0xF0)
            {
                continuation = 3;
                code_point = lead & 0x07;
                min_code_point = 0x10000;
            }
            else
            {
                return false;
            }

            if(size - i <= continuation)
            {
                return false;
            }

            for(std::size_t k = 1; k <= continuation; ++k)
            {
                const std::uint8_t next = bytes[i + k];
                if((next & 0xC0) != 0x80)
                {
                    return false;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }

            if(code_point < min_code_point || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
            {
                return false;
            }

            i += continuation + 1;
        }

        return true;
    }
}
