#include "scanner.hpp"

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "math.hpp"

namespace avr::abi
{
    std::optional<std::vector<std::uint8_t>> bruteForceFind(const std::vector<std::uint8_t> & data,
                                                            const std::string & target_hash,
                                                            const ScanLimits & limits)
    {
        // smallest buffer able to hold an offset word and a length word
        if(data.size() < 64)
        {
            return std::nullopt;
        }

        const std::uint8_t* bytes = data.data();
        const std::size_t size = data.size();

        for(std::size_t i = 0; i + 32 <= size; i += 32)
        {
            const auto offset_res = utils::readUint32Padded(bytes, size, i);
            if(!offset_res)
            {
                break;
            }

            const std::size_t offset = *offset_res;
            if(offset == 0 || offset % 32 != 0 || offset > limits.max_offset || offset + 32 > size)
            {
                continue;
            }

            const auto length_res = utils::readUint32Padded(bytes, size, offset);
            if(!length_res)
            {
                continue;
            }

            const std::size_t length = *length_res;
            if(length == 0 || length > limits.max_length || offset + 32 + length > size)
            {
                continue;
            }

            const std::uint8_t* first = bytes + offset + 32;
            if(crypto::hashMatches(first, length, target_hash))
            {
                spdlog::debug("Ancillary data found by scan at offset {} ({} bytes)", offset, length);
                return std::vector<std::uint8_t>(first, first + length);
            }
        }

        return std::nullopt;
    }
}
