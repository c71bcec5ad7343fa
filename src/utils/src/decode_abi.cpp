#include "decode_abi.hpp"

#include "math.hpp"

namespace avr::utils
{
    std::optional<std::vector<std::uint8_t>> decodeAbiBytes(const std::uint8_t* data, std::size_t data_size, std::size_t bytes_offset)
    {
        const auto length_res = utils::readWordAsSizeT(data, data_size, bytes_offset);
        if(!length_res)
        {
            return std::nullopt;
        }

        const std::size_t length = *length_res;
        if(bytes_offset + 32 > data_size || length > (data_size - (bytes_offset + 32)))
        {
            return std::nullopt;
        }

        const std::uint8_t* first = data + bytes_offset + 32;
        return std::vector<std::uint8_t>(first, first + length);
    }

    bool isAbiAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return false;
        }

        for(std::size_t i = 0; i < 12; ++i)
        {
            if(data[offset + i] != 0)
            {
                return false;
            }
        }
        return true;
    }
}
