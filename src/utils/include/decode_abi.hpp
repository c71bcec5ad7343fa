#pragma once

#include <vector>
#include <optional>
#include <cstdint>

namespace avr::utils
{
    /**
     * @brief Decodes an ABI `bytes` tail region.
     *
     * The region starts at `bytes_offset` with a 32-byte length word followed by the raw bytes.
     * Padding after the payload is not required to be present.
     */
    std::optional<std::vector<std::uint8_t>> decodeAbiBytes(const std::uint8_t* data, std::size_t data_size, std::size_t bytes_offset);

    // true if the word at `offset` is a left-padded 20-byte address
    bool isAbiAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset);
}
