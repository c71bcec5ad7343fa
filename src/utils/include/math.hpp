#pragma once

#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace avr::utils
{
    // fails when the value does not fit std::size_t
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    /**
     * @brief Reads the last 4 bytes of the 32-byte word at `offset` as a big-endian value.
     *
     * The upper 28 bytes of the word are ignored, so dirty padding still yields a value.
     *
     * @return std::nullopt if the word does not fit in the buffer.
     */
    std::optional<std::uint32_t> readUint32Padded(const std::uint8_t* data, std::size_t data_size, std::size_t offset);
}
