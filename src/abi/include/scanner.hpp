#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace avr::abi
{
    /**
     * @brief Sanity ceilings applied while scanning for an ABI `bytes` tail.
     *
     * Ancillary data seen in practice is well below both limits.
     */
    struct ScanLimits
    {
        std::size_t max_offset = 8192;
        std::size_t max_length = 4096;
    };

    /**
     * @brief Layout-agnostic search for a dynamic bytes field hashing to `target_hash`.
     *
     * Every 32-byte aligned word is read as a candidate offset (its low 4 bytes, big-endian).
     * The word at that offset is read as a length and the following `length` bytes are
     * checked against the target. The first verified slice is returned.
     */
    std::optional<std::vector<std::uint8_t>> bruteForceFind(const std::vector<std::uint8_t> & data,
                                                            const std::string & target_hash,
                                                            const ScanLimits & limits = ScanLimits{});
}
