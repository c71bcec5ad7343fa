#pragma once

#include <vector>
#include <string>
#include <cstddef>
#include <cstdint>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace avr::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t data_size);

    evmc::bytes32 keccak256(const std::vector<std::uint8_t> & bytes);

    /**
     * @brief Checks that the Keccak-256 digest of the given bytes equals `target_hash_hex`.
     *
     * The comparison is done on the hex representation and ignores letter case
     * and an optional 0x prefix on the target. Any malformed target simply does not match.
     */
    bool hashMatches(const std::uint8_t* data, std::size_t data_size, const std::string & target_hash_hex);

    bool hashMatches(const std::vector<std::uint8_t> & bytes, const std::string & target_hash_hex);
}
