#pragma once

#include <cstdint>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "address.hpp"

namespace avr::vote
{
    // big-endian two's complement
    evmc::bytes32 int256FromInt64(std::int64_t value) noexcept;

    evmc::uint256be uint256FromUint64(std::uint64_t value) noexcept;

    /**
     * @brief Random signed 256-bit salt.
     *
     * Equivalent to a uniformly random uint256 minus 2^255.
     */
    evmc::bytes32 generateSalt();

    /**
     * @brief Hash committed to the voting contract.
     *
     * keccak256 of the packed encoding
     * int256 price | int256 salt | address voter | uint256 time | bytes ancillary_data | uint256 round_id | bytes32 identifier.
     * Only `ancillary_data` is variable length.
     */
    evmc::bytes32 computeCommitHash(
        const evmc::bytes32 & price,
        const evmc::bytes32 & salt,
        const chain::Address & voter,
        const evmc::uint256be & time,
        const std::vector<std::uint8_t> & ancillary_data,
        const evmc::uint256be & round_id,
        const evmc::bytes32 & identifier);
}
