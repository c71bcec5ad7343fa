#include "commit.hpp"

#include <iterator>
#include <random>

#include <intx/intx.hpp>

#include "crypto.hpp"

namespace avr::vote
{
    evmc::bytes32 int256FromInt64(std::int64_t value) noexcept
    {
        const auto bits = static_cast<std::uint64_t>(value);
        const intx::uint256 word = value < 0 ? -intx::uint256{~bits + 1} : intx::uint256{bits};
        return intx::be::store<evmc::bytes32>(word);
    }

    evmc::uint256be uint256FromUint64(std::uint64_t value) noexcept
    {
        return intx::be::store<evmc::uint256be>(intx::uint256{value});
    }

    evmc::bytes32 generateSalt()
    {
        std::random_device random_device;
        std::uniform_int_distribution<unsigned> byte_distribution(0, 0xFF);

        evmc::bytes32 salt{};
        for(auto & byte : salt.bytes)
        {
            byte = static_cast<std::uint8_t>(byte_distribution(random_device));
        }

        // subtracting 2^255 from a uint256 flips its top bit in two's complement
        salt.bytes[0] ^= 0x80U;
        return salt;
    }

    evmc::bytes32 computeCommitHash(
        const evmc::bytes32 & price,
        const evmc::bytes32 & salt,
        const chain::Address & voter,
        const evmc::uint256be & time,
        const std::vector<std::uint8_t> & ancillary_data,
        const evmc::uint256be & round_id,
        const evmc::bytes32 & identifier)
    {
        std::vector<std::uint8_t> packed;
        packed.reserve(32 * 5 + 20 + ancillary_data.size());

        const auto append = [&packed](const auto & value)
        {
            packed.insert(packed.end(), std::begin(value.bytes), std::end(value.bytes));
        };

        append(price);
        append(salt);
        append(voter);
        append(time);
        packed.insert(packed.end(), ancillary_data.begin(), ancillary_data.end());
        append(round_id);
        append(identifier);

        return crypto::keccak256(packed);
    }
}
