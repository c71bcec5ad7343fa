#include "crypto.hpp"

#include <cstring>

#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>

#include "utils.hpp"

namespace avr::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t data_size)
    {
        static constexpr std::uint8_t EMPTY[1] = {0};

        const ethash::hash256 hash = ethash::keccak256(data != nullptr ? data : EMPTY, data != nullptr ? data_size : 0);

        evmc::bytes32 digest{};
        std::memcpy(digest.bytes, hash.bytes, sizeof(digest.bytes));
        return digest;
    }

    evmc::bytes32 keccak256(const std::vector<std::uint8_t> & bytes)
    {
        return keccak256(bytes.data(), bytes.size());
    }

    bool hashMatches(const std::uint8_t* data, std::size_t data_size, const std::string & target_hash_hex)
    {
        const std::string target = utils::stripHexPrefix(target_hash_hex);
        if(target.size() != sizeof(evmc::bytes32::bytes) * 2)
        {
            return false;
        }

        const evmc::bytes32 digest = keccak256(data, data_size);
        const std::string digest_hex = evmc::hex(evmc::bytes_view{digest.bytes, sizeof(digest.bytes)});
        return utils::equalsIgnoreCase(digest_hex, target);
    }

    bool hashMatches(const std::vector<std::uint8_t> & bytes, const std::string & target_hash_hex)
    {
        return hashMatches(bytes.data(), bytes.size(), target_hash_hex);
    }
}
