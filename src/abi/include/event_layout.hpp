#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace avr::abi
{
    enum class AbiType : std::uint8_t
    {
        BYTES32 = 0,
        UINT256,
        INT256,
        ADDRESS,
        BYTES
    };

    /**
     * @brief Non-indexed data shape of an event carrying ancillary data.
     *
     * Every field occupies one head word. The first `BYTES` field is the one extracted.
     */
    struct EventLayout
    {
        std::string_view name;
        std::vector<AbiType> fields;
    };

    /**
     * @brief Known layouts in the order they are tried.
     *
     * 1. PriceRequestAdded (bytes32 identifier, uint256 time, bytes ancillaryData)
     * 2. (uint256 time, bytes ancillaryData)
     * 3. RequestPrice (bytes32 identifier, uint256 time, bytes ancillaryData, address requester, uint256 reward, uint256 bond)
     * 4. DisputePrice (bytes32 identifier, uint256 time, bytes ancillaryData, int256 proposedPrice)
     */
    const std::vector<EventLayout> & knownLayouts();

    // e.g. "(bytes32,uint256,bytes)"
    std::string layoutSignature(const EventLayout & layout);

    /**
     * @brief Extracts the dynamic bytes field of `layout` from raw event data.
     *
     * @return std::nullopt when the data does not decode cleanly under the layout
     *         (head too short, offset or length out of range, malformed address word).
     */
    std::optional<std::vector<std::uint8_t>> decodeLayoutBytes(const EventLayout & layout, const std::uint8_t* data, std::size_t data_size);

    std::optional<std::vector<std::uint8_t>> decodeLayoutBytes(const EventLayout & layout, const std::vector<std::uint8_t> & data);

    /**
     * @brief Tries every known layout in order and returns the first bytes field
     *        whose Keccak-256 equals `target_hash`.
     */
    std::optional<std::vector<std::uint8_t>> tryKnownLayouts(const std::vector<std::uint8_t> & data, const std::string & target_hash);
}

template <>
struct std::formatter<avr::abi::AbiType> : std::formatter<std::string>
{
    auto format(const avr::abi::AbiType & type, format_context & ctx) const
    {
        switch(type)
        {
            case avr::abi::AbiType::BYTES32:
                return formatter<string>::format("bytes32", ctx);
            case avr::abi::AbiType::UINT256:
                return formatter<string>::format("uint256", ctx);
            case avr::abi::AbiType::INT256:
                return formatter<string>::format("int256", ctx);
            case avr::abi::AbiType::ADDRESS:
                return formatter<string>::format("address", ctx);
            case avr::abi::AbiType::BYTES:
                return formatter<string>::format("bytes", ctx);
            default:
                return formatter<string>::format("unknown", ctx);
        }
    }
};
