#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "resolver.hpp"

namespace avr::vote
{
    /**
     * @brief Pending vote as returned by the voting contract.
     */
    struct RawPendingVote
    {
        std::uint64_t last_voting_round = 0;
        bool is_governance = false;

        // unix seconds
        std::uint64_t time = 0;

        std::uint32_t roll_count = 0;

        // 0x-prefixed bytes32
        std::string identifier;

        // 0x-prefixed bytes
        std::string ancillary_data;
    };

    struct VoteOption
    {
        std::string label;
        std::string display_value;
        evmc::uint256be numeric_value{};
    };

    struct ParsedVote
    {
        std::size_t index = 0;

        std::string identifier;
        std::string raw_identifier;

        std::chrono::sys_seconds time{};

        bool is_governance = false;
        std::uint32_t roll_count = 0;
        std::uint64_t round_id = 0;

        std::string description;
        std::string ancillary_raw;
        std::string raw_ancillary_data;

        std::vector<VoteOption> options;
    };

    /**
     * @brief Decodes a right padded bytes32 identifier, e.g. YES_OR_NO_QUERY.
     *
     * NUL bytes are removed and the result trimmed.
     * Malformed hex or more than 32 bytes returns the input unchanged.
     */
    std::string decodeIdentifier(const std::string & hex);

    /**
     * @brief Decodes ancillary data bytes to text.
     *
     * Empty input and a bare "0x" decode to an empty string.
     * Malformed hex returns the input unchanged.
     */
    std::string decodeAncillaryData(const std::string & hex);

    /**
     * @brief Scales a non negative decimal such as "0.5" by 10^18.
     *
     * Digits past the 18th fractional one are rounded half up.
     *
     * @return std::nullopt for malformed input or when the result does not fit 256 bits.
     */
    std::optional<evmc::uint256be> scaleBy1e18(std::string_view decimal);

    /**
     * @brief Lists the answers a voter can commit for a request.
     *
     * Governance votes get Approve/Reject. YES_OR_NO and MULTIPLE_CHOICE identifiers
     * get their own options, everything else the generic price options.
     */
    std::vector<VoteOption> getVoteOptions(const std::string & identifier, bool is_governance, const std::string & ancillary_text);

    /**
     * @brief Turns a raw pending vote into its display form.
     *
     * `resolver` must outlive the returned awaitable.
     */
    asio::awaitable<ParsedVote> parseVote(RawPendingVote raw, std::size_t index, const chain::CrossChainResolver & resolver);
}
