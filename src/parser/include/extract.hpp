#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "kv_parser.hpp"
#include "parse_error.hpp"
#include "resolver.hpp"

namespace avr::parse
{
    inline constexpr std::string_view NO_DESCRIPTION = "(No description provided)";

    /**
     * @brief Question formats recognized in ancillary text, in priority order.
     *
     * Later patterns are broader; the first one that matches wins.
     */
    const std::vector<std::string_view> & descriptionPatternNames();

    /**
     * @brief Extracts the question from already decoded ancillary text.
     *
     * Never touches the network. Unrecognized text is returned trimmed.
     */
    std::string extractTextDescription(const std::string & text);

    /**
     * @brief Builds a cross-chain reference from parsed ancillary key/values.
     *
     * Requires ancillaryDataHash, childChainId, childOracle, childRequester and childBlockNumber.
     * Addresses are accepted with or without the 0x prefix.
     */
    Result<chain::AncillaryReference> parseAncillaryReference(const ParsedKV & kv);

    /**
     * @brief Extracts the question, resolving cross-chain references through `resolver`.
     *
     * Always produces a string. A reference that cannot be resolved yields
     * "[Cross-chain from <chain> — resolution failed] Hash: <first 16 chars>...".
     */
    asio::awaitable<std::string> extractDescription(std::string ancillary_text, const chain::CrossChainResolver & resolver);
}
