#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <nlohmann/json_fwd.hpp>

#include "parse_error.hpp"

namespace avr::chain
{
    struct ChainEndpointConfig
    {
        std::uint64_t chain_id = 0;
        std::string name;

        // tried in order
        std::vector<std::string> rpc_urls;
    };

    using ChainTable = absl::flat_hash_map<std::uint64_t, ChainEndpointConfig>;

    /**
     * @brief Built-in child chains with their public RPC endpoints.
     *
     * Polygon (137), OP Mainnet (10), Arbitrum One (42161) and Base (8453).
     */
    const ChainTable & defaultChainTable();

    /**
     * @brief Display name of a well-known chain id, including Ethereum mainnet.
     */
    std::optional<std::string> knownChainName(std::uint64_t chain_id);

    /**
     * @brief Builds a chain table from JSON.
     *
     * Expected shape:
     * @code
     * {"chains": [{"chain_id": 137, "name": "Polygon", "rpc_urls": ["https://..."]}]}
     * @endcode
     * `name` is optional and defaults to the known chain name, or "Chain <id>".
     */
    parse::Result<ChainTable> parseChainTable(const nlohmann::json & json);

    parse::Result<ChainTable> loadChainTable(const std::filesystem::path & path);

    // entries of `overrides` replace entries of `base` with the same chain id
    ChainTable mergeChainTables(ChainTable base, const ChainTable & overrides);
}
