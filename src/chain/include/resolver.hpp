#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "address.hpp"
#include "chain_config.hpp"
#include "logs.hpp"
#include "scanner.hpp"

namespace avr::chain
{
    /**
     * @brief Pointer to ancillary data that lives on a child chain.
     */
    struct AncillaryReference
    {
        // keccak256 of the original ancillary data, hex
        std::string ancillary_data_hash;

        std::uint64_t child_chain_id = 0;
        chain::Address child_oracle{};
        chain::Address child_requester{};
        std::uint64_t child_block_number = 0;
    };

    struct ResolverOptions
    {
        std::uint64_t lookback_blocks = 100;
        std::uint64_t lookahead_blocks = 10;
        abi::ScanLimits scan_limits{};
    };

    /**
     * @brief Finds the ancillary bytes inside a single log body.
     *
     * Known event layouts are tried first, the brute force scan last.
     */
    std::optional<std::vector<std::uint8_t>> findAncillaryBytes(const std::vector<std::uint8_t> & log_data,
                                                                const std::string & target_hash,
                                                                const abi::ScanLimits & limits = abi::ScanLimits{});

    class CrossChainResolver
    {
    public:
        explicit CrossChainResolver(ChainTable chains, RpcCall rpc_call = {}, ResolverOptions options = {});

        /**
         * @brief Recovers the original ancillary text behind `reference`.
         *
         * Endpoints of the child chain are tried in order, and within an endpoint the
         * child oracle before the child requester. The first log whose bytes hash to
         * the reference hash wins.
         *
         * @return std::nullopt for an unknown chain, on exhaustion, or when the
         *         recovered bytes are not valid UTF-8.
         */
        std::optional<std::string> resolve(const AncillaryReference & reference) const;

        // [max(0, block - lookback), block + lookahead]
        std::pair<std::uint64_t, std::uint64_t> blockWindow(std::uint64_t block_number) const noexcept;

        const ChainTable & chains() const noexcept;

        const ResolverOptions & options() const noexcept;

    private:
        LogFetcher _fetcher;
        ResolverOptions _options;
    };
}
