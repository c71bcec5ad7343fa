#include "resolver.hpp"

#include <format>
#include <limits>

#include <spdlog/spdlog.h>

#include "event_layout.hpp"
#include "utils.hpp"

namespace avr::chain
{
    std::optional<std::vector<std::uint8_t>> findAncillaryBytes(const std::vector<std::uint8_t> & log_data,
                                                                const std::string & target_hash,
                                                                const abi::ScanLimits & limits)
    {
        if(auto bytes_res = abi::tryKnownLayouts(log_data, target_hash))
        {
            return bytes_res;
        }
        return abi::bruteForceFind(log_data, target_hash, limits);
    }

    CrossChainResolver::CrossChainResolver(ChainTable chains, RpcCall rpc_call, ResolverOptions options)
        : _fetcher(std::move(chains), std::move(rpc_call)),
          _options(std::move(options))
    {
    }

    const ChainTable & CrossChainResolver::chains() const noexcept
    {
        return _fetcher.chains();
    }

    const ResolverOptions & CrossChainResolver::options() const noexcept
    {
        return _options;
    }

    std::pair<std::uint64_t, std::uint64_t> CrossChainResolver::blockWindow(std::uint64_t block_number) const noexcept
    {
        const std::uint64_t from_block = (block_number > _options.lookback_blocks)
            ? (block_number - _options.lookback_blocks)
            : 0;

        std::uint64_t to_block = std::numeric_limits<std::uint64_t>::max();
        if(block_number <= std::numeric_limits<std::uint64_t>::max() - _options.lookahead_blocks)
        {
            to_block = block_number + _options.lookahead_blocks;
        }

        return {from_block, to_block};
    }

    std::optional<std::string> CrossChainResolver::resolve(const AncillaryReference & reference) const
    {
        const auto chain_it = chains().find(reference.child_chain_id);
        if(chain_it == chains().end())
        {
            spdlog::debug("No endpoints configured for chain {}", reference.child_chain_id);
            return std::nullopt;
        }

        const ChainEndpointConfig & chain_cfg = chain_it->second;
        const auto [from_block, to_block] = blockWindow(reference.child_block_number);

        spdlog::debug("Resolving ancillary data {} on {} in blocks [{}, {}]",
            reference.ancillary_data_hash, chain_cfg.name, from_block, to_block);

        std::optional<std::string> resolved;

        // the oracle tunnel is the usual emitter
        const bool stopped = _fetcher.visitLogs(reference.child_chain_id,
            {reference.child_oracle, reference.child_requester}, from_block, to_block,
            [&](const chain::Address &, const std::vector<LogEntry> & logs)
            {
                for(const LogEntry & log : logs)
                {
                    if(log.data.empty())
                    {
                        continue;
                    }

                    auto bytes_res = findAncillaryBytes(log.data, reference.ancillary_data_hash, _options.scan_limits);
                    if(!bytes_res)
                    {
                        continue;
                    }

                    if(!utils::isValidUtf8(*bytes_res))
                    {
                        spdlog::warn("Ancillary data {} matched in block {} but is not valid UTF-8",
                            reference.ancillary_data_hash, log.block_number);
                        return true;
                    }

                    spdlog::info("Resolved ancillary data {} from {} block {}",
                        reference.ancillary_data_hash, chain_cfg.name, log.block_number);
                    resolved = std::string(bytes_res->begin(), bytes_res->end());
                    return true;
                }
                return false;
            });

        if(stopped)
        {
            return resolved;
        }

        spdlog::debug("Ancillary data {} not found on {}", reference.ancillary_data_hash, chain_cfg.name);
        return std::nullopt;
    }
}
