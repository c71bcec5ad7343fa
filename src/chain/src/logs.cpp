#include "logs.hpp"

#include <exception>
#include <format>
#include <utility>

#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "native.h"
#include "utils.hpp"

namespace avr::chain
{
    using json = nlohmann::json;

    namespace
    {
        std::expected<json, FetchError> _rpcResult(const RpcCall & rpc_call, const std::string & rpc_url, const std::string & method, json params)
        {
            json request{
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"method", method},
                {"params", std::move(params)}
            };

            const auto response = rpc_call(rpc_url, request);
            if(!response)
            {
                return std::unexpected(FetchError{FetchError::Kind::RPC_ERROR,
                    std::format("no response from {}", rpc_url)});
            }

            if(!response->is_object())
            {
                return std::unexpected(FetchError{FetchError::Kind::RPC_MALFORMED,
                    std::format("'{}' response is not an object", method)});
            }

            if(response->contains("error"))
            {
                return std::unexpected(FetchError{FetchError::Kind::RPC_ERROR,
                    std::format("'{}' failed: {}", method, (*response)["error"].dump())});
            }

            if(!response->contains("result"))
            {
                return std::unexpected(FetchError{FetchError::Kind::RPC_MALFORMED,
                    std::format("'{}' response is missing result", method)});
            }

            return (*response)["result"];
        }

        std::optional<LogEntry> _parseLogEntry(const json & log)
        {
            if(!log.is_object() || !log.contains("data") || !log["data"].is_string())
            {
                return std::nullopt;
            }

            const auto data_res = evmc::from_hex(log["data"].get<std::string>());
            if(!data_res)
            {
                return std::nullopt;
            }

            LogEntry entry;
            entry.data.assign(data_res->begin(), data_res->end());

            if(log.contains("address") && log["address"].is_string())
            {
                if(const auto address_res = evmc::from_hex<chain::Address>(utils::toLower(log["address"].get<std::string>())))
                {
                    entry.address = *address_res;
                }
            }

            if(log.contains("blockNumber") && log["blockNumber"].is_string())
            {
                entry.block_number = utils::parseHexQuantity(log["blockNumber"].get<std::string>()).value_or(0);
            }

            return entry;
        }
    }

    std::optional<json> rpcCallWithCurl(const std::string & rpc_url, const json & request)
    {
        std::vector<std::string> args{
            "-sS",
            "--max-time", "20",
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--data", request.dump()
        };

        try
        {
            const auto [exit_code, output] = native::runProcess("curl", std::move(args));
            if(exit_code != 0)
            {
                spdlog::warn("Chain RPC call to {} failed (exit={}): {}", rpc_url, exit_code, output);
                return std::nullopt;
            }

            return json::parse(output);
        }
        catch(const std::exception & e)
        {
            spdlog::warn("Chain RPC call to {} failed: {}", rpc_url, e.what());
            return std::nullopt;
        }
    }

    LogFetcher::LogFetcher(ChainTable chains, RpcCall rpc_call)
        : _chains(std::move(chains)),
          _rpc_call(rpc_call ? std::move(rpc_call) : RpcCall{rpcCallWithCurl})
    {
    }

    const ChainTable & LogFetcher::chains() const noexcept
    {
        return _chains;
    }

    std::expected<std::vector<LogEntry>, FetchError> LogFetcher::fetchLogs(
        const std::string & rpc_url,
        const chain::Address & address,
        std::uint64_t from_block,
        std::uint64_t to_block) const
    {
        json filter{
            {"address", chain::addressToHex(address)},
            {"fromBlock", utils::toHexQuantity(from_block)},
            {"toBlock", utils::toHexQuantity(to_block)}
        };

        const auto result = _rpcResult(_rpc_call, rpc_url, "eth_getLogs", json::array({std::move(filter)}));
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(!result->is_array())
        {
            return std::unexpected(FetchError{FetchError::Kind::RPC_MALFORMED, "eth_getLogs result is not an array"});
        }

        std::vector<LogEntry> logs;
        logs.reserve(result->size());
        for(const json & item : *result)
        {
            auto entry = _parseLogEntry(item);
            if(!entry)
            {
                spdlog::debug("Skipping malformed log entry from {}", rpc_url);
                continue;
            }
            logs.push_back(std::move(*entry));
        }

        return logs;
    }

    bool LogFetcher::visitLogs(
        std::uint64_t chain_id,
        const std::vector<chain::Address> & emitters,
        std::uint64_t from_block,
        std::uint64_t to_block,
        const LogVisitor & visitor) const
    {
        const auto chain_it = _chains.find(chain_id);
        if(chain_it == _chains.end())
        {
            spdlog::debug("No endpoints configured for chain {}", chain_id);
            return false;
        }

        std::vector<bool> answered(emitters.size(), false);
        std::size_t answered_count = 0;

        for(const std::string & rpc_url : chain_it->second.rpc_urls)
        {
            for(std::size_t i = 0; i < emitters.size(); ++i)
            {
                // another endpoint would return the same logs
                if(answered[i])
                {
                    continue;
                }

                const auto logs_res = fetchLogs(rpc_url, emitters[i], from_block, to_block);
                if(!logs_res)
                {
                    spdlog::warn("{} fetching logs of {} on {}: {}",
                        std::format("{}", logs_res.error().kind), addressToHex(emitters[i]), rpc_url, logs_res.error().message);
                    continue;
                }

                answered[i] = true;
                ++answered_count;

                if(visitor(emitters[i], *logs_res))
                {
                    return true;
                }
            }

            if(answered_count == emitters.size())
            {
                break;
            }
        }

        return false;
    }

    std::vector<LogEntry> LogFetcher::getLogs(
        std::uint64_t chain_id,
        const chain::Address & address,
        std::uint64_t from_block,
        std::uint64_t to_block) const
    {
        std::vector<LogEntry> logs;
        visitLogs(chain_id, {address}, from_block, to_block,
            [&logs](const chain::Address &, const std::vector<LogEntry> & fetched)
            {
                logs = fetched;
                return true;
            });
        return logs;
    }
}
