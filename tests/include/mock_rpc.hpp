#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "abi_encode.hpp"

namespace avr::tests
{
    /**
     * @brief In-memory JSON-RPC node answering eth_getLogs per contract address.
     */
    struct MockRpcNode
    {
        using json = nlohmann::json;

        // lowercase 0x address -> log array
        std::map<std::string, json> logs_by_address;

        // no response at all, like a dead endpoint
        std::set<std::string> unreachable_urls;

        // JSON-RPC error object
        std::set<std::string> erroring_urls;

        struct Call
        {
            std::string rpc_url;
            std::string address;
            std::string from_block;
            std::string to_block;
        };
        std::vector<Call> calls;

        void addLog(const chain::Address & emitter, const std::vector<std::uint8_t> & data, std::uint64_t block_number)
        {
            logs_by_address[hexPrefixed(emitter)].push_back(json{
                {"address", hexPrefixed(emitter)},
                {"blockNumber", utils::toHexQuantity(block_number)},
                {"data", hexPrefixed(data)},
                {"topics", json::array()}
            });
        }

        std::optional<json> call(const std::string & rpc_url, const json & request)
        {
            if(request.value("method", "") != "eth_getLogs")
            {
                return std::nullopt;
            }

            const json & filter = request["params"][0];
            calls.push_back(Call{
                .rpc_url = rpc_url,
                .address = filter.value("address", ""),
                .from_block = filter.value("fromBlock", ""),
                .to_block = filter.value("toBlock", "")
            });

            if(unreachable_urls.contains(rpc_url))
            {
                return std::nullopt;
            }

            if(erroring_urls.contains(rpc_url))
            {
                return json{
                    {"jsonrpc", "2.0"},
                    {"id", 1},
                    {"error", {{"code", -32000}, {"message", "rate limited"}}}
                };
            }

            const auto it = logs_by_address.find(calls.back().address);
            return json{
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"result", it == logs_by_address.end() ? json::array() : it->second}
            };
        }

        chain::RpcCall rpcCall()
        {
            return [this](const std::string & rpc_url, const json & request)
            {
                return call(rpc_url, request);
            };
        }
    };
}
