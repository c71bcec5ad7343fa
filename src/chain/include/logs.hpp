#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "address.hpp"
#include "chain_config.hpp"

namespace avr::chain
{
    using RpcCall = std::function<std::optional<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    struct LogEntry
    {
        chain::Address address{};
        std::vector<std::uint8_t> data;
        std::uint64_t block_number = 0;
    };

    // return true to stop fetching
    using LogVisitor = std::function<bool(const chain::Address & emitter, const std::vector<LogEntry> & logs)>;

    struct FetchError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            RPC_ERROR,
            RPC_MALFORMED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * @brief Posts a JSON-RPC request with the curl executable.
     *
     * @return The parsed response, or std::nullopt on transport failure.
     */
    std::optional<nlohmann::json> rpcCallWithCurl(const std::string & rpc_url, const nlohmann::json & request);

    /**
     * @brief Reads event logs of a contract from the configured child chains.
     */
    class LogFetcher
    {
    public:
        explicit LogFetcher(ChainTable chains, RpcCall rpc_call = {});

        const ChainTable & chains() const noexcept;

        /**
         * @brief Issues eth_getLogs for `address` in [from_block, to_block] against a single endpoint.
         *
         * Entries with malformed fields are skipped; a failed call or a malformed
         * result is reported as FetchError.
         */
        std::expected<std::vector<LogEntry>, FetchError> fetchLogs(
            const std::string & rpc_url,
            const chain::Address & address,
            std::uint64_t from_block,
            std::uint64_t to_block) const;

        /**
         * @brief Fetches the logs of several emitters from the endpoints of `chain_id`.
         *
         * Endpoints are tried in order and, within an endpoint, emitters in order.
         * A failed fetch moves on to the next emitter or endpoint. An emitter whose
         * logs were already delivered is not queried again on later endpoints.
         *
         * @return true if `visitor` stopped the search.
         */
        bool visitLogs(
            std::uint64_t chain_id,
            const std::vector<chain::Address> & emitters,
            std::uint64_t from_block,
            std::uint64_t to_block,
            const LogVisitor & visitor) const;

        /**
         * @brief Same as fetchLogs but iterates the endpoints of `chain_id` in order.
         *
         * The first endpoint answering without error is used. An unknown chain
         * or exhaustion of all endpoints yields no logs.
         */
        std::vector<LogEntry> getLogs(
            std::uint64_t chain_id,
            const chain::Address & address,
            std::uint64_t from_block,
            std::uint64_t to_block) const;

    private:
        ChainTable _chains;
        RpcCall _rpc_call;
    };
}

template <>
struct std::formatter<avr::chain::FetchError::Kind> : std::formatter<std::string>
{
    auto format(const avr::chain::FetchError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case avr::chain::FetchError::Kind::RPC_ERROR:
                return formatter<string>::format("RPC error", ctx);
            case avr::chain::FetchError::Kind::RPC_MALFORMED:
                return formatter<string>::format("Malformed RPC response", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
