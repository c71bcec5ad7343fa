#include "chain_config.hpp"

#include <format>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace avr::chain
{
    using json = nlohmann::json;

    const ChainTable & defaultChainTable()
    {
        static const ChainTable table{
            {137, ChainEndpointConfig{
                .chain_id = 137,
                .name = "Polygon",
                .rpc_urls = {"https://polygon.drpc.org", "https://1rpc.io/matic"}
            }},
            {10, ChainEndpointConfig{
                .chain_id = 10,
                .name = "OP Mainnet",
                .rpc_urls = {"https://mainnet.optimism.io", "https://optimism.drpc.org"}
            }},
            {42161, ChainEndpointConfig{
                .chain_id = 42161,
                .name = "Arbitrum One",
                .rpc_urls = {"https://arb1.arbitrum.io/rpc", "https://arbitrum.drpc.org"}
            }},
            {8453, ChainEndpointConfig{
                .chain_id = 8453,
                .name = "Base",
                .rpc_urls = {"https://mainnet.base.org", "https://base.drpc.org"}
            }}
        };
        return table;
    }

    std::optional<std::string> knownChainName(std::uint64_t chain_id)
    {
        switch(chain_id)
        {
            case 1:     return "Ethereum";
            case 10:    return "OP Mainnet";
            case 137:   return "Polygon";
            case 8453:  return "Base";
            case 42161: return "Arbitrum One";
            default:    return std::nullopt;
        }
    }

    parse::Result<ChainTable> parseChainTable(const json & root)
    {
        if(!root.is_object() || !root.contains("chains") || !root["chains"].is_array())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::MISSING_FIELD, "expected object with 'chains' array"});
        }

        ChainTable table;
        for(const json & entry : root["chains"])
        {
            if(!entry.is_object())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, "chain entry is not an object"});
            }

            if(!entry.contains("chain_id") || !entry["chain_id"].is_number_unsigned())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::MISSING_FIELD, "chain entry without unsigned 'chain_id'"});
            }
            const std::uint64_t chain_id = entry["chain_id"].get<std::uint64_t>();

            if(!entry.contains("rpc_urls") || !entry["rpc_urls"].is_array())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::MISSING_FIELD,
                    std::format("chain {} without 'rpc_urls' array", chain_id)});
            }

            ChainEndpointConfig cfg;
            cfg.chain_id = chain_id;

            for(const json & url : entry["rpc_urls"])
            {
                if(!url.is_string() || url.get<std::string>().empty())
                {
                    return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE,
                        std::format("chain {} has an invalid rpc url", chain_id)});
                }
                cfg.rpc_urls.push_back(url.get<std::string>());
            }

            if(entry.contains("name"))
            {
                if(!entry["name"].is_string())
                {
                    return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH,
                        std::format("chain {} has a non-string name", chain_id)});
                }
                cfg.name = entry["name"].get<std::string>();
            }
            else
            {
                cfg.name = knownChainName(chain_id).value_or(std::format("Chain {}", chain_id));
            }

            table.insert_or_assign(chain_id, std::move(cfg));
        }

        return table;
    }

    parse::Result<ChainTable> loadChainTable(const std::filesystem::path & path)
    {
        std::ifstream input(path);
        if(!input.is_open())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::IO_ERROR,
                std::format("cannot open chain config '{}'", path.string())});
        }

        const json root = json::parse(input, nullptr, false);
        if(root.is_discarded())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE,
                std::format("chain config '{}' is not valid JSON", path.string())});
        }

        auto table_res = parseChainTable(root);
        if(table_res)
        {
            spdlog::debug("Loaded {} chain endpoint configs from {}", table_res->size(), path.string());
        }
        return table_res;
    }

    ChainTable mergeChainTables(ChainTable base, const ChainTable & overrides)
    {
        for(const auto & [chain_id, cfg] : overrides)
        {
            base.insert_or_assign(chain_id, cfg);
        }
        return base;
    }
}
