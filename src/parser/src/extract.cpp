#include "extract.hpp"

#include <format>
#include <regex>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace avr::parse
{
    namespace
    {
        struct DescriptionPattern
        {
            std::string_view name;
            std::regex regex;
        };

        // [\s\S] stands in for a dot that also matches newlines
        const std::vector<DescriptionPattern> & _descriptionPatterns()
        {
            static const std::vector<DescriptionPattern> patterns = []()
            {
                constexpr auto plain = std::regex::ECMAScript;
                constexpr auto icase = std::regex::ECMAScript | std::regex::icase;

                std::vector<DescriptionPattern> out;
                out.push_back({"q_double_quoted", std::regex(R"re(q:"([^"]+)")re", plain)});
                out.push_back({"q_single_quoted", std::regex(R"re(q:'([^']+)')re", plain)});
                out.push_back({"description_quoted", std::regex(R"re(description:"([^"]+)")re", icase)});
                out.push_back({"title_quoted", std::regex(R"re(title:"([^"]+)")re", icase)});
                out.push_back({"q_title_unquoted", std::regex(
                    R"re(q:\s*title:\s*([\s\S]+?)(?:,\s*description:|,\s*res_data:|,\s*initializer:|$))re", icase)});
                out.push_back({"q_unquoted", std::regex(
                    R"re(^q:\s*([\s\S]+?)(?:,\s*(?:description|p1|p2|p3|initializer|ooRequester|res_data):|$))re", icase)});
                return out;
            }();
            return patterns;
        }

        std::string _chainNameFor(const std::string & chain_id_text, const chain::CrossChainResolver & resolver)
        {
            const auto chain_id = utils::parseDecimal(chain_id_text);
            if(chain_id)
            {
                const auto chain_it = resolver.chains().find(*chain_id);
                if(chain_it != resolver.chains().end() && !chain_it->second.name.empty())
                {
                    return chain_it->second.name;
                }

                if(auto known = chain::knownChainName(*chain_id))
                {
                    return *known;
                }
            }
            return std::format("Chain {}", chain_id_text);
        }

        std::string _resolutionFailedMessage(const std::string & chain_name, const std::string & hash)
        {
            return std::format("[Cross-chain from {} — resolution failed] Hash: {}...", chain_name, hash.substr(0, 16));
        }
    }

    const std::vector<std::string_view> & descriptionPatternNames()
    {
        static const std::vector<std::string_view> names = []()
        {
            std::vector<std::string_view> out;
            for(const DescriptionPattern & pattern : _descriptionPatterns())
            {
                out.push_back(pattern.name);
            }
            return out;
        }();
        return names;
    }

    std::string extractTextDescription(const std::string & text)
    {
        if(text.empty())
        {
            return std::string(NO_DESCRIPTION);
        }

        for(const DescriptionPattern & pattern : _descriptionPatterns())
        {
            std::smatch match;
            try
            {
                if(std::regex_search(text, match, pattern.regex) && match[1].matched)
                {
                    return utils::trim(match[1].str());
                }
            }
            catch(const std::regex_error & e)
            {
                // the matcher gives up on pathological input, try the next format
                spdlog::warn("Pattern {} failed on {} bytes of ancillary text: {}", pattern.name, text.size(), e.what());
            }
        }

        return utils::trim(text);
    }

    Result<chain::AncillaryReference> parseAncillaryReference(const ParsedKV & kv)
    {
        static constexpr std::string_view REQUIRED_KEYS[] = {
            "ancillaryDataHash", "childChainId", "childOracle", "childRequester", "childBlockNumber"
        };

        for(const std::string_view key : REQUIRED_KEYS)
        {
            if(!kv.contains(key))
            {
                return std::unexpected(Error{Error::Kind::MISSING_FIELD, std::format("missing '{}'", key)});
            }
        }

        chain::AncillaryReference reference;
        reference.ancillary_data_hash = kv.at("ancillaryDataHash");

        const auto chain_id = utils::parseDecimal(kv.at("childChainId"));
        if(!chain_id)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid childChainId '{}'", kv.at("childChainId"))});
        }
        reference.child_chain_id = *chain_id;

        const auto block_number = utils::parseDecimal(kv.at("childBlockNumber"));
        if(!block_number)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid childBlockNumber '{}'", kv.at("childBlockNumber"))});
        }
        reference.child_block_number = *block_number;

        const auto oracle = chain::parseAddress(kv.at("childOracle"));
        if(!oracle)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid childOracle '{}'", kv.at("childOracle"))});
        }
        reference.child_oracle = *oracle;

        const auto requester = chain::parseAddress(kv.at("childRequester"));
        if(!requester)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid childRequester '{}'", kv.at("childRequester"))});
        }
        reference.child_requester = *requester;

        return reference;
    }

    asio::awaitable<std::string> extractDescription(std::string ancillary_text, const chain::CrossChainResolver & resolver)
    {
        if(ancillary_text.empty())
        {
            co_return std::string(NO_DESCRIPTION);
        }

        // fast path, no network
        const std::string trimmed = utils::trim(ancillary_text);
        std::string sync_result = extractTextDescription(ancillary_text);
        if(sync_result != trimmed)
        {
            co_return sync_result;
        }

        ParsedKV kv;
        try
        {
            kv = parseAncillaryKV(ancillary_text);
        }
        catch(const std::regex_error & e)
        {
            spdlog::warn("Failed to tokenize {} bytes of ancillary text: {}", ancillary_text.size(), e.what());
            co_return trimmed;
        }

        const auto hash_it = kv.find("ancillaryDataHash");
        const auto chain_it = kv.find("childChainId");
        if(hash_it == kv.end() || chain_it == kv.end())
        {
            co_return trimmed;
        }

        const std::string chain_name = _chainNameFor(chain_it->second, resolver);

        if(kv.contains("childOracle") && kv.contains("childBlockNumber") && kv.contains("childRequester"))
        {
            const auto reference_res = parseAncillaryReference(kv);
            if(!reference_res)
            {
                spdlog::warn("Invalid cross-chain reference: {} ({})",
                    reference_res.error().message, std::format("{}", reference_res.error().kind));
            }
            else
            {
                try
                {
                    const auto resolved = resolver.resolve(*reference_res);
                    if(resolved)
                    {
                        co_return extractTextDescription(*resolved);
                    }
                }
                catch(const std::exception & e)
                {
                    spdlog::error("Cross-chain resolution from {} failed: {}", chain_name, e.what());
                }
            }
        }

        co_return _resolutionFailedMessage(chain_name, hash_it->second);
    }
}
