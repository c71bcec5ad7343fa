#include "vote.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <limits>
#include <regex>

#include <intx/intx.hpp>

#include <spdlog/spdlog.h>

#include "commit.hpp"
#include "extract.hpp"
#include "utils.hpp"

namespace avr::vote
{
    namespace
    {
        constexpr std::uint64_t ONE_ETHER = 1'000'000'000'000'000'000ULL;
        constexpr std::uint64_t HALF_ETHER = 500'000'000'000'000'000ULL;
        constexpr std::size_t WEI_DECIMALS = 18;

        bool _startsWith(const std::string & value, std::string_view prefix)
        {
            return value.rfind(prefix, 0) == 0;
        }

        // 1.50 -> 1.5, 007 -> 7
        std::string _normalizeDecimal(std::string_view decimal)
        {
            const std::size_t dot = decimal.find('.');
            std::string int_part(decimal.substr(0, dot));
            std::string frac_part = dot == std::string_view::npos ? std::string{} : std::string(decimal.substr(dot + 1));

            const std::size_t first_non_zero = int_part.find_first_not_of('0');
            int_part = first_non_zero == std::string::npos ? "0" : int_part.substr(first_non_zero);

            const std::size_t last_non_zero = frac_part.find_last_not_of('0');
            frac_part = last_non_zero == std::string::npos ? std::string{} : frac_part.substr(0, last_non_zero + 1);

            if(frac_part.empty())
            {
                return int_part;
            }
            return std::format("{}.{}", int_part, frac_part);
        }

        std::vector<VoteOption> _governanceOptions()
        {
            return {
                {"Approve", "1e18 (1000000000000000000)", uint256FromUint64(ONE_ETHER)},
                {"Reject", "0", uint256FromUint64(0)}
            };
        }

        std::vector<VoteOption> _yesOrNoOptions()
        {
            return {
                {"Yes", "1e18 (1000000000000000000)", uint256FromUint64(ONE_ETHER)},
                {"No", "0", uint256FromUint64(0)},
                {"Ambiguous / Too early to tell", "0.5e18 (500000000000000000)", uint256FromUint64(HALF_ETHER)}
            };
        }

        std::vector<VoteOption> _multipleChoiceOptions(const std::string & ancillary_text)
        {
            static const std::regex option_regex(R"re(p(\d+):\s*(\d+(?:\.\d+)?))re");

            std::vector<VoteOption> options;
            for(auto it = std::sregex_iterator(ancillary_text.begin(), ancillary_text.end(), option_regex); it != std::sregex_iterator(); ++it)
            {
                const std::smatch & match = *it;
                const std::string value = match[2].str();

                const auto numeric = scaleBy1e18(value);
                if(!numeric)
                {
                    spdlog::warn("Skipping multiple choice option p{}: value {} out of range", match[1].str(), value);
                    continue;
                }

                options.push_back(VoteOption{
                    .label = std::format("Option p{}", match[1].str()),
                    .display_value = std::format("{}e18", _normalizeDecimal(value)),
                    .numeric_value = *numeric
                });
            }
            return options;
        }

        std::vector<VoteOption> _priceOptions()
        {
            return {
                {"Yes / Valid", "1e18 (1000000000000000000)", uint256FromUint64(ONE_ETHER)},
                {"No / Invalid", "0", uint256FromUint64(0)},
                {"Custom price", "<value in wei, 18 decimals — check UMIP>", uint256FromUint64(0)}
            };
        }
    }

    std::string decodeIdentifier(const std::string & hex)
    {
        const auto bytes = evmc::from_hex(hex);
        if(!bytes || bytes->size() > sizeof(evmc::bytes32::bytes))
        {
            return hex;
        }

        std::string text;
        for(const std::uint8_t byte : *bytes)
        {
            if(byte != 0)
            {
                text.push_back(static_cast<char>(byte));
            }
        }
        return utils::trim(text);
    }

    std::string decodeAncillaryData(const std::string & hex)
    {
        if(hex.empty() || hex == "0x")
        {
            return "";
        }

        const auto bytes = evmc::from_hex(hex);
        if(!bytes)
        {
            return hex;
        }
        return std::string(bytes->begin(), bytes->end());
    }

    std::optional<evmc::uint256be> scaleBy1e18(std::string_view decimal)
    {
        const std::size_t dot = decimal.find('.');
        const std::string_view int_part = decimal.substr(0, dot);
        const std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : decimal.substr(dot + 1);

        const auto all_digits = [](std::string_view part)
        {
            return std::ranges::all_of(part, [](char c) { return c >= '0' && c <= '9'; });
        };

        if(int_part.empty() || !all_digits(int_part) || !all_digits(frac_part)
            || (dot != std::string_view::npos && frac_part.empty()))
        {
            return std::nullopt;
        }

        // 2^256 / 10^18 has 60 decimal digits
        const std::size_t first_significant = int_part.find_first_not_of('0');
        const std::string whole_digits = first_significant == std::string_view::npos
            ? std::string("0")
            : std::string(int_part.substr(first_significant));
        if(whole_digits.size() > 60)
        {
            return std::nullopt;
        }

        std::string frac_digits(frac_part.substr(0, std::min(frac_part.size(), WEI_DECIMALS)));
        frac_digits.append(WEI_DECIMALS - frac_digits.size(), '0');

        const intx::uint256 scale = intx::exp(intx::uint256{10}, intx::uint256{WEI_DECIMALS});
        const auto whole = intx::from_string<intx::uint256>(whole_digits.c_str());
        if(whole > std::numeric_limits<intx::uint256>::max() / scale)
        {
            return std::nullopt;
        }

        const intx::uint256 scaled_whole = whole * scale;
        intx::uint256 value = scaled_whole + intx::from_string<intx::uint256>(frac_digits.c_str());
        if(value < scaled_whole)
        {
            return std::nullopt;
        }

        if(frac_part.size() > WEI_DECIMALS && frac_part[WEI_DECIMALS] >= '5')
        {
            ++value;
            if(value == 0)
            {
                return std::nullopt;
            }
        }

        return intx::be::store<evmc::uint256be>(value);
    }

    std::vector<VoteOption> getVoteOptions(const std::string & identifier, bool is_governance, const std::string & ancillary_text)
    {
        if(is_governance)
        {
            return _governanceOptions();
        }

        std::string id = identifier;
        std::ranges::transform(id, id.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if(_startsWith(id, "YES_OR_NO"))
        {
            return _yesOrNoOptions();
        }

        if(_startsWith(id, "MULTIPLE_CHOICE"))
        {
            auto options = _multipleChoiceOptions(ancillary_text);
            if(!options.empty())
            {
                return options;
            }
        }

        return _priceOptions();
    }

    asio::awaitable<ParsedVote> parseVote(RawPendingVote raw, std::size_t index, const chain::CrossChainResolver & resolver)
    {
        ParsedVote vote;
        vote.index = index;
        vote.identifier = decodeIdentifier(raw.identifier);
        vote.raw_identifier = raw.identifier;
        vote.time = std::chrono::sys_seconds{std::chrono::seconds{static_cast<std::int64_t>(raw.time)}};
        vote.is_governance = raw.is_governance;
        vote.roll_count = raw.roll_count;
        vote.round_id = raw.last_voting_round;
        vote.ancillary_raw = decodeAncillaryData(raw.ancillary_data);
        vote.raw_ancillary_data = raw.ancillary_data;

        vote.description = co_await parse::extractDescription(vote.ancillary_raw, resolver);
        vote.options = getVoteOptions(vote.identifier, vote.is_governance, vote.ancillary_raw);

        spdlog::debug("Parsed vote #{} {} with {} options", vote.index, vote.identifier, vote.options.size());
        co_return vote;
    }
}
