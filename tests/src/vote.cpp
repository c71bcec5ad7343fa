#include "unit-tests.hpp"
#include "mock_rpc.hpp"

#include <limits>

using namespace avr;
using namespace avr::vote;
using namespace avr::tests;

namespace
{
    std::string identifierHex(const std::string & name)
    {
        return hexPrefixed(encodeBytes32Word(name));
    }

    std::string ancillaryHex(const std::string & text)
    {
        return hexPrefixed(toBytes(text));
    }

    std::vector<std::string> labelsOf(const std::vector<VoteOption> & options)
    {
        std::vector<std::string> labels;
        for(const VoteOption & option : options)
        {
            labels.push_back(option.label);
        }
        return labels;
    }
}

TEST_F(UnitTest, Vote_DecodeIdentifier)
{
    EXPECT_EQ(decodeIdentifier(identifierHex("YES_OR_NO_QUERY")), "YES_OR_NO_QUERY");
    EXPECT_EQ(decodeIdentifier(identifierHex("  UMIP-175 ")), "UMIP-175");
    EXPECT_EQ(decodeIdentifier("0xzz"), "0xzz");
    EXPECT_EQ(decodeIdentifier("0x" + std::string(66, 'a')), "0x" + std::string(66, 'a'));
}

TEST_F(UnitTest, Vote_DecodeAncillaryData)
{
    EXPECT_EQ(decodeAncillaryData(""), "");
    EXPECT_EQ(decodeAncillaryData("0x"), "");
    EXPECT_EQ(decodeAncillaryData(ancillaryHex("q:\"Was X true?\",p1:0")), "q:\"Was X true?\",p1:0");
    EXPECT_EQ(decodeAncillaryData("0xabc"), "0xabc");
}

TEST_F(UnitTest, Vote_ScaleBy1e18)
{
    EXPECT_EQ(scaleBy1e18("1"), uint256FromUint64(1'000'000'000'000'000'000ULL));
    EXPECT_EQ(scaleBy1e18("0.5"), uint256FromUint64(500'000'000'000'000'000ULL));
    EXPECT_EQ(scaleBy1e18("1.50"), uint256FromUint64(1'500'000'000'000'000'000ULL));
    EXPECT_EQ(scaleBy1e18("0"), uint256FromUint64(0));
    EXPECT_EQ(scaleBy1e18("0.000000000000000001"), uint256FromUint64(1));
    EXPECT_EQ(scaleBy1e18("0.0000000000000000015"), uint256FromUint64(2));
    EXPECT_EQ(scaleBy1e18("0.0000000000000000014"), uint256FromUint64(1));

    EXPECT_FALSE(scaleBy1e18("").has_value());
    EXPECT_FALSE(scaleBy1e18("1.").has_value());
    EXPECT_FALSE(scaleBy1e18(".5").has_value());
    EXPECT_FALSE(scaleBy1e18("-1").has_value());
    EXPECT_FALSE(scaleBy1e18("1" + std::string(78, '0')).has_value());
}

TEST_F(UnitTest, Vote_ScaleBy1e18_Uint256Boundary)
{
    const std::string max_in_ether = "115792089237316195423570985008687907853269984665640564039457.584007913129639935";

    const auto max_value = scaleBy1e18(max_in_ether);
    ASSERT_TRUE(max_value.has_value());
    EXPECT_EQ(evmc::hex(*max_value), std::string(64, 'f'));

    // the 19th fractional digit rounds, and rounding up past the maximum overflows
    EXPECT_EQ(scaleBy1e18(max_in_ether + "4"), max_value);
    EXPECT_FALSE(scaleBy1e18(max_in_ether + "5").has_value());

    EXPECT_FALSE(scaleBy1e18("115792089237316195423570985008687907853269984665640564039458").has_value());
    EXPECT_FALSE(scaleBy1e18("115792089237316195423570985008687907853269984665640564039457.584007913129639936").has_value());

    const auto padded = scaleBy1e18(std::string(100, '0') + "2");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(padded, scaleBy1e18("2"));
}

TEST_F(UnitTest, Vote_ScaleBy1e18_AboveUint64)
{
    // 100 * 10^18 = 0x56bc75e2d63100000
    const auto scaled = scaleBy1e18("100");
    ASSERT_TRUE(scaled.has_value());
    EXPECT_EQ(evmc::hex(*scaled), "0000000000000000000000000000000000000000000000056bc75e2d63100000");
}

TEST_F(UnitTest, Vote_Options_Governance)
{
    const auto options = getVoteOptions("YES_OR_NO_QUERY", true, "");

    EXPECT_EQ(labelsOf(options), (std::vector<std::string>{"Approve", "Reject"}));
    EXPECT_EQ(options[0].numeric_value, uint256FromUint64(1'000'000'000'000'000'000ULL));
    EXPECT_EQ(options[1].numeric_value, uint256FromUint64(0));
}

TEST_F(UnitTest, Vote_Options_YesOrNo)
{
    const auto options = getVoteOptions("yes_or_no_query", false, "");

    EXPECT_EQ(labelsOf(options), (std::vector<std::string>{"Yes", "No", "Ambiguous / Too early to tell"}));
    EXPECT_EQ(options[2].display_value, "0.5e18 (500000000000000000)");
    EXPECT_EQ(options[2].numeric_value, uint256FromUint64(500'000'000'000'000'000ULL));

    EXPECT_EQ(getVoteOptions("YES_OR_NO_QUERY_V2", false, "").size(), 3u);
}

TEST_F(UnitTest, Vote_Options_MultipleChoice)
{
    const auto options = getVoteOptions("MULTIPLE_CHOICE_QUERY", false, "q:\"Pick one\",p1:0,p2:1,p3: 0.5,p4:1.50");

    ASSERT_EQ(labelsOf(options), (std::vector<std::string>{"Option p1", "Option p2", "Option p3", "Option p4"}));
    EXPECT_EQ(options[0].display_value, "0e18");
    EXPECT_EQ(options[1].display_value, "1e18");
    EXPECT_EQ(options[2].display_value, "0.5e18");
    EXPECT_EQ(options[3].display_value, "1.5e18");
    EXPECT_EQ(options[2].numeric_value, uint256FromUint64(500'000'000'000'000'000ULL));
    EXPECT_EQ(options[3].numeric_value, uint256FromUint64(1'500'000'000'000'000'000ULL));
}

TEST_F(UnitTest, Vote_Options_MultipleChoiceWithoutValuesUsesDefault)
{
    const auto options = getVoteOptions("MULTIPLE_CHOICE_QUERY", false, "q:\"Pick one\"");
    EXPECT_EQ(labelsOf(options), (std::vector<std::string>{"Yes / Valid", "No / Invalid", "Custom price"}));
}

TEST_F(UnitTest, Vote_Options_Default)
{
    const auto options = getVoteOptions("NUMERICAL_QUERY", false, "p1:0,p2:1");

    EXPECT_EQ(labelsOf(options), (std::vector<std::string>{"Yes / Valid", "No / Invalid", "Custom price"}));
    EXPECT_EQ(options[2].display_value, "<value in wei, 18 decimals — check UMIP>");
}

TEST_F(UnitTest, Vote_Int256FromInt64)
{
    EXPECT_EQ(evmc::hex(int256FromInt64(0)), std::string(64, '0'));
    EXPECT_EQ(evmc::hex(int256FromInt64(1)), std::string(63, '0') + "1");
    EXPECT_EQ(evmc::hex(int256FromInt64(-1)), std::string(64, 'f'));
    EXPECT_EQ(evmc::hex(int256FromInt64(std::numeric_limits<std::int64_t>::min())),
        std::string(48, 'f') + "8" + std::string(15, '0'));
}

TEST_F(UnitTest, Vote_GenerateSalt_IsRandom)
{
    const evmc::bytes32 first = generateSalt();
    const evmc::bytes32 second = generateSalt();

    EXPECT_NE(first, second);
}

TEST_F(UnitTest, Vote_ComputeCommitHash_PackedEncoding)
{
    const auto voter = chain::parseAddress(std::string(40, '1'));
    ASSERT_TRUE(voter.has_value());

    const evmc::bytes32 identifier = evmc::from_hex<evmc::bytes32>(identifierHex("YES_OR_NO_QUERY")).value();

    const evmc::bytes32 hash = computeCommitHash(
        uint256FromUint64(1'000'000'000'000'000'000ULL),
        int256FromInt64(-12345),
        *voter,
        uint256FromUint64(1700000000),
        toBytes("q:\"Test?\""),
        uint256FromUint64(8542),
        identifier);

    EXPECT_EQ(evmc::hex(hash), "70bd7bf9fe22fbf6ec4a0aa6b70cbf95ce6db605523e9b93ca789b20aea17ec0");
}

TEST_F(UnitTest, Vote_ComputeCommitHash_EmptyAncillary)
{
    const auto voter = chain::parseAddress(std::string(40, '1'));
    ASSERT_TRUE(voter.has_value());

    const evmc::bytes32 identifier = evmc::from_hex<evmc::bytes32>(identifierHex("YES_OR_NO_QUERY")).value();

    const evmc::bytes32 hash = computeCommitHash(
        uint256FromUint64(1'000'000'000'000'000'000ULL),
        int256FromInt64(-12345),
        *voter,
        uint256FromUint64(1700000000),
        {},
        uint256FromUint64(8542),
        identifier);

    EXPECT_EQ(evmc::hex(hash), "8342e6b22918fa176769f6a8ca093157f2b82066c43414a3cf309b6786a2c124");
}

TEST_F(UnitTest, Vote_ParseVote)
{
    asio::io_context io_context{};
    MockRpcNode rpc;
    const chain::CrossChainResolver resolver(chain::defaultChainTable(), rpc.rpcCall());

    RawPendingVote raw;
    raw.last_voting_round = 8542;
    raw.is_governance = false;
    raw.time = 1705190400;
    raw.roll_count = 2;
    raw.identifier = identifierHex("YES_OR_NO_QUERY");
    raw.ancillary_data = ancillaryHex("q:\"Did the protocol distribute rewards for epoch 245678?\",p1:0,p2:1,p3:0.5");

    const ParsedVote vote = runAwaitable(io_context, parseVote(raw, 3, resolver));

    EXPECT_EQ(vote.index, 3u);
    EXPECT_EQ(vote.identifier, "YES_OR_NO_QUERY");
    EXPECT_EQ(vote.raw_identifier, raw.identifier);
    EXPECT_EQ(vote.time.time_since_epoch().count(), 1705190400);
    EXPECT_EQ(vote.roll_count, 2u);
    EXPECT_EQ(vote.round_id, 8542u);
    EXPECT_EQ(vote.description, "Did the protocol distribute rewards for epoch 245678?");
    EXPECT_EQ(vote.ancillary_raw, "q:\"Did the protocol distribute rewards for epoch 245678?\",p1:0,p2:1,p3:0.5");
    EXPECT_EQ(vote.raw_ancillary_data, raw.ancillary_data);
    EXPECT_EQ(vote.options.size(), 3u);
    EXPECT_TRUE(rpc.calls.empty());
}

TEST_F(UnitTest, Vote_ParseVote_GovernanceWithPlainText)
{
    asio::io_context io_context{};
    MockRpcNode rpc;
    const chain::CrossChainResolver resolver(chain::defaultChainTable(), rpc.rpcCall());

    RawPendingVote raw;
    raw.is_governance = true;
    raw.identifier = identifierHex("UMIP-175");
    raw.ancillary_data = ancillaryHex("Admin proposal to add NUMERICAL_QUERY as a supported price identifier.");

    const ParsedVote vote = runAwaitable(io_context, parseVote(raw, 0, resolver));

    EXPECT_EQ(vote.identifier, "UMIP-175");
    EXPECT_EQ(vote.description, "Admin proposal to add NUMERICAL_QUERY as a supported price identifier.");
    EXPECT_EQ(labelsOf(vote.options), (std::vector<std::string>{"Approve", "Reject"}));
}
