#include "unit-tests.hpp"

using namespace avr;
using namespace avr::tests;

TEST_F(UnitTest, Utils_HexQuantity)
{
    EXPECT_EQ(utils::toHexQuantity(0), "0x0");
    EXPECT_EQ(utils::toHexQuantity(900), "0x384");
    EXPECT_EQ(utils::parseHexQuantity("0x3f2"), 1010u);
    EXPECT_EQ(utils::parseHexQuantity("0X3F2"), 1010u);
    EXPECT_FALSE(utils::parseHexQuantity("").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("0xzz").has_value());
}

TEST_F(UnitTest, Utils_ParseDecimal)
{
    EXPECT_EQ(utils::parseDecimal("52000000"), 52000000u);
    EXPECT_FALSE(utils::parseDecimal("").has_value());
    EXPECT_FALSE(utils::parseDecimal("12a").has_value());
    EXPECT_FALSE(utils::parseDecimal("-1").has_value());
    EXPECT_FALSE(utils::parseDecimal("99999999999999999999999").has_value());
}

TEST_F(UnitTest, Utils_Trim)
{
    EXPECT_EQ(utils::trim("  a b \t\n"), "a b");
    EXPECT_EQ(utils::trim("   "), "");
    EXPECT_EQ(utils::trim(""), "");
}

TEST_F(UnitTest, Utils_IsValidUtf8)
{
    const auto bytes = [](std::initializer_list<int> values)
    {
        std::vector<std::uint8_t> out;
        for(const int value : values)
        {
            out.push_back(static_cast<std::uint8_t>(value));
        }
        return out;
    };

    EXPECT_TRUE(utils::isValidUtf8({}));
    EXPECT_TRUE(utils::isValidUtf8(bytes({'a', 'b', 'c'})));
    EXPECT_TRUE(utils::isValidUtf8(bytes({0xC3, 0xA9})));
    EXPECT_TRUE(utils::isValidUtf8(bytes({0xE2, 0x80, 0x94})));
    EXPECT_TRUE(utils::isValidUtf8(bytes({0xF0, 0x9F, 0x98, 0x80})));

    EXPECT_FALSE(utils::isValidUtf8(bytes({0xFF})));
    EXPECT_FALSE(utils::isValidUtf8(bytes({0x80})));
    EXPECT_FALSE(utils::isValidUtf8(bytes({0xC3})));
    EXPECT_FALSE(utils::isValidUtf8(bytes({0xC0, 0xAF})));
    EXPECT_FALSE(utils::isValidUtf8(bytes({0xED, 0xA0, 0x80})));
    EXPECT_FALSE(utils::isValidUtf8(bytes({0xF4, 0x90, 0x80, 0x80})));
}
