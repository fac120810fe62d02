#include "TunnelConf/Base64.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Helpers.hpp"

namespace
{

using namespace TunnelConf;

std::string AsString(const std::vector<std::uint8_t> &bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

}

TEST(Base64, DecodesPaddedInput)
{
    struct Case { std::string input; std::string expected; };
    const std::vector<Case> cases = {
        {"",             ""},
        {"Zg==",         "f"},
        {"Zm8=",         "fo"},
        {"Zm9v",         "foo"},
        {"Zm9vYmFy",     "foobar"},
        {"Zm9v\r\nYmFy", "foobar"},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.input);
        EXPECT_EQ(AsString(Base64::Decode(c.input)), c.expected);
    }
}

TEST(Base64, ReportsOffendingByte)
{
    struct Case { std::string input; std::string message; };
    const std::vector<Case> cases = {
        {"x",        "illegal base64 data at input byte 0"},
        {"Zm9v!",    "illegal base64 data at input byte 4"},
        {"Z===",     "illegal base64 data at input byte 1"},
        {"Zm=v",     "illegal base64 data at input byte 3"},
        {"Zg==Zg==", "illegal base64 data at input byte 4"},
        {"Zm9vY",    "illegal base64 data at input byte 4"},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.input);
        try
        {
            (void)Base64::Decode(c.input);
            ADD_FAILURE() << "no exception";
        }
        catch (const std::invalid_argument &e)
        {
            EXPECT_EQ(std::string(e.what()), c.message);
        }
    }
}

TEST(Base64, WireguardKeyLength)
{
    EXPECT_TRUE(Base64::IsWireguardKey(TestHelpers::kPrivateKey));
    EXPECT_TRUE(Base64::IsWireguardKey(TestHelpers::kPreSharedKey));
    EXPECT_FALSE(Base64::IsWireguardKey(""));
    EXPECT_FALSE(Base64::IsWireguardKey("x"));

    try
    {
        Base64::ParseWireguardKey("Zm9v");
        ADD_FAILURE() << "no exception";
    }
    catch (const std::invalid_argument &e)
    {
        EXPECT_STREQ(e.what(), "key is 3 bytes instead of 32");
    }
}
