#include "TunnelConf/Settings/ControlServer.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Resolver.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace TunnelConf;

TEST(ControlServer, Defaults)
{
    const ControlServer d = Resolver::Combine<ControlServer>({ControlServer{}}, {});
    EXPECT_EQ(d.address, ":8000");
    EXPECT_EQ(d.log, true);
    EXPECT_NO_THROW(d.Validate());
}

TEST(ControlServer, ListeningAddress)
{
    struct Case { std::string address; bool valid; };
    const std::vector<Case> cases = {
        {":8000",          true},
        {"0.0.0.0:9999",   true},
        {"localhost:1",    true},
        {"[::1]:8000",     true},
        {"8000",           false},
        {":0",             false},
        {":65536",         false},
        {"::1:8000",       false},
        {"",               false},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.address);
        ControlServer s;
        s.address = c.address;
        s.log = true;
        if (c.valid)
        {
            EXPECT_NO_THROW(s.Validate());
        }
        else
        {
            try
            {
                s.Validate();
                ADD_FAILURE() << "no exception";
            }
            catch (const ValidationError &e)
            {
                EXPECT_EQ(e.Code(), Errc::ControlServerAddressInvalid);
                EXPECT_EQ(e.Value(), c.address);
            }
        }
    }
}

TEST(ControlServer, MergeAndOverride)
{
    ControlServer a;
    a.log = false;

    ControlServer b;
    b.address = ":9000";
    b.log = true;

    ControlServer merged = a.Copy();
    merged.MergeWith(b);
    EXPECT_EQ(merged.address, ":9000");
    EXPECT_EQ(merged.log, false);

    ControlServer overridden = a.Copy();
    overridden.OverrideWith(b);
    EXPECT_EQ(overridden.log, true);
}

TEST(ControlServer, Rendering)
{
    ControlServer s;
    s.address = ":8000";
    s.log = false;
    const std::vector<std::string> expected = {
        "Control server settings:",
        "├── Listening address: :8000",
        "└── Logging: no",
    };
    EXPECT_EQ(s.ToLines(), expected);
}
