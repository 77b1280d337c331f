#include <gtest/gtest.h>

#include <algorithm>

#include "object_group.hpp"
#include "object_group_term.hpp"

namespace
{

using namespace aclgen;

Term makeTerm(const std::string& name)
{
    Term term;
    term.name = name;
    return term;
}

size_t countLines(const std::vector<std::string>& lines, const std::string& text)
{
    return static_cast<size_t>(std::count(lines.begin(), lines.end(), text));
}

TEST(ObjectGroupTerm, GroupReferences)
{
    Term term = makeTerm("web");
    term.protocols = {"tcp"};
    term.source_address = {Address("10.0.0.0/8", "CORP"), Address("172.16.0.0/12", "CORP")};
    term.destination_address = {Address("192.0.2.10", "WEB")};
    term.destination_port = {PortRange{80, 80}, PortRange{8000, 8080}};

    RenderContext context;
    const auto lines = ObjectGroupTerm(term, "edge-in", context).render();

    ASSERT_EQ(4u, lines.size());
    EXPECT_EQ("", lines[0]);
    EXPECT_EQ("remark web", lines[1]);
    EXPECT_EQ(" permit tcp addrgroup CORP addrgroup WEB portgroup 80-80", lines[2]);
    EXPECT_EQ(" permit tcp addrgroup CORP addrgroup WEB portgroup 8000-8080", lines[3]);
}

TEST(ObjectGroupTerm, AnyGroup)
{
    Term term = makeTerm("outbound");
    term.source_address = {Address("10.0.0.0/8", "CORP")};
    term.source_port = {PortRange{1024, 65535}};

    RenderContext context;
    const auto lines = ObjectGroupTerm(term, "edge-out", context).render();

    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ(" permit ip addrgroup CORP portgroup 1024-65535 addrgroup ANY", lines[2]);
}

TEST(ObjectGroupTerm, ExclusionsWarn)
{
    Term term = makeTerm("carve");
    term.source_address = {Address("10.0.0.0/8", "CORP")};
    term.source_address_exclude = {Address("10.1.0.0/16", "LAB")};

    RenderContext context;
    const auto lines = ObjectGroupTerm(term, "edge-in", context).render();

    EXPECT_EQ(1u, countLines(lines, " permit ip addrgroup CORP addrgroup ANY"));
    ASSERT_EQ(1u, context.warnings.size());
    EXPECT_EQ(RenderWarning::Type::IgnoredExclusion, context.warnings[0].type);
}

TEST(ObjectGroupTerm, IPv6AddressesWarn)
{
    Term term = makeTerm("v6");
    term.protocols = {"tcp"};
    term.source_address = {Address("2001:db8::/32", "V6")};
    term.destination_port = {PortRange{80, 80}};

    RenderContext context;
    const auto lines = ObjectGroupTerm(term, "edge-in", context).render();

    EXPECT_EQ(1u, countLines(lines, " permit tcp addrgroup V6 addrgroup ANY portgroup 80-80"));
    ASSERT_EQ(1u, context.warnings.size());
    EXPECT_EQ(RenderWarning::Type::IgnoredAddress, context.warnings[0].type);
    EXPECT_EQ("v6", context.warnings[0].term);

    ObjectGroupCollector collector;
    collector.addTerm(term);
    EXPECT_EQ(0u, countLines(collector.render(), "object-group ip address V6"));
}

TEST(ObjectGroupCollector, SharedTokenRenderedOnce)
{
    ObjectGroupCollector collector;
    EXPECT_FALSE(collector.valid());

    for (int i = 0; i < 5; ++i) {
        Term term = makeTerm("term-" + std::to_string(i));
        term.source_address = {Address("10.0.0.0/8", "CORP"), Address("172.16.0.0/12", "CORP")};
        collector.addTerm(term);
    }
    ASSERT_TRUE(collector.valid());

    const auto lines = collector.render();

    EXPECT_EQ(1u, countLines(lines, "object-group ip address CORP"));
    const std::vector<std::string> expected = {
        "object-group ip address CORP",
        " 10.0.0.0 255.0.0.0",
        " 172.16.0.0 255.240.0.0",
        "exit",
        "",
    };
    EXPECT_EQ(expected, lines);
}

TEST(ObjectGroupCollector, OrderAndPorts)
{
    ObjectGroupCollector collector;

    Term first = makeTerm("first");
    first.source_address = {Address("10.0.0.0/8", "CORP")};
    first.destination_address = {Address("192.0.2.10", "WEB"), Address("2001:db8::/32", "WEB6")};
    first.destination_port = {PortRange{443, 443}};
    collector.addTerm(first);

    Term second = makeTerm("second");
    second.destination_address = {Address("192.0.2.10", "WEB")};
    second.source_port = {PortRange{1024, 65535}};
    second.destination_port = {PortRange{443, 443}};
    collector.addTerm(second);

    const std::vector<std::string> expected = {
        "object-group ip address CORP",
        " 10.0.0.0 255.0.0.0",
        "exit",
        "",
        "object-group ip address WEB",
        " 192.0.2.10 255.255.255.255",
        "exit",
        "",
        "object-group ip port 443-443",
        " eq 443",
        "exit",
        "",
        "object-group ip port 1024-65535",
        " range 1024 65535",
        "exit",
        "",
    };
    EXPECT_EQ(expected, collector.render());
}

TEST(ObjectGroupCollector, FilterNames)
{
    ObjectGroupCollector collector;
    collector.addFilterName("edge-in");
    collector.addFilterName("edge-out");

    ASSERT_EQ(2u, collector.filterNames().size());
    EXPECT_EQ("edge-out", collector.filterNames()[1]);
    EXPECT_FALSE(collector.valid());
}

TEST(ParentTokens, FirstSeenOrder)
{
    const std::vector<Address> addresses = {
        Address("10.0.0.0/8", "A", "CORP"),
        Address("192.0.2.0/24", "WEB"),
        Address("172.16.0.0/12", "B", "CORP"),
    };

    const std::vector<std::string> expected = {"CORP", "WEB"};
    EXPECT_EQ(expected, parentTokens(addresses));
    EXPECT_EQ("1024-65535", portGroupName(PortRange{1024, 65535}));
}

} // namespace
