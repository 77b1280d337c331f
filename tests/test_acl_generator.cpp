#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

#include "acl_generator.hpp"
#include "errors.hpp"

namespace
{

using namespace aclgen;

Filter makeFilter(const std::vector<std::string>& cisco_options)
{
    Filter filter;
    filter.header.targets["cisco"] = cisco_options;
    return filter;
}

Term makeTerm(const std::string& name)
{
    Term term;
    term.name = name;
    return term;
}

Term webTerm()
{
    Term term = makeTerm("allow-web");
    term.protocols = {"tcp"};
    term.destination_port = {PortRange{80, 80}};
    return term;
}

std::vector<std::string> splitLines(const std::string& document)
{
    std::vector<std::string> lines;
    std::istringstream stream(document);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool hasLine(const std::vector<std::string>& lines, const std::string& text)
{
    return std::find(lines.begin(), lines.end(), text) != lines.end();
}

size_t indexOf(const std::vector<std::string>& lines, const std::string& text)
{
    return static_cast<size_t>(std::find(lines.begin(), lines.end(), text) - lines.begin());
}

TEST(CiscoAclGenerator, ExtendedFilter)
{
    Filter filter = makeFilter({"test-filter"});
    filter.terms = {webTerm()};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);

    const std::string expected =
        "! $Id:$\n"
        "! $Date:$\n"
        "no ip access-list extended test-filter\n"
        "ip access-list extended test-filter\n"
        "\n"
        "remark allow-web\n"
        " permit tcp any any eq 80\n"
        "\n";
    EXPECT_EQ(expected, generator.render());
    EXPECT_TRUE(generator.warnings().empty());
}

TEST(CiscoAclGenerator, HeaderComments)
{
    Filter filter = makeFilter({"test-filter", "extended"});
    filter.header.comments = {"Inbound edge\nsecond line"};
    filter.terms = {webTerm()};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    ASSERT_GE(lines.size(), 6u);
    EXPECT_EQ("ip access-list extended test-filter", lines[3]);
    EXPECT_EQ("remark Inbound edge", lines[4]);
    EXPECT_EQ("remark second line", lines[5]);
}

TEST(CiscoAclGenerator, EmptyHeaderCommentLines)
{
    Filter filter = makeFilter({"test-filter"});
    filter.header.comments = {"", "a\n"};
    filter.terms = {webTerm()};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    ASSERT_GE(lines.size(), 7u);
    EXPECT_EQ("remark ", lines[4]);
    EXPECT_EQ("remark a", lines[5]);
    EXPECT_EQ("remark ", lines[6]);
}

TEST(CiscoAclGenerator, StandardFilter)
{
    Filter filter = makeFilter({"50", "standard"});
    Term term = makeTerm("allow-lan");
    term.address = {Address("10.0.0.0/24")};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    const std::vector<std::string> expected = {
        "! $Id:$",
        "! $Date:$",
        "no ip access-list 50",
        "remark allow-lan",
        "access-list 50 permit 10.0.0.0 0.0.0.255",
        "",
    };
    EXPECT_EQ(expected, lines);
}

TEST(CiscoAclGenerator, StandardNumberReservedForExtended)
{
    Filter filter = makeFilter({"50", "extended"});
    filter.terms = {webTerm()};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);
    EXPECT_THROW(generator.render(), UnsupportedCiscoAccessListError);
}

TEST(CiscoAclGenerator, FilterNameRules)
{
    EXPECT_NO_THROW(CiscoAclGenerator::validateFilterName("100", "extended"));
    EXPECT_NO_THROW(CiscoAclGenerator::validateFilterName("edge-in", "object-group"));
    EXPECT_NO_THROW(CiscoAclGenerator::validateFilterName("099", "standard"));
    EXPECT_NO_THROW(CiscoAclGenerator::validateFilterName("50", "inet6"));

    EXPECT_THROW(CiscoAclGenerator::validateFilterName("1", "extended"), UnsupportedCiscoAccessListError);
    EXPECT_THROW(CiscoAclGenerator::validateFilterName("99", "object-group"), UnsupportedCiscoAccessListError);
    EXPECT_THROW(CiscoAclGenerator::validateFilterName("0", "standard"), UnsupportedCiscoAccessListError);
    EXPECT_THROW(CiscoAclGenerator::validateFilterName("100", "standard"), UnsupportedCiscoAccessListError);
    EXPECT_THROW(CiscoAclGenerator::validateFilterName("lan", "standard"), UnsupportedCiscoAccessListError);
}

TEST(CiscoAclGenerator, StandardTermErrorPropagates)
{
    Filter filter = makeFilter({"50", "standard"});
    Term term = makeTerm("bad");
    term.address = {Address("10.0.0.0/24")};
    term.protocols = {"tcp"};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);
    EXPECT_THROW(generator.render(), StandardAclTermError);
}

TEST(CiscoAclGenerator, UnsupportedType)
{
    Filter filter = makeFilter({"test-filter", "reflexive"});
    filter.terms = {webTerm()};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);
    EXPECT_THROW(generator.render(), UnsupportedCiscoAccessListError);
}

TEST(CiscoAclGenerator, NoCiscoTarget)
{
    Filter filter;
    filter.header.targets["juniper"] = {"edge-in"};
    Policy policy;
    policy.filters = {filter};

    EXPECT_THROW(CiscoAclGenerator{policy}, NoCiscoPolicyError);
    EXPECT_THROW(CiscoAclGenerator{Policy{}}, NoCiscoPolicyError);
}

TEST(CiscoAclGenerator, SkipsOtherPlatforms)
{
    Filter juniper;
    juniper.header.targets["juniper"] = {"edge-in"};
    juniper.terms = {webTerm()};

    Filter cisco = makeFilter({"edge-in"});
    cisco.terms = {webTerm()};

    Policy policy;
    policy.filters = {juniper, cisco};

    CiscoAclGenerator generator(policy);
    const auto lines = splitLines(generator.render());

    EXPECT_EQ(1, std::count(lines.begin(), lines.end(), "ip access-list extended edge-in"));
    ASSERT_EQ(1u, generator.warnings().size());
    EXPECT_EQ(RenderWarning::Type::SkippedFilter, generator.warnings()[0].type);
}

TEST(CiscoAclGenerator, AllFiltersByDefault)
{
    Filter first = makeFilter({"edge-in"});
    first.terms = {webTerm()};
    Filter second = makeFilter({"edge-out"});
    second.terms = {webTerm()};
    Policy policy;
    policy.filters = {first, second};

    const auto all = splitLines(CiscoAclGenerator(policy).render());
    EXPECT_TRUE(hasLine(all, "ip access-list extended edge-in"));
    EXPECT_TRUE(hasLine(all, "ip access-list extended edge-out"));

    GeneratorOptions options;
    options.first_filter_only = true;
    const auto first_only = splitLines(CiscoAclGenerator(policy, options).render());
    EXPECT_TRUE(hasLine(first_only, "ip access-list extended edge-in"));
    EXPECT_FALSE(hasLine(first_only, "ip access-list extended edge-out"));
}

TEST(CiscoAclGenerator, MixedFilter)
{
    Filter filter = makeFilter({"mixed-filter", "mixed"});
    Term both = makeTerm("both");
    both.source_address = {Address("10.0.0.0/8"), Address("2001:db8::/32")};
    Term v6_only = makeTerm("v6-only");
    v6_only.protocols = {"tcp"};
    v6_only.address_family = AddressFamily::IPv6;
    filter.terms = {both, v6_only};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    const size_t v4_block = indexOf(lines, "ip access-list extended mixed-filter");
    const size_t v6_block = indexOf(lines, "ipv6 access-list mixed-filter");
    ASSERT_LT(v4_block, lines.size());
    ASSERT_LT(v6_block, lines.size());
    EXPECT_LT(v4_block, v6_block);
    EXPECT_EQ("no ipv6 access-list mixed-filter", lines[v6_block - 1]);

    EXPECT_LT(indexOf(lines, " permit ip 10.0.0.0 0.255.255.255 any"), v6_block);
    EXPECT_GT(indexOf(lines, " permit ip 2001:db8::/32 any"), v6_block);

    // The IPv6-only term is left out of the IPv4 half
    EXPECT_EQ(1, std::count(lines.begin(), lines.end(), "remark v6-only"));
    EXPECT_GT(indexOf(lines, "remark v6-only"), v6_block);
    EXPECT_TRUE(hasLine(lines, " permit tcp any any"));
}

TEST(CiscoAclGenerator, Inet6Filter)
{
    Filter filter = makeFilter({"v6-filter", "inet6"});
    Term term = makeTerm("dns");
    term.protocols = {"udp"};
    term.destination_address = {Address("2001:db8::53")};
    term.destination_port = {PortRange{53, 53}};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    EXPECT_EQ("no ipv6 access-list v6-filter", lines[2]);
    EXPECT_EQ("ipv6 access-list v6-filter", lines[3]);
    EXPECT_TRUE(hasLine(lines, " permit udp any host 2001:db8::53 eq 53"));
}

TEST(CiscoAclGenerator, ObjectGroupFilter)
{
    Filter filter = makeFilter({"og-filter", "object-group"});
    Term term = makeTerm("web");
    term.protocols = {"tcp"};
    term.destination_address = {Address("192.0.2.10", "WEB")};
    term.destination_port = {PortRange{443, 443}};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    const auto lines = splitLines(CiscoAclGenerator(policy).render());

    const std::vector<std::string> expected = {
        "! $Id:$",
        "! $Date:$",
        "object-group ip address WEB",
        " 192.0.2.10 255.255.255.255",
        "exit",
        "",
        "object-group ip port 443-443",
        " eq 443",
        "exit",
        "",
        "no ip access-list extended og-filter",
        "ip access-list extended og-filter",
        "",
        "remark web",
        " permit tcp addrgroup ANY addrgroup WEB portgroup 443-443",
        "",
    };
    EXPECT_EQ(expected, lines);
}

TEST(CiscoAclGenerator, EstablishedNormalization)
{
    Filter filter = makeFilter({"replies"});
    Term tcp = makeTerm("tcp-replies");
    tcp.protocols = {"tcp"};
    tcp.options = {"established"};
    Term udp = makeTerm("udp-replies");
    udp.protocols = {"udp"};
    udp.options = {"established"};
    filter.terms = {tcp, udp};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);
    const auto lines = splitLines(generator.render());

    EXPECT_TRUE(hasLine(lines, " permit tcp any any range 1024 65535 established"));
    EXPECT_TRUE(hasLine(lines, " permit udp any any range 1024 65535"));

    // The caller's policy is not modified
    EXPECT_TRUE(policy.filters[0].terms[0].destination_port.empty());
    EXPECT_EQ(1u, generator.policy().filters[0].terms[0].destination_port.size());
}

TEST(CiscoAclGenerator, StrictProtocols)
{
    Filter filter = makeFilter({"odd"});
    Term term = makeTerm("odd-proto");
    term.protocols = {"not-a-protocol"};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator lenient(policy);
    const auto lines = splitLines(lenient.render());
    EXPECT_TRUE(hasLine(lines, " permit not-a-protocol any any"));
    ASSERT_EQ(1u, lenient.warnings().size());
    EXPECT_EQ(RenderWarning::Type::UnresolvedProtocol, lenient.warnings()[0].type);

    GeneratorOptions options;
    options.strict_protocols = true;
    CiscoAclGenerator strict(policy, options);
    EXPECT_THROW(strict.render(), UnknownProtocolError);
}

TEST(CiscoAclGenerator, RenderIsRepeatable)
{
    Filter filter = makeFilter({"og-filter", "object-group"});
    Term term = makeTerm("web");
    term.source_address = {Address("10.0.0.0/8", "CORP")};
    term.protocols = {"not-a-protocol"};
    filter.terms = {term};
    Policy policy;
    policy.filters = {filter};

    CiscoAclGenerator generator(policy);
    const std::string first = generator.render();
    const std::string second = generator.render();

    EXPECT_EQ(first, second);
    EXPECT_EQ(1u, generator.warnings().size());
}

TEST(CiscoAclGenerator, FilterType)
{
    FilterHeader header;
    header.targets["cisco"] = {"edge-in"};
    EXPECT_EQ("extended", CiscoAclGenerator::filterType(header));

    header.targets["cisco"] = {"edge-in", "object-group"};
    EXPECT_EQ("object-group", CiscoAclGenerator::filterType(header));
}

} // namespace
