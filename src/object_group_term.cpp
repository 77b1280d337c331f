#include "object_group_term.hpp"
#include <algorithm>
#include <sstream>

namespace aclgen {

const char* const kAnyGroupToken = "ANY";

std::string portGroupName(const PortRange& range) {
    return std::to_string(range.low) + "-" + std::to_string(range.high);
}

std::vector<std::string> parentTokens(const std::vector<Address>& addresses) {
    std::vector<std::string> tokens;
    for (const auto& addr : addresses) {
        if (std::find(tokens.begin(), tokens.end(), addr.parentToken()) == tokens.end()) {
            tokens.push_back(addr.parentToken());
        }
    }
    return tokens;
}

ObjectGroupTerm::ObjectGroupTerm(const Term& term, const std::string& filter_name, RenderContext& context)
    : AclTerm(term, context)
    , filter_name_(filter_name) {
}

std::vector<std::string> ObjectGroupTerm::render() const {
    std::vector<std::string> lines;
    lines.push_back("");
    addRemarks(lines);

    if (addVerbatim(lines)) {
        return lines;
    }

    // Groups are defined from the positive address sets only
    if (!term_.source_address_exclude.empty() || !term_.destination_address_exclude.empty()) {
        context_.warn(RenderWarning::Type::IgnoredExclusion, term_.name,
                      "Address exclusions are not applied in object-group access list " + filter_name_);
    }

    // Group definitions are IPv4 only, so IPv6 members never reach a group
    for (const auto* addresses : {&term_.source_address, &term_.destination_address}) {
        for (const auto& addr : *addresses) {
            if (addr.family() == AddressFamily::IPv6) {
                context_.warn(RenderWarning::Type::IgnoredAddress, term_.name,
                              "IPv6 address " + addr.toString() + " of group " + addr.parentToken() +
                              " is not defined in object-group access list " + filter_name_);
            }
        }
    }

    std::vector<std::string> protocols = resolvedProtocols();
    std::vector<std::string> sources = groupTokens(AddressField::Source);
    std::vector<std::string> destinations = groupTokens(AddressField::Destination);
    std::vector<PortMatch> source_ports = effectivePorts(term_, AddressField::Source);
    std::vector<PortMatch> destination_ports = effectivePorts(term_, AddressField::Destination);
    const std::string& action = ciscoAction(term_.action);

    for (const auto& source : sources) {
        for (const auto& destination : destinations) {
            for (const auto& source_port : source_ports) {
                for (const auto& destination_port : destination_ports) {
                    for (const auto& protocol : protocols) {
                        std::ostringstream statement;
                        statement << " " << action << " " << protocol
                                  << " addrgroup " << source;
                        if (source_port) {
                            statement << " portgroup " << portGroupName(*source_port);
                        }
                        statement << " addrgroup " << destination;
                        if (destination_port) {
                            statement << " portgroup " << portGroupName(*destination_port);
                        }
                        lines.push_back(statement.str());
                    }
                }
            }
        }
    }

    return lines;
}

std::vector<std::string> ObjectGroupTerm::groupTokens(AddressField field) const {
    const auto& addresses = field == AddressField::Source ? term_.source_address : term_.destination_address;
    if (addresses.empty()) {
        return parentTokens({Address("0.0.0.0/0", kAnyGroupToken)});
    }
    return parentTokens(addresses);
}

} // namespace aclgen
