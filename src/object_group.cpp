#include "object_group.hpp"
#include "object_group_term.hpp"
#include <set>

namespace aclgen {

void ObjectGroupCollector::addFilterName(const std::string& filter_name) {
    filter_names_.push_back(filter_name);
}

void ObjectGroupCollector::addTerm(const Term& term) {
    terms_.push_back(term);
}

std::vector<std::string> ObjectGroupCollector::render() const {
    std::vector<std::string> lines;
    std::set<std::string> seen_addresses;
    std::set<std::string> seen_ports;

    // Emit one block per unseen parent token, listing every sibling address
    auto add_address_groups = [&](const std::vector<Address>& addresses) {
        for (const auto& token : parentTokens(addresses)) {
            if (!seen_addresses.insert(token).second) {
                continue;
            }
            lines.push_back("object-group ip address " + token);
            for (const auto& addr : addresses) {
                if (addr.parentToken() == token) {
                    lines.push_back(" " + addr.ip() + " " + addr.netmask());
                }
            }
            lines.push_back("exit");
            lines.push_back("");
        }
    };

    for (const auto& term : terms_) {
        // Object-group access lists are IPv4 only
        add_address_groups(term.addressesOfFamily(AddressField::Source, AddressFamily::IPv4));
        add_address_groups(term.addressesOfFamily(AddressField::Destination, AddressFamily::IPv4));

        std::vector<PortRange> ports = term.source_port;
        ports.insert(ports.end(), term.destination_port.begin(), term.destination_port.end());
        for (const auto& port : ports) {
            std::string name = portGroupName(port);
            if (!seen_ports.insert(name).second) {
                continue;
            }
            lines.push_back("object-group ip port " + name);
            if (port.isSinglePort()) {
                lines.push_back(" eq " + std::to_string(port.low));
            } else {
                lines.push_back(" range " + std::to_string(port.low) + " " + std::to_string(port.high));
            }
            lines.push_back("exit");
            lines.push_back("");
        }
    }

    return lines;
}

} // namespace aclgen
