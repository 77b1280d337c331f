#include "normalizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <netdb.h>

namespace aclgen {

namespace {

// Protocol keywords understood by IOS access lists; anything else is rendered by number
const std::set<std::string> kLiteralProtocols = {
    "ahp", "eigrp", "esp", "gre", "icmp", "igmp", "igrp",
    "ip", "ipinip", "nos", "ospf", "pcp", "pim", "tcp", "udp",
};

bool isNumeric(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string toLower(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

bool isLiteralProtocol(const std::string& name) {
    return kLiteralProtocols.count(toLower(name)) > 0;
}

std::optional<std::string> lookupProtocol(const std::string& name) {
    if (isNumeric(name) || isLiteralProtocol(name)) {
        return name;
    }

    // Fall back to the system protocol table (/etc/protocols)
    protoent* protoinfo = getprotobyname(toLower(name).c_str());
    if (protoinfo) {
        return std::to_string(protoinfo->p_proto);
    }
    return std::nullopt;
}

std::string resolveProtocol(const std::string& name,
                            bool strict,
                            const UnresolvedProtocolHandler& on_unresolved) {
    auto resolved = lookupProtocol(name);
    if (resolved) {
        return *resolved;
    }
    if (strict) {
        throw UnknownProtocolError("Unknown protocol: " + name);
    }
    if (on_unresolved) {
        on_unresolved(name);
    }
    return name;
}

bool isTcp(const std::vector<std::string>& protocols) {
    return std::any_of(protocols.begin(), protocols.end(), [](const std::string& proto) {
        return toLower(proto) == "tcp" || proto == "6";
    });
}

std::vector<AddressMatch> effectiveAddresses(const Term& term, AddressField field, AddressFamily family) {
    const auto& configured = field == AddressField::Source ? term.source_address : term.destination_address;

    // An unrestricted field matches any address of either family
    if (configured.empty()) {
        return {std::nullopt};
    }

    std::vector<Address> addresses = term.addressesOfFamily(field, family);
    std::vector<Address> excluded = term.addressesOfFamily(field, family, true);
    if (!excluded.empty()) {
        addresses = excludeAddresses(addresses, excluded);
    }

    return std::vector<AddressMatch>(addresses.begin(), addresses.end());
}

std::vector<PortMatch> effectivePorts(const Term& term, AddressField field) {
    const auto& ports = field == AddressField::Source ? term.source_port : term.destination_port;
    if (ports.empty()) {
        return {std::nullopt};
    }
    return std::vector<PortMatch>(ports.begin(), ports.end());
}

Policy normalizeEstablished(const Policy& policy) {
    Policy normalized = policy;
    for (auto& filter : normalized.filters) {
        for (auto& term : filter.terms) {
            // Stateless filters cannot track connections, so replies are
            // admitted by matching the unprivileged port range instead
            if (!term.hasOptionPrefix("established")) {
                continue;
            }
            auto& ports = term.destination_port;
            if (std::find(ports.begin(), ports.end(), kHighPorts) == ports.end()) {
                ports.push_back(kHighPorts);
            }
        }
    }
    return normalized;
}

} // namespace aclgen
