#include "extended_term.hpp"
#include <sstream>
#include <stdexcept>

namespace aclgen {

std::string renderAddress(const AddressMatch& address) {
    if (!address) {
        return "any";
    }
    if (address->isHost()) {
        return "host " + address->ip();
    }

    // Networks use a wildcard mask on IPv4 and prefix notation on IPv6
    switch (address->family()) {
        case AddressFamily::IPv4:
            return address->ip() + " " + address->hostmask();
        case AddressFamily::IPv6:
            return address->ip() + "/" + std::to_string(address->prefixLength());
        default:
            throw std::runtime_error("Unknown address family");
    }
}

std::string renderPort(const PortMatch& port) {
    if (!port) {
        return "";
    }
    if (port->isSinglePort()) {
        return "eq " + std::to_string(port->low);
    }
    return "range " + std::to_string(port->low) + " " + std::to_string(port->high);
}

ExtendedTerm::ExtendedTerm(const Term& term, RenderContext& context, AddressFamily family)
    : AclTerm(term, context)
    , family_(family) {
}

std::vector<std::string> ExtendedTerm::render() const {
    std::vector<std::string> lines;

    // Every term starts on a fresh paragraph with its name and comments as remarks
    lines.push_back("");
    addRemarks(lines, kMaxRemarkWidth);

    // Verbatim terms replace all generated statements
    if (addVerbatim(lines)) {
        return lines;
    }

    std::vector<std::string> protocols = resolvedProtocols();
    std::vector<AddressMatch> sources = effectiveAddresses(term_, AddressField::Source, family_);
    std::vector<AddressMatch> destinations = effectiveAddresses(term_, AddressField::Destination, family_);
    std::vector<PortMatch> source_ports = effectivePorts(term_, AddressField::Source);
    std::vector<PortMatch> destination_ports = effectivePorts(term_, AddressField::Destination);

    for (const auto& source : sources) {
        for (const auto& destination : destinations) {
            for (const auto& source_port : source_ports) {
                for (const auto& destination_port : destination_ports) {
                    for (const auto& protocol : protocols) {
                        // Only output addresses of this access list's family
                        if (!matchesFamily(source) || !matchesFamily(destination)) {
                            continue;
                        }
                        lines.push_back(buildStatement(protocol, source, source_port,
                                                       destination, destination_port,
                                                       statementOptions(protocol)));
                    }
                }
            }
        }
    }

    return lines;
}

std::vector<std::string> ExtendedTerm::statementOptions(const std::string& protocol) const {
    std::vector<std::string> options;

    // "tcp-established" and "established" collapse into one keyword
    if ((term_.hasOptionPrefix("tcp-established") || term_.hasOptionPrefix("established")) &&
        isTcp({protocol})) {
        options.push_back("established");
    }
    if (term_.logging) {
        options.push_back("log");
    }
    return options;
}

bool ExtendedTerm::matchesFamily(const AddressMatch& address) const {
    return !address || address->family() == family_;
}

std::string ExtendedTerm::buildStatement(const std::string& protocol,
                                         const AddressMatch& source,
                                         const PortMatch& source_port,
                                         const AddressMatch& destination,
                                         const PortMatch& destination_port,
                                         const std::vector<std::string>& options) const {
    std::vector<std::string> fields = {
        ciscoAction(term_.action),
        protocol,
        renderAddress(source),
        renderPort(source_port),
        renderAddress(destination),
        renderPort(destination_port),
    };
    fields.insert(fields.end(), options.begin(), options.end());

    // Statements are indented by one space below the access list declaration
    std::ostringstream statement;
    for (const auto& field : fields) {
        if (!field.empty()) {
            statement << " " << field;
        }
    }
    return statement.str();
}

} // namespace aclgen
