#include "standard_term.hpp"
#include "errors.hpp"

namespace aclgen {

StandardTerm::StandardTerm(const Term& term, const std::string& filter_name, RenderContext& context)
    : AclTerm(term, context)
    , filter_name_(filter_name) {
    validate();
}

void StandardTerm::validate() const {
    if (!term_.protocols.empty()) {
        throw StandardAclTermError("Standard ACLs cannot specify protocols (term " + term_.name + ")");
    }
    if (!term_.source_address.empty() || !term_.source_address_exclude.empty() ||
        !term_.destination_address.empty() || !term_.destination_address_exclude.empty()) {
        throw StandardAclTermError("Standard ACLs cannot use source or destination addresses (term " +
                                   term_.name + ")");
    }
    if (!term_.options.empty()) {
        throw StandardAclTermError("Standard ACLs prohibit use of options (term " + term_.name + ")");
    }
    if (!term_.source_port.empty() || !term_.destination_port.empty()) {
        throw StandardAclTermError("Standard ACLs prohibit use of port numbers (term " + term_.name + ")");
    }
    if (term_.counter) {
        throw StandardAclTermError("Counters are not implemented in standard ACLs (term " + term_.name + ")");
    }
    if (term_.logging) {
        throw StandardAclTermError("Logging is not implemented in standard ACLs (term " + term_.name + ")");
    }
}

std::vector<std::string> StandardTerm::render() const {
    std::vector<std::string> lines;
    addRemarks(lines);

    if (addVerbatim(lines)) {
        return lines;
    }

    const std::string prefix = "access-list " + filter_name_ + " " + ciscoAction(term_.action) + " ";
    for (const auto& addr : term_.address) {
        if (addr.family() == AddressFamily::IPv6) {
            context_.warn(RenderWarning::Type::IgnoredAddress, term_.name,
                          "Ignoring unsupported IPv6 address " + addr.toString() +
                          " in standard access list " + filter_name_);
            continue;
        }
        if (addr.isHost()) {
            lines.push_back(prefix + addr.ip());
        } else {
            lines.push_back(prefix + addr.ip() + " " + addr.hostmask());
        }
    }
    return lines;
}

} // namespace aclgen
