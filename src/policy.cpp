#include "policy.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace aclgen {

Action actionFromString(const std::string& value) {
    if (value == "accept") {
        return Action::Accept;
    } else if (value == "deny") {
        return Action::Deny;
    } else if (value == "reject") {
        return Action::Reject;
    } else if (value == "next") {
        return Action::Next;
    } else if (value == "reject-with-tcp-rst") {
        return Action::RejectWithTcpRst;
    }
    throw std::invalid_argument("Unknown action: " + value);
}

std::vector<Address> Term::addressesOfFamily(AddressField field,
                                             AddressFamily family,
                                             bool exclusions) const {
    const std::vector<Address>* source = nullptr;
    if (field == AddressField::Source) {
        source = exclusions ? &source_address_exclude : &source_address;
    } else {
        source = exclusions ? &destination_address_exclude : &destination_address;
    }

    std::vector<Address> result;
    std::copy_if(source->begin(), source->end(), std::back_inserter(result),
                 [family](const Address& addr) { return addr.family() == family; });
    return result;
}

bool Term::hasOptionPrefix(const std::string& prefix) const {
    return std::any_of(options.begin(), options.end(), [&prefix](const std::string& opt) {
        return opt.compare(0, prefix.size(), prefix) == 0;
    });
}

std::vector<std::string> FilterHeader::filterOptions(const std::string& platform) const {
    auto it = targets.find(platform);
    if (it == targets.end()) {
        return {};
    }
    return it->second;
}

std::string FilterHeader::filterName(const std::string& platform) const {
    auto options = filterOptions(platform);
    if (options.empty()) {
        throw std::invalid_argument("No filter name declared for platform " + platform);
    }
    return options.front();
}

} // namespace aclgen
