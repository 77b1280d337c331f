/**
 * @file policy.hpp
 * @brief Vendor-neutral filter model consumed by the ACL renderers
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the data structures describing a policy: an ordered
 * list of filters, each made of a header (targets, comments) and an ordered
 * list of terms. The renderers treat these structures as read-only input.
 */

#pragma once

#include "address.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aclgen {

/**
 * @enum Action
 * @brief Term actions available in the filter model
 */
enum class Action {
    Accept,           ///< Let the packet through
    Deny,             ///< Drop the packet
    Reject,           ///< Drop the packet and notify the sender
    Next,             ///< Continue with the next term
    RejectWithTcpRst  ///< Reject by resetting the TCP connection
};

/**
 * @brief Parse an action keyword such as "accept" or "reject-with-tcp-rst"
 * @throws std::invalid_argument for unknown keywords
 */
Action actionFromString(const std::string& value);

/**
 * @struct PortRange
 * @brief Closed port interval; a single port p is [p, p]
 */
struct PortRange {
    uint16_t low = 0;
    uint16_t high = 0;

    bool isSinglePort() const { return low == high; }

    bool operator==(const PortRange& other) const {
        return low == other.low && high == other.high;
    }
    bool operator!=(const PortRange& other) const { return !(*this == other); }
};

/**
 * @struct VerbatimEntry
 * @brief Raw configuration text to emit unchanged for one platform
 */
struct VerbatimEntry {
    std::string platform; ///< Target platform, e.g. "cisco"
    std::string text;     ///< Text emitted instead of the rendered term
};

/**
 * @enum AddressField
 * @brief Which side of the packet an address or port set applies to
 */
enum class AddressField {
    Source,
    Destination
};

/**
 * @struct Term
 * @brief A single match/action rule of a filter
 *
 * Empty collections mean "not specified". The address field holds plain
 * addresses used by standard ACLs, which match the source only.
 */
struct Term {
    std::string name;
    std::vector<std::string> comments;
    Action action = Action::Accept;
    std::vector<std::string> protocols;

    std::vector<Address> address;
    std::vector<Address> source_address;
    std::vector<Address> source_address_exclude;
    std::vector<Address> destination_address;
    std::vector<Address> destination_address_exclude;

    std::vector<PortRange> source_port;
    std::vector<PortRange> destination_port;

    std::vector<std::string> options;
    bool logging = false;
    std::optional<std::string> counter;
    std::vector<VerbatimEntry> verbatim;
    std::optional<AddressFamily> address_family;  ///< Family hint for mixed filters

    /**
     * @brief Addresses of one field restricted to one family
     * @param field Source or destination
     * @param family Address family to keep
     * @param exclusions Select the exclusion set instead of the positive set
     */
    std::vector<Address> addressesOfFamily(AddressField field,
                                           AddressFamily family,
                                           bool exclusions = false) const;

    /**
     * @brief Check whether any option starts with the given prefix
     */
    bool hasOptionPrefix(const std::string& prefix) const;
};

/**
 * @struct FilterHeader
 * @brief Target platforms and comments of one filter
 *
 * Each target maps a platform name to its option list. The first option is
 * the filter name, the second (if present) the platform-specific filter type.
 */
struct FilterHeader {
    std::map<std::string, std::vector<std::string>> targets;
    std::vector<std::string> comments;

    bool targetsPlatform(const std::string& platform) const {
        return targets.count(platform) > 0;
    }

    /**
     * @brief Options declared for a platform, empty if the platform is not targeted
     */
    std::vector<std::string> filterOptions(const std::string& platform) const;

    /**
     * @brief Filter name for a platform (first option)
     * @throws std::invalid_argument if the platform is not targeted or has no options
     */
    std::string filterName(const std::string& platform) const;
};

/**
 * @struct Filter
 * @brief Header plus ordered terms
 */
struct Filter {
    FilterHeader header;
    std::vector<Term> terms;
};

/**
 * @struct Policy
 * @brief Ordered list of filters
 */
struct Policy {
    std::vector<Filter> filters;
};

} // namespace aclgen
