/**
 * @file extended_term.hpp
 * @brief Extended (and IPv6) access list term renderer for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the ExtendedTerm class which renders a term as the
 * statements of a named extended IPv4 access list or an IPv6 access list.
 */

#pragma once

#include "acl_term.hpp"
#include "normalizer.hpp"

namespace aclgen {

/**
 * @brief Maximum length of a comment line in an extended access list remark
 */
constexpr size_t kMaxRemarkWidth = 100;

/**
 * @brief Statement text of an address position
 *
 * - any: "any"
 * - IPv4 host: "host 192.0.2.1"
 * - IPv4 network: "10.0.0.0 0.255.255.255" (network and wildcard mask)
 * - IPv6 host: "host 2001:db8::1"
 * - IPv6 network: "2001:db8::/32"
 */
std::string renderAddress(const AddressMatch& address);

/**
 * @brief Statement text of a port position
 *
 * Empty for an unrestricted port, "eq P" for a single port and
 * "range L H" for a port range.
 */
std::string renderPort(const PortMatch& port);

/**
 * @class ExtendedTerm
 * @brief Term renderer for extended and inet6 access lists
 *
 * Every term expands into the cartesian product of its source addresses,
 * destination addresses, source ports, destination ports and protocols,
 * in that order (source address outermost, protocol innermost). Each
 * combination becomes one statement of the form
 *
 *   <action> <protocol> <source> [<sport>] <destination> [<dport>] [options]
 *
 * Combinations with an address outside the renderer's family are skipped.
 * The established keyword is only added to TCP statements; for other
 * protocols the high-port destination range covers replies.
 */
class ExtendedTerm : public AclTerm {
public:
    /**
     * @brief Construct an extended term renderer
     * @param term Term to render
     * @param context Rendering context for diagnostics
     * @param family IPv4 for extended access lists, IPv6 for inet6 access lists
     */
    ExtendedTerm(const Term& term, RenderContext& context, AddressFamily family = AddressFamily::IPv4);

    std::vector<std::string> render() const override;

    AddressFamily family() const { return family_; }

private:
    AddressFamily family_;

    /**
     * @brief Trailing keywords of a statement (established, log)
     *
     * established is only valid on TCP statements; the other protocols of
     * the same term rely on the high-port destination range alone.
     */
    std::vector<std::string> statementOptions(const std::string& protocol) const;

    /**
     * @brief Check whether an address position belongs to this renderer's family
     */
    bool matchesFamily(const AddressMatch& address) const;

    std::string buildStatement(const std::string& protocol,
                               const AddressMatch& source,
                               const PortMatch& source_port,
                               const AddressMatch& destination,
                               const PortMatch& destination_port,
                               const std::vector<std::string>& options) const;
};

} // namespace aclgen
