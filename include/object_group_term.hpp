/**
 * @file object_group_term.hpp
 * @brief Object-group access list term renderer for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * Object-group access lists use the same statement layout as extended
 * access lists but refer to named address and port groups instead of
 * spelling out every network and port. The groups themselves are defined
 * once per document by ObjectGroupCollector.
 */

#pragma once

#include "acl_term.hpp"
#include "normalizer.hpp"

namespace aclgen {

/**
 * @brief Group name used when a term does not restrict an address field
 */
extern const char* const kAnyGroupToken;

/**
 * @brief Name of the port group covering a range, "<low>-<high>"
 */
std::string portGroupName(const PortRange& range);

/**
 * @brief Distinct parent tokens of an address list, in first-seen order
 */
std::vector<std::string> parentTokens(const std::vector<Address>& addresses);

/**
 * @class ObjectGroupTerm
 * @brief Term renderer emitting statements that reference named groups
 *
 * One statement is emitted for every combination of source group,
 * destination group, source port, destination port and protocol
 * (protocol innermost):
 *
 *   <action> <protocol> addrgroup <src> [portgroup <l>-<h>] addrgroup <dst> [portgroup <l>-<h>]
 *
 * Sibling addresses sharing a parent token form a single group, so they
 * produce a single statement. Unrestricted address fields reference the
 * ANY group. Group definitions only hold IPv4 addresses; every IPv6 address
 * of the term is reported with an IgnoredAddress warning.
 */
class ObjectGroupTerm : public AclTerm {
public:
    /**
     * @brief Construct an object-group term renderer
     * @param term Term to render
     * @param filter_name Name of the enclosing access list
     * @param context Rendering context for diagnostics
     */
    ObjectGroupTerm(const Term& term, const std::string& filter_name, RenderContext& context);

    std::vector<std::string> render() const override;

private:
    std::string filter_name_;

    /**
     * @brief Group tokens referenced for one address field
     */
    std::vector<std::string> groupTokens(AddressField field) const;
};

} // namespace aclgen
