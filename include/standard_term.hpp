/**
 * @file standard_term.hpp
 * @brief Numbered standard access list term renderer for aclgen
 * @author aclgen Development Team
 * @date 2024
 */

#pragma once

#include "acl_term.hpp"

namespace aclgen {

/**
 * @class StandardTerm
 * @brief Term renderer for numbered standard access lists (1-99)
 *
 * Standard access lists match on a single IPv4 address per statement and
 * nothing else. The constructor rejects terms using any other match field
 * instead of silently dropping it, so a term that cannot be expressed never
 * turns into a broader rule.
 *
 * Statements have the form
 *
 *   access-list <filter> <action> <ip>                 (host)
 *   access-list <filter> <action> <network> <wildcard> (network)
 */
class StandardTerm : public AclTerm {
public:
    /**
     * @brief Construct and validate a standard term renderer
     * @param term Term to render
     * @param filter_name Number of the access list
     * @param context Rendering context for diagnostics
     * @throws StandardAclTermError if the term sets protocols, source or
     *         destination addresses or exclusions, options, ports, a counter
     *         or logging
     */
    StandardTerm(const Term& term, const std::string& filter_name, RenderContext& context);

    /**
     * @brief Render one statement per IPv4 address of the term
     *
     * IPv6 addresses are skipped with an IgnoredAddress warning.
     */
    std::vector<std::string> render() const override;

private:
    std::string filter_name_;

    /**
     * @brief Raise if the term uses a field standard ACLs cannot express
     */
    void validate() const;
};

} // namespace aclgen
