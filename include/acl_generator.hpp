/**
 * @file acl_generator.hpp
 * @brief Policy to Cisco access list document assembly
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the CiscoAclGenerator class, the entry point of the
 * rendering pipeline. It walks the filters of a policy, picks the term
 * renderer matching each filter type, validates filter names and emits the
 * access list declarations around the rendered terms.
 */

#pragma once

#include "acl_term.hpp"
#include "object_group.hpp"
#include "policy.hpp"
#include <string>
#include <vector>

namespace aclgen {

/**
 * @struct GeneratorOptions
 * @brief Behaviour switches of the generator
 */
struct GeneratorOptions {
    /**
     * Stop after the first filter targeting the platform. Older generators
     * returned from inside the filter loop and only ever rendered one filter;
     * this switch reproduces that output for comparisons.
     */
    bool first_filter_only = false;

    /**
     * Treat protocol names missing from the protocol table as errors instead
     * of passing them through.
     */
    bool strict_protocols = false;
};

/**
 * @brief Filter types accepted as the second option of a cisco target
 *
 * extended, standard, object-group, inet6 and mixed. A mixed filter is
 * rendered twice from the same terms: as an extended IPv4 access list,
 * then as an IPv6 access list.
 */
const std::vector<std::string>& supportedFilterTypes();

/**
 * @class CiscoAclGenerator
 * @brief Renders a policy into one Cisco IOS configuration document
 *
 * The document layout is:
 * - two version control marker lines ("! $Id:$", "! $Date:$")
 * - object-group definitions, if any filter is of type object-group
 * - per filter: removal and declaration statements, header remarks, terms,
 *   and an empty line closing the block
 *
 * Any error aborts the whole render; a partial access list is never returned.
 */
class CiscoAclGenerator {
public:
    /**
     * @brief Prepare a policy for rendering
     * @param policy Policy as loaded; it is copied and never modified
     * @param options Behaviour switches
     * @throws NoCiscoPolicyError if no filter header targets the cisco platform
     *
     * The established preprocessing runs here, once, on the private copy.
     */
    explicit CiscoAclGenerator(const Policy& policy, GeneratorOptions options = GeneratorOptions{});

    /**
     * @brief Render the complete document
     * @return Configuration text, newline terminated
     * @throws UnsupportedCiscoAccessListError for unknown filter types or
     *         filter names invalid for their type
     * @throws StandardAclTermError for terms a standard access list cannot express
     * @throws UnknownProtocolError for unknown protocols in strict mode
     *
     * Warnings of the previous render are discarded.
     */
    std::string render();

    /**
     * @brief Diagnostics recorded by the last render
     */
    const std::vector<RenderWarning>& warnings() const { return warnings_; }

    /**
     * @brief Policy after preprocessing
     */
    const Policy& policy() const { return policy_; }

    /**
     * @brief Filter type of a header, "extended" when none is declared
     */
    static std::string filterType(const FilterHeader& header);

    /**
     * @brief Check a filter name against the numbering rules of a filter type
     * @param filter_name Name of the access list
     * @param filter_type extended, object-group, standard or inet6
     * @throws UnsupportedCiscoAccessListError if numbers 1-99 are used for an
     *         extended or object-group list, or a standard list is not
     *         numbered within 1-99
     */
    static void validateFilterName(const std::string& filter_name, const std::string& filter_type);

private:
    Policy policy_;
    GeneratorOptions options_;
    std::vector<RenderWarning> warnings_;

    /**
     * @brief Render one access list block of a filter
     * @param filter Filter to render
     * @param filter_type Concrete type of this block (mixed is already expanded)
     * @param mixed Whether the block is one half of a mixed filter
     * @param context Rendering context of the document
     * @param groups Object group collector of the document
     * @param lines Output lines to extend
     */
    void renderBlock(const Filter& filter,
                     const std::string& filter_type,
                     bool mixed,
                     RenderContext& context,
                     ObjectGroupCollector& groups,
                     std::vector<std::string>& lines) const;
};

} // namespace aclgen
