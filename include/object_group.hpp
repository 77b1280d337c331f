/**
 * @file object_group.hpp
 * @brief Object group definitions for object-group access lists
 * @author aclgen Development Team
 * @date 2024
 */

#pragma once

#include "policy.hpp"
#include <string>
#include <vector>

namespace aclgen {

/**
 * @class ObjectGroupCollector
 * @brief Collects object-group terms and renders each named group once
 *
 * Address groups are named after the parent token of their addresses and
 * port groups after their range:
 *
 *   object-group ip address CORP_NETS
 *    10.0.0.0 255.0.0.0
 *    172.16.0.0 255.240.0.0
 *   exit
 *
 *   object-group ip port 1024-65535
 *    range 1024 65535
 *   exit
 *
 * Groups appear in the order terms were added, address groups of a term
 * (source, then destination) before its port groups. A group referenced by
 * several terms, or by several filters of the same document, is emitted
 * only for its first occurrence. A collector belongs to one document
 * render and must not be shared between renders.
 */
class ObjectGroupCollector {
public:
    /**
     * @brief Register an object-group access list rendered in this document
     */
    void addFilterName(const std::string& filter_name);

    /**
     * @brief Queue a term whose groups must be defined
     */
    void addTerm(const Term& term);

    /**
     * @brief Check whether any term has been collected
     */
    bool valid() const { return !terms_.empty(); }

    /**
     * @brief Render the group definitions
     * @return Configuration lines, each block followed by an empty line
     */
    std::vector<std::string> render() const;

    const std::vector<std::string>& filterNames() const { return filter_names_; }

private:
    std::vector<std::string> filter_names_;
    std::vector<Term> terms_;
};

} // namespace aclgen
