/**
 * @file policy_parser.hpp
 * @brief YAML loading of the filter model for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the PolicyParser class and the yaml-cpp conversions
 * that turn a YAML policy document into a Policy. A document looks like:
 *
 * @code{.yaml}
 * filters:
 *   - header:
 *       targets:
 *         cisco: [edge-inbound, extended]
 *       comment: ["Inbound edge filter"]
 *     terms:
 *       - name: allow-web
 *         action: accept
 *         protocol: [tcp]
 *         destination-address: [{address: 192.0.2.0/24, token: WEB_SERVERS}]
 *         destination-port: [80, 443]
 * @endcode
 */

#pragma once

#include "policy.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace aclgen {

/**
 * @class PolicyParser
 * @brief Loads Policy objects from YAML files or strings
 */
class PolicyParser {
public:
    /**
     * @brief Load a policy from a YAML file
     * @param filename Path to the policy document
     * @return Parsed policy
     * @throws PolicyParseError if the file cannot be read, is not valid YAML,
     *         or holds invalid values (unknown action, bad address or port)
     */
    static Policy loadFromFile(const std::string& filename);

    /**
     * @brief Load a policy from YAML text
     * @param yaml_content Policy document
     * @return Parsed policy
     * @throws PolicyParseError on the same conditions as loadFromFile
     */
    static Policy loadFromString(const std::string& yaml_content);

    /**
     * @brief Parse a port entry such as "80" or "1024-65535"
     * @throws std::invalid_argument if the text is not a port or a valid range
     */
    static PortRange parsePortRange(const std::string& text);

private:
    /**
     * @brief Convert a loaded YAML document and wrap conversion errors
     */
    static Policy fromNode(const YAML::Node& node);
};

} // namespace aclgen

namespace YAML {

/**
 * @brief YAML conversion for Action enum
 *
 * Accepts accept, deny, reject, next and reject-with-tcp-rst.
 */
template<>
struct convert<aclgen::Action> {
    static bool decode(const Node& node, aclgen::Action& action);
};

/**
 * @brief YAML conversion for PortRange, from "P" or "L-H"
 */
template<>
struct convert<aclgen::PortRange> {
    static bool decode(const Node& node, aclgen::PortRange& range);
};

/**
 * @brief YAML conversion for VerbatimEntry, a map with platform and text
 */
template<>
struct convert<aclgen::VerbatimEntry> {
    static bool decode(const Node& node, aclgen::VerbatimEntry& entry);
};

/**
 * @brief YAML conversion for Term
 *
 * Address lists accept plain CIDR strings or maps with address, token and
 * parent-token. Addresses without a token are named after the term and the
 * field they appear in, e.g. "allow-web-destination-address".
 */
template<>
struct convert<aclgen::Term> {
    static bool decode(const Node& node, aclgen::Term& term);
};

/**
 * @brief YAML conversion for FilterHeader
 *
 * Target options are given as a list or as one whitespace separated string.
 */
template<>
struct convert<aclgen::FilterHeader> {
    static bool decode(const Node& node, aclgen::FilterHeader& header);
};

/**
 * @brief YAML conversion for Filter, a map with header and terms
 */
template<>
struct convert<aclgen::Filter> {
    static bool decode(const Node& node, aclgen::Filter& filter);
};

/**
 * @brief YAML conversion for Policy, a map with a filters list
 */
template<>
struct convert<aclgen::Policy> {
    static bool decode(const Node& node, aclgen::Policy& policy);
};

} // namespace YAML
