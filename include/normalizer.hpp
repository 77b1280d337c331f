/**
 * @file normalizer.hpp
 * @brief Protocol, address and port normalization ahead of rendering
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the free functions that turn the raw match fields of a
 * Term into the values the renderers iterate over: resolved protocol names,
 * family-filtered address sets with exclusions applied, and port lists with
 * explicit "unrestricted" sentinels.
 */

#pragma once

#include "policy.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace aclgen {

/**
 * @brief An address position in a rendered statement
 *
 * std::nullopt stands for "any" and matches both address families.
 */
using AddressMatch = std::optional<Address>;

/**
 * @brief A port position in a rendered statement
 *
 * std::nullopt stands for "no port restriction", which is not the same
 * thing as matching port 0.
 */
using PortMatch = std::optional<PortRange>;

/**
 * @brief Destination range appended to terms using the established option
 */
constexpr PortRange kHighPorts{1024, 65535};

/**
 * @brief Check whether a protocol name is accepted literally by IOS
 */
bool isLiteralProtocol(const std::string& name);

/**
 * @brief Look up the platform form of a protocol
 * @param name Protocol name or number, e.g. "tcp", "ipv6-icmp", "47"
 * @return Unchanged name for numbers and IOS keywords, the protocol number
 *         from the system protocol table otherwise, std::nullopt if unknown
 */
std::optional<std::string> lookupProtocol(const std::string& name);

/**
 * @brief Callback invoked with a protocol name that passes through unresolved
 */
using UnresolvedProtocolHandler = std::function<void(const std::string&)>;

/**
 * @brief Resolve a protocol name for rendering
 * @param name Protocol name or number
 * @param strict Raise instead of passing unknown names through
 * @param on_unresolved Called before an unknown name is passed through
 * @return Resolved protocol text
 * @throws UnknownProtocolError if strict is set and the name is unknown
 */
std::string resolveProtocol(const std::string& name,
                            bool strict = false,
                            const UnresolvedProtocolHandler& on_unresolved = nullptr);

/**
 * @brief Check whether TCP is among already resolved protocols
 */
bool isTcp(const std::vector<std::string>& protocols);

/**
 * @brief Address set of one field for one rendering pass
 * @param term Term to read
 * @param field Source or destination
 * @param family Family of the pass
 * @return Family-filtered addresses minus same-family exclusions, or a single
 *         "any" entry when the term does not restrict the field
 *
 * A field whose addresses are all of the other family (or are all removed
 * by exclusions) yields an empty list, so the term produces no statement
 * for that pass.
 */
std::vector<AddressMatch> effectiveAddresses(const Term& term, AddressField field, AddressFamily family);

/**
 * @brief Port set of one field
 * @return Configured ranges, or a single "no restriction" entry
 */
std::vector<PortMatch> effectivePorts(const Term& term, AddressField field);

/**
 * @brief Apply the stateless compensation for the established option
 * @param policy Policy as loaded
 * @return Copy in which every term with an option starting with
 *         "established" also matches destination ports 1024-65535
 *
 * Runs once per policy, before any rendering takes place.
 */
Policy normalizeEstablished(const Policy& policy);

} // namespace aclgen
