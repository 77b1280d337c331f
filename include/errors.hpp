/**
 * @file errors.hpp
 * @brief Exception types raised by aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * Every fatal condition in the generator is reported through one of these
 * exceptions. None of them is recoverable: a policy that raises one of them
 * must not produce an access list.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace aclgen {

/**
 * @struct AclError
 * @brief Base class of all generator errors
 */
struct AclError : public std::runtime_error {
    explicit AclError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct NoCiscoPolicyError
 * @brief No filter header in the policy targets the Cisco platform
 */
struct NoCiscoPolicyError : public AclError {
    explicit NoCiscoPolicyError(const std::string& message) : AclError(message) {}
};

/**
 * @struct UnsupportedCiscoAccessListError
 * @brief Unknown filter subtype or a filter name invalid for its subtype
 */
struct UnsupportedCiscoAccessListError : public AclError {
    explicit UnsupportedCiscoAccessListError(const std::string& message) : AclError(message) {}
};

/**
 * @struct StandardAclTermError
 * @brief A term uses a match field that standard access lists cannot express
 */
struct StandardAclTermError : public AclError {
    explicit StandardAclTermError(const std::string& message) : AclError(message) {}
};

/**
 * @struct UnknownProtocolError
 * @brief Protocol name could not be resolved while strict resolution is on
 */
struct UnknownProtocolError : public AclError {
    explicit UnknownProtocolError(const std::string& message) : AclError(message) {}
};

/**
 * @struct PolicyParseError
 * @brief The YAML policy document is malformed or holds invalid values
 */
struct PolicyParseError : public AclError {
    explicit PolicyParseError(const std::string& message) : AclError(message) {}
};

} // namespace aclgen
