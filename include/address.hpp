/**
 * @file address.hpp
 * @brief IPv4/IPv6 network address value type for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the Address class used by every renderer to describe
 * source and destination networks, together with the address arithmetic
 * (containment and exclusion) needed to compute effective address sets.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace aclgen {

/**
 * @enum AddressFamily
 * @brief Discriminator for the two supported address families
 */
enum class AddressFamily {
    IPv4, ///< 32-bit addresses, rendered with dotted masks
    IPv6  ///< 128-bit addresses, rendered with prefix lengths
};

/**
 * @class Address
 * @brief Immutable network prefix with identity tokens
 *
 * An Address is a network value plus a prefix length. Host bits are cleared
 * on construction, so 10.1.2.3/24 and 10.1.2.0/24 are the same Address.
 *
 * Two identity tokens travel with every address:
 * - token: the symbolic name the address was resolved from
 * - parent_token: the name of the term-level group the address belongs to;
 *   object-group ACLs collapse all siblings sharing a parent_token into one
 *   named group
 */
class Address {
public:
    /**
     * @brief Parse an address in CIDR notation
     * @param cidr Address text such as "10.0.0.0/8", "192.0.2.1" or "2001:db8::/32"
     * @param token Symbolic name of the address
     * @param parent_token Group name; defaults to token when empty
     * @throws std::invalid_argument if the text is not a valid address or prefix
     *
     * A missing prefix length means a single host (/32 or /128).
     */
    explicit Address(const std::string& cidr,
                     const std::string& token = "",
                     const std::string& parent_token = "");

    AddressFamily family() const { return family_; }
    int prefixLength() const { return prefix_length_; }
    const std::string& token() const { return token_; }
    const std::string& parentToken() const { return parent_token_; }

    /**
     * @brief Maximum prefix length for the family (32 or 128)
     */
    int maxPrefixLength() const;

    /**
     * @brief Check whether the prefix covers exactly one host
     */
    bool isHost() const { return prefix_length_ == maxPrefixLength(); }

    /**
     * @brief Number of addresses covered by the prefix, saturated at UINT64_MAX
     */
    uint64_t numHosts() const;

    /**
     * @brief Network address in canonical text form
     */
    std::string ip() const;

    /**
     * @brief Netmask text (255.255.255.0 for IPv4, ffff:ffff:: style for IPv6)
     */
    std::string netmask() const;

    /**
     * @brief Hostmask (wildcard mask) text, the inverse of the netmask
     */
    std::string hostmask() const;

    /**
     * @brief CIDR text, e.g. "10.0.0.0/8"
     */
    std::string toString() const;

    /**
     * @brief Check whether this prefix fully covers another prefix
     * @param other Prefix to test
     * @return true if both share a family and other lies inside this network
     */
    bool contains(const Address& other) const;

    /**
     * @brief Split the prefix into its two halves
     * @return Lower and upper half, each one bit longer, keeping the tokens
     * @throws std::logic_error when called on a host prefix
     */
    std::pair<Address, Address> split() const;

    /**
     * @brief Copy of this address carrying different identity tokens
     */
    Address withTokens(const std::string& token, const std::string& parent_token) const;

    bool operator==(const Address& other) const;
    bool operator!=(const Address& other) const { return !(*this == other); }
    bool operator<(const Address& other) const;

private:
    /**
     * @brief Clear every bit past the prefix length
     */
    void maskHostBits();

    static std::string formatBytes(AddressFamily family, const std::array<uint8_t, 16>& bytes);

    AddressFamily family_ = AddressFamily::IPv4;
    std::array<uint8_t, 16> bytes_{};   ///< Network value, IPv4 uses the first 4 bytes
    int prefix_length_ = 0;
    std::string token_;
    std::string parent_token_;
};

/**
 * @brief Remove one prefix from a prefix that contains it
 * @param network Containing prefix
 * @param excluded Prefix to remove, must be covered by network
 * @return Minimal set of prefixes covering network minus excluded, sorted
 * @throws std::invalid_argument if excluded is not inside network
 */
std::vector<Address> excludeAddress(const Address& network, const Address& excluded);

/**
 * @brief Subtract a set of prefixes from another set of prefixes
 * @param addresses Positive address set
 * @param excluded Prefixes to remove
 * @return Remaining fragments, in the order of the positive set
 *
 * Addresses fully covered by an exclusion disappear, addresses containing an
 * exclusion are fragmented into minimal covering prefixes, and addresses that
 * do not overlap any exclusion are kept as they are. Fragments inherit the
 * tokens of the address they were cut from.
 */
std::vector<Address> excludeAddresses(const std::vector<Address>& addresses,
                                      const std::vector<Address>& excluded);

} // namespace aclgen
