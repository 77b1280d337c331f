#include "address.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <tuple>
#include <arpa/inet.h>

namespace aclgen {

namespace {

constexpr int kIPv4Bytes = 4;
constexpr int kIPv6Bytes = 16;

int byteCount(AddressFamily family) {
    return family == AddressFamily::IPv4 ? kIPv4Bytes : kIPv6Bytes;
}

// Bit 0 is the most significant bit of the first byte
void setBit(std::array<uint8_t, 16>& bytes, int bit) {
    bytes[bit / 8] |= static_cast<uint8_t>(0x80u >> (bit % 8));
}

std::array<uint8_t, 16> maskBytes(AddressFamily family, int prefix_length) {
    std::array<uint8_t, 16> mask{};
    for (int bit = 0; bit < prefix_length && bit < byteCount(family) * 8; ++bit) {
        setBit(mask, bit);
    }
    return mask;
}

} // namespace

Address::Address(const std::string& cidr,
                 const std::string& token,
                 const std::string& parent_token)
    : token_(token)
    , parent_token_(parent_token.empty() ? token : parent_token) {
    // Split "ip/prefix" into its two components
    // A bare IP address denotes a single host of its family
    std::string ip_str = cidr;
    std::string prefix_str;
    size_t slash_pos = cidr.find('/');
    if (slash_pos != std::string::npos) {
        ip_str = cidr.substr(0, slash_pos);
        prefix_str = cidr.substr(slash_pos + 1);
    }

    // The presence of a colon decides the family before handing off to inet_pton
    if (ip_str.find(':') != std::string::npos) {
        family_ = AddressFamily::IPv6;
        struct in6_addr addr6;
        if (inet_pton(AF_INET6, ip_str.c_str(), &addr6) != 1) {
            throw std::invalid_argument("Invalid IPv6 address: " + cidr);
        }
        std::copy(addr6.s6_addr, addr6.s6_addr + kIPv6Bytes, bytes_.begin());
    } else {
        family_ = AddressFamily::IPv4;
        struct in_addr addr4;
        if (inet_pton(AF_INET, ip_str.c_str(), &addr4) != 1) {
            throw std::invalid_argument("Invalid IPv4 address: " + cidr);
        }
        const auto* raw = reinterpret_cast<const uint8_t*>(&addr4.s_addr);
        std::copy(raw, raw + kIPv4Bytes, bytes_.begin());
    }

    prefix_length_ = maxPrefixLength();
    if (slash_pos != std::string::npos) {
        if (prefix_str.empty() || prefix_str.size() > 3 ||
            !std::all_of(prefix_str.begin(), prefix_str.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid prefix length: " + cidr);
        }
        int prefix = std::stoi(prefix_str);
        if (prefix > maxPrefixLength()) {
            throw std::invalid_argument("Prefix length out of range: " + cidr);
        }
        prefix_length_ = prefix;
    }

    maskHostBits();
}

int Address::maxPrefixLength() const {
    return byteCount(family_) * 8;
}

uint64_t Address::numHosts() const {
    int host_bits = maxPrefixLength() - prefix_length_;
    if (host_bits >= 64) {
        return std::numeric_limits<uint64_t>::max();
    }
    return uint64_t{1} << host_bits;
}

std::string Address::ip() const {
    return formatBytes(family_, bytes_);
}

std::string Address::netmask() const {
    return formatBytes(family_, maskBytes(family_, prefix_length_));
}

std::string Address::hostmask() const {
    std::array<uint8_t, 16> mask = maskBytes(family_, prefix_length_);
    for (int i = 0; i < byteCount(family_); ++i) {
        mask[i] = static_cast<uint8_t>(~mask[i]);
    }
    return formatBytes(family_, mask);
}

std::string Address::toString() const {
    return ip() + "/" + std::to_string(prefix_length_);
}

bool Address::contains(const Address& other) const {
    if (family_ != other.family_ || prefix_length_ > other.prefix_length_) {
        return false;
    }
    // Compare the leading prefix_length_ bits of both values
    std::array<uint8_t, 16> mask = maskBytes(family_, prefix_length_);
    for (int i = 0; i < byteCount(family_); ++i) {
        if ((bytes_[i] & mask[i]) != (other.bytes_[i] & mask[i])) {
            return false;
        }
    }
    return true;
}

std::pair<Address, Address> Address::split() const {
    if (isHost()) {
        throw std::logic_error("Cannot split host prefix " + toString());
    }
    Address lower = *this;
    lower.prefix_length_ = prefix_length_ + 1;

    Address upper = lower;
    setBit(upper.bytes_, prefix_length_);
    return {lower, upper};
}

Address Address::withTokens(const std::string& token, const std::string& parent_token) const {
    Address copy = *this;
    copy.token_ = token;
    copy.parent_token_ = parent_token.empty() ? token : parent_token;
    return copy;
}

bool Address::operator==(const Address& other) const {
    return family_ == other.family_ &&
           prefix_length_ == other.prefix_length_ &&
           bytes_ == other.bytes_;
}

bool Address::operator<(const Address& other) const {
    return std::tie(family_, bytes_, prefix_length_) <
           std::tie(other.family_, other.bytes_, other.prefix_length_);
}

void Address::maskHostBits() {
    std::array<uint8_t, 16> mask = maskBytes(family_, prefix_length_);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        bytes_[i] &= mask[i];
    }
}

std::string Address::formatBytes(AddressFamily family, const std::array<uint8_t, 16>& bytes) {
    char buffer[INET6_ADDRSTRLEN];
    int af = family == AddressFamily::IPv4 ? AF_INET : AF_INET6;
    if (inet_ntop(af, bytes.data(), buffer, sizeof(buffer)) == nullptr) {
        throw std::runtime_error("Unable to format address");
    }
    return buffer;
}

std::vector<Address> excludeAddress(const Address& network, const Address& excluded) {
    if (!network.contains(excluded)) {
        throw std::invalid_argument(excluded.toString() + " is not contained in " + network.toString());
    }

    std::vector<Address> fragments;
    if (network == excluded) {
        return fragments;
    }

    // Walk down from the containing network towards the excluded prefix
    // At every level the half that does not hold the excluded prefix is kept whole
    auto halves = network.split();
    while (halves.first != excluded && halves.second != excluded) {
        if (halves.first.contains(excluded)) {
            fragments.push_back(halves.second);
            halves = halves.first.split();
        } else {
            fragments.push_back(halves.first);
            halves = halves.second.split();
        }
    }
    fragments.push_back(halves.first == excluded ? halves.second : halves.first);

    std::sort(fragments.begin(), fragments.end());
    return fragments;
}

std::vector<Address> excludeAddresses(const std::vector<Address>& addresses,
                                      const std::vector<Address>& excluded) {
    std::vector<Address> remaining = addresses;

    // Apply every exclusion to the whole working set in turn
    // so overlapping exclusions keep fragmenting earlier results
    for (const auto& exclude : excluded) {
        std::vector<Address> next;
        for (const auto& addr : remaining) {
            if (exclude.contains(addr)) {
                continue;  // Entirely removed
            }
            if (addr.contains(exclude)) {
                for (const auto& fragment : excludeAddress(addr, exclude)) {
                    next.push_back(fragment);
                }
                continue;
            }
            next.push_back(addr);
        }
        remaining = std::move(next);
    }
    return remaining;
}

} // namespace aclgen
