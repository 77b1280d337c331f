#include "policy_parser.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace aclgen {

Policy PolicyParser::loadFromFile(const std::string& filename) {
    try {
        // YAML::LoadFile throws YAML::BadFile when the file cannot be opened
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw PolicyParseError("YAML parsing error in " + filename + ": " + std::string(e.what()));
    }
}

Policy PolicyParser::loadFromString(const std::string& yaml_content) {
    try {
        return fromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw PolicyParseError("YAML parsing error: " + std::string(e.what()));
    }
}

Policy PolicyParser::fromNode(const YAML::Node& node) {
    try {
        // Conversion recurses through convert<Policy>, convert<Filter> and convert<Term>
        return node.as<Policy>();
    } catch (const YAML::Exception& e) {
        throw PolicyParseError("YAML parsing error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        // Invalid values (addresses, ports, actions) found while converting
        throw PolicyParseError("Policy loading error: " + std::string(e.what()));
    }
}

PortRange PolicyParser::parsePortRange(const std::string& text) {
    auto parse_port = [&text](const std::string& part) -> uint16_t {
        if (part.empty() || part.size() > 5 ||
            !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid port: " + text);
        }
        unsigned long value = std::stoul(part);
        if (value > 65535) {
            throw std::invalid_argument("Port out of range: " + text);
        }
        return static_cast<uint16_t>(value);
    };

    size_t dash_pos = text.find('-');
    if (dash_pos == std::string::npos) {
        uint16_t port = parse_port(text);
        return PortRange{port, port};
    }

    PortRange range{parse_port(text.substr(0, dash_pos)), parse_port(text.substr(dash_pos + 1))};
    if (range.low > range.high) {
        throw std::invalid_argument("Port range start is above its end: " + text);
    }
    return range;
}

} // namespace aclgen

// YAML conversion implementations
namespace YAML {

using namespace aclgen;

namespace {

std::vector<std::string> stringList(const Node& node) {
    if (node.IsScalar()) {
        return {node.as<std::string>()};
    }
    return node.as<std::vector<std::string>>();
}

std::vector<PortRange> portList(const Node& node) {
    if (node.IsScalar()) {
        return {node.as<PortRange>()};
    }
    return node.as<std::vector<PortRange>>();
}

std::vector<Address> addressList(const Node& node, const std::string& default_token) {
    std::vector<Address> addresses;
    if (!node) {
        return addresses;
    }
    if (node.IsScalar()) {
        addresses.emplace_back(node.as<std::string>(), default_token);
        return addresses;
    }

    for (const auto& item : node) {
        if (item.IsScalar()) {
            addresses.emplace_back(item.as<std::string>(), default_token);
        } else if (item.IsMap() && item["address"]) {
            std::string token = item["token"] ? item["token"].as<std::string>() : default_token;
            std::string parent = item["parent-token"] ? item["parent-token"].as<std::string>() : "";
            addresses.emplace_back(item["address"].as<std::string>(), token, parent);
        } else {
            throw std::invalid_argument("Address entries must be a CIDR string or a map with 'address'");
        }
    }
    return addresses;
}

} // namespace

bool convert<Action>::decode(const Node& node, Action& action) {
    if (!node.IsScalar()) return false;
    action = actionFromString(node.as<std::string>());
    return true;
}

bool convert<PortRange>::decode(const Node& node, PortRange& range) {
    if (!node.IsScalar()) return false;
    range = PolicyParser::parsePortRange(node.as<std::string>());
    return true;
}

bool convert<VerbatimEntry>::decode(const Node& node, VerbatimEntry& entry) {
    if (!node.IsMap()) return false;
    if (!node["platform"] || !node["text"]) return false;

    entry.platform = node["platform"].as<std::string>();
    entry.text = node["text"].as<std::string>();
    return true;
}

bool convert<Term>::decode(const Node& node, Term& term) {
    if (!node.IsMap()) return false;

    if (!node["name"]) return false;
    term.name = node["name"].as<std::string>();

    if (node["comment"]) {
        term.comments = stringList(node["comment"]);
    }
    if (node["action"]) {
        term.action = node["action"].as<Action>();
    } else {
        term.action = Action::Accept;  // default value
    }
    if (node["protocol"]) {
        term.protocols = stringList(node["protocol"]);
    }

    // Untokenized addresses are grouped per term and field
    term.address = addressList(node["address"], term.name + "-address");
    term.source_address = addressList(node["source-address"], term.name + "-source-address");
    term.source_address_exclude = addressList(node["source-exclude"], term.name + "-source-exclude");
    term.destination_address = addressList(node["destination-address"], term.name + "-destination-address");
    term.destination_address_exclude =
        addressList(node["destination-exclude"], term.name + "-destination-exclude");

    if (node["source-port"]) {
        term.source_port = portList(node["source-port"]);
    }
    if (node["destination-port"]) {
        term.destination_port = portList(node["destination-port"]);
    }
    if (node["option"]) {
        term.options = stringList(node["option"]);
    }
    if (node["logging"]) {
        term.logging = node["logging"].as<bool>();
    }
    if (node["counter"]) {
        term.counter = node["counter"].as<std::string>();
    }
    if (node["verbatim"]) {
        term.verbatim = node["verbatim"].as<std::vector<VerbatimEntry>>();
    }
    if (node["address-family"]) {
        std::string family = node["address-family"].as<std::string>();
        if (family == "inet") {
            term.address_family = AddressFamily::IPv4;
        } else if (family == "inet6") {
            term.address_family = AddressFamily::IPv6;
        } else {
            throw std::invalid_argument("Unknown address family '" + family + "' in term " + term.name);
        }
    }

    return true;
}

bool convert<FilterHeader>::decode(const Node& node, FilterHeader& header) {
    if (!node.IsMap()) return false;
    if (!node["targets"] || !node["targets"].IsMap()) return false;

    // Preserve the declared option order of every target
    header.targets.clear();
    for (const auto& target : node["targets"]) {
        std::string platform = target.first.as<std::string>();
        std::vector<std::string> options;
        if (target.second.IsScalar()) {
            std::istringstream words(target.second.as<std::string>());
            std::string word;
            while (words >> word) {
                options.push_back(word);
            }
        } else if (target.second.IsSequence()) {
            options = target.second.as<std::vector<std::string>>();
        }
        if (options.empty()) {
            throw std::invalid_argument("Target '" + platform + "' must name its filter");
        }
        header.targets[platform] = options;
    }

    if (node["comment"]) {
        header.comments = stringList(node["comment"]);
    }
    return true;
}

bool convert<Filter>::decode(const Node& node, Filter& filter) {
    if (!node.IsMap()) return false;
    if (!node["header"]) return false;

    filter.header = node["header"].as<FilterHeader>();
    if (node["terms"]) {
        filter.terms = node["terms"].as<std::vector<Term>>();
    }
    return true;
}

bool convert<Policy>::decode(const Node& node, Policy& policy) {
    if (!node.IsMap()) return false;
    if (!node["filters"] || !node["filters"].IsSequence()) return false;

    policy.filters = node["filters"].as<std::vector<Filter>>();
    return true;
}

} // namespace YAML
