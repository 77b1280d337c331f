#include "acl_term.hpp"
#include "errors.hpp"
#include "normalizer.hpp"
#include <map>
#include <stdexcept>

namespace aclgen {

const char* const kCiscoPlatform = "cisco";

namespace {

const std::map<Action, std::string> kActionTable = {
    {Action::Accept, "permit"},
    {Action::Deny, "deny"},
    {Action::Reject, "deny"},
    {Action::Next, "! next"},
    {Action::RejectWithTcpRst, "deny"},  // no tcp reset in IOS
};

} // namespace

std::string warningTypeToString(RenderWarning::Type type) {
    switch (type) {
        case RenderWarning::Type::IgnoredAddress:
            return "Ignored Address";
        case RenderWarning::Type::UnresolvedProtocol:
            return "Unresolved Protocol";
        case RenderWarning::Type::IgnoredExclusion:
            return "Ignored Exclusion";
        case RenderWarning::Type::SkippedFilter:
            return "Skipped Filter";
        default:
            throw std::runtime_error("Unknown warning type");
    }
}

std::vector<std::string> commentLines(const std::string& comment) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t newline;
    while ((newline = comment.find('\n', start)) != std::string::npos) {
        lines.push_back(comment.substr(start, newline - start));
        start = newline + 1;
    }
    lines.push_back(comment.substr(start));
    return lines;
}

const std::string& ciscoAction(Action action) {
    auto it = kActionTable.find(action);
    if (it == kActionTable.end()) {
        throw std::runtime_error("Unknown action");
    }
    return it->second;
}

void AclTerm::addRemarks(std::vector<std::string>& lines, size_t max_width) const {
    lines.push_back("remark " + term_.name);

    // Multi-line comments become one remark per line
    for (const auto& comment : term_.comments) {
        for (const auto& line : commentLines(comment)) {
            lines.push_back("remark " + line.substr(0, max_width));
        }
    }
}

bool AclTerm::addVerbatim(std::vector<std::string>& lines) const {
    if (term_.verbatim.empty()) {
        return false;
    }
    for (const auto& entry : term_.verbatim) {
        if (entry.platform == kCiscoPlatform) {
            lines.push_back(entry.text);
        }
    }
    return true;
}

std::vector<std::string> AclTerm::resolvedProtocols() const {
    if (term_.protocols.empty()) {
        return {"ip"};
    }

    std::vector<std::string> protocols;
    auto warn_unresolved = [this](const std::string& proto) {
        context_.warn(RenderWarning::Type::UnresolvedProtocol, term_.name,
                      "Protocol '" + proto + "' is not in the protocol table, rendered verbatim");
    };
    for (const auto& proto : term_.protocols) {
        try {
            protocols.push_back(resolveProtocol(proto, context_.strict_protocols, warn_unresolved));
        } catch (const UnknownProtocolError& e) {
            throw UnknownProtocolError(std::string(e.what()) + " (term " + term_.name + ")");
        }
    }
    return protocols;
}

} // namespace aclgen
