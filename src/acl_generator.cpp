#include "acl_generator.hpp"
#include "errors.hpp"
#include "extended_term.hpp"
#include "normalizer.hpp"
#include "object_group_term.hpp"
#include "standard_term.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <utility>

namespace aclgen {

namespace {

// Concatenated so that version control does not expand the markers in this file
const std::string kIdMarker = std::string("! $I") + "d:$";
const std::string kDateMarker = std::string("! $Da") + "te:$";

// Numbered access lists 1-99 are reserved for standard access lists
bool isStandardNumber(const std::string& filter_name) {
    if (filter_name.empty() ||
        !std::all_of(filter_name.begin(), filter_name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    auto first = filter_name.find_first_not_of('0');
    if (first == std::string::npos) {
        return false;  // all zeros
    }
    if (filter_name.size() - first > 2) {
        return false;
    }
    int number = std::stoi(filter_name.substr(first));
    return number >= 1 && number <= 99;
}

} // namespace

const std::vector<std::string>& supportedFilterTypes() {
    static const std::vector<std::string> types = {
        "extended", "standard", "object-group", "inet6", "mixed",
    };
    return types;
}

CiscoAclGenerator::CiscoAclGenerator(const Policy& policy, GeneratorOptions options)
    : options_(options) {
    // Refuse policies not meant for this platform before doing any work
    bool targeted = std::any_of(policy.filters.begin(), policy.filters.end(), [](const Filter& filter) {
        return filter.header.targetsPlatform(kCiscoPlatform);
    });
    if (!targeted) {
        throw NoCiscoPolicyError("No filter in the policy targets the cisco platform");
    }

    policy_ = normalizeEstablished(policy);
}

std::string CiscoAclGenerator::filterType(const FilterHeader& header) {
    auto options = header.filterOptions(kCiscoPlatform);
    if (options.size() > 1) {
        return options[1];
    }
    return "extended";
}

void CiscoAclGenerator::validateFilterName(const std::string& filter_name, const std::string& filter_type) {
    if (filter_type == "extended" || filter_type == "object-group") {
        if (isStandardNumber(filter_name)) {
            throw UnsupportedCiscoAccessListError(
                "access-lists between 1-99 are reserved for standard ACLs (filter " + filter_name + ")");
        }
    } else if (filter_type == "standard") {
        if (!isStandardNumber(filter_name)) {
            throw UnsupportedCiscoAccessListError(
                "standard access lists must be numbered between 1 - 99 (filter " + filter_name + ")");
        }
    }
}

std::string CiscoAclGenerator::render() {
    warnings_.clear();

    RenderContext context;
    context.strict_protocols = options_.strict_protocols;
    ObjectGroupCollector groups;
    std::vector<std::string> lines;

    for (const auto& filter : policy_.filters) {
        if (!filter.header.targetsPlatform(kCiscoPlatform)) {
            context.warn(RenderWarning::Type::SkippedFilter, "",
                         "Skipping filter without a cisco target");
            continue;
        }

        // Resolve and check the filter type before emitting anything for it
        std::string filter_type = filterType(filter.header);
        const auto& supported = supportedFilterTypes();
        if (std::find(supported.begin(), supported.end(), filter_type) == supported.end()) {
            throw UnsupportedCiscoAccessListError("Unsupported access list type '" + filter_type +
                                                  "'; supported types are extended, standard, "
                                                  "object-group, inet6 and mixed");
        }

        if (filter_type == "mixed") {
            renderBlock(filter, "extended", true, context, groups, lines);
            renderBlock(filter, "inet6", true, context, groups, lines);
        } else {
            renderBlock(filter, filter_type, false, context, groups, lines);
        }

        if (options_.first_filter_only) {
            break;
        }
    }

    // Object group definitions must precede every access list referencing them
    if (groups.valid()) {
        std::vector<std::string> definitions = groups.render();
        lines.insert(lines.begin(), definitions.begin(), definitions.end());
    }
    lines.insert(lines.begin(), {kIdMarker, kDateMarker});

    warnings_ = std::move(context.warnings);

    std::ostringstream document;
    for (const auto& line : lines) {
        document << line << '\n';
    }
    return document.str();
}

void CiscoAclGenerator::renderBlock(const Filter& filter,
                                    const std::string& filter_type,
                                    bool mixed,
                                    RenderContext& context,
                                    ObjectGroupCollector& groups,
                                    std::vector<std::string>& lines) const {
    const std::string filter_name = filter.header.filterName(kCiscoPlatform);
    validateFilterName(filter_name, filter_type);

    // Remove any previous definition, then declare the access list
    if (filter_type == "extended") {
        lines.push_back("no ip access-list extended " + filter_name);
        lines.push_back("ip access-list extended " + filter_name);
    } else if (filter_type == "standard") {
        lines.push_back("no ip access-list " + filter_name);
    } else if (filter_type == "object-group") {
        groups.addFilterName(filter_name);
        lines.push_back("no ip access-list extended " + filter_name);
        lines.push_back("ip access-list extended " + filter_name);
    } else if (filter_type == "inet6") {
        lines.push_back("no ipv6 access-list " + filter_name);
        lines.push_back("ipv6 access-list " + filter_name);
    }

    for (const auto& comment : filter.header.comments) {
        for (const auto& line : commentLines(comment)) {
            lines.push_back("remark " + line);
        }
    }

    const AddressFamily family = filter_type == "inet6" ? AddressFamily::IPv6 : AddressFamily::IPv4;
    for (const auto& term : filter.terms) {
        // Each half of a mixed filter only carries terms meant for its family
        if (mixed && term.address_family && *term.address_family != family) {
            continue;
        }

        std::unique_ptr<AclTerm> renderer;
        if (filter_type == "standard") {
            renderer = std::make_unique<StandardTerm>(term, filter_name, context);
        } else if (filter_type == "object-group") {
            groups.addTerm(term);
            renderer = std::make_unique<ObjectGroupTerm>(term, filter_name, context);
        } else {
            renderer = std::make_unique<ExtendedTerm>(term, context, family);
        }

        std::vector<std::string> term_lines = renderer->render();
        lines.insert(lines.end(), term_lines.begin(), term_lines.end());
    }

    lines.push_back("");
}

} // namespace aclgen
