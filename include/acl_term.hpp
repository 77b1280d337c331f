/**
 * @file acl_term.hpp
 * @brief Base term renderer and rendering context for aclgen
 * @author aclgen Development Team
 * @date 2024
 *
 * This file contains the abstract AclTerm base class shared by the extended,
 * standard and object-group term renderers, the RenderContext that carries
 * options and diagnostics through one document render, and the fixed action
 * table of the Cisco platform.
 */

#pragma once

#include "policy.hpp"
#include <string>
#include <vector>

namespace aclgen {

/**
 * @brief Platform name matched against filter targets and verbatim entries
 */
extern const char* const kCiscoPlatform;

/**
 * @struct RenderWarning
 * @brief Non-fatal diagnostic produced while rendering
 *
 * A warning always means that part of the input was left out of the output
 * or passed through unchecked. Rendering continues after recording it.
 */
struct RenderWarning {
    /**
     * @enum Type
     * @brief Categories of diagnostics
     */
    enum class Type {
        IgnoredAddress,      ///< Address dropped because the ACL type cannot express it
        UnresolvedProtocol,  ///< Protocol name passed through without resolution
        IgnoredExclusion,    ///< Address exclusions not applied in this ACL type
        SkippedFilter        ///< Filter does not target this platform
    };

    Type type;
    std::string term;     ///< Term (or filter) the warning refers to
    std::string message;  ///< Human readable description
};

/**
 * @brief Label of a warning type as printed by the command line front end
 */
std::string warningTypeToString(RenderWarning::Type type);

/**
 * @struct RenderContext
 * @brief Settings and diagnostics shared by all renderers of one document
 */
struct RenderContext {
    bool strict_protocols = false;       ///< Unknown protocol names are fatal
    std::vector<RenderWarning> warnings; ///< Diagnostics in emission order

    void warn(RenderWarning::Type type, const std::string& term, const std::string& message) {
        warnings.push_back(RenderWarning{type, term, message});
    }
};

/**
 * @brief Split comment text into remark lines
 *
 * Every newline starts a new line, so empty lines and a trailing newline
 * each produce an empty entry. An empty comment yields one empty line.
 */
std::vector<std::string> commentLines(const std::string& comment);

/**
 * @brief Cisco keyword for a term action
 *
 * accept maps to permit; deny, reject and reject-with-tcp-rst map to deny
 * (IOS has no reset action); next renders as the no-op comment "! next".
 */
const std::string& ciscoAction(Action action);

/**
 * @class AclTerm
 * @brief Abstract base class for all term renderers
 *
 * A term renderer turns one Term into the configuration lines of one ACL
 * type. The base class provides the pieces every ACL type shares: remark
 * lines, verbatim short-circuiting, protocol resolution and action mapping.
 */
class AclTerm {
public:
    virtual ~AclTerm() = default;

    /**
     * @brief Render the term
     * @return Configuration lines in output order
     */
    virtual std::vector<std::string> render() const = 0;

protected:
    /**
     * @brief Protected constructor for derived classes
     * @param term Term to render, must outlive the renderer
     * @param context Context receiving diagnostics, must outlive the renderer
     */
    AclTerm(const Term& term, RenderContext& context)
        : term_(term)
        , context_(context) {}

    /**
     * @brief Append the remark block naming and describing the term
     * @param lines Output lines to extend
     * @param max_width Comment lines are cut to this many characters
     */
    void addRemarks(std::vector<std::string>& lines, size_t max_width = std::string::npos) const;

    /**
     * @brief Append verbatim text for this platform if the term is verbatim
     * @param lines Output lines to extend
     * @return true if the term is a verbatim term and rendering must stop
     *
     * A verbatim term contributes only the text of its entries targeting
     * this platform; entries for other platforms are skipped.
     */
    bool addVerbatim(std::vector<std::string>& lines) const;

    /**
     * @brief Protocols of the term in their platform form
     * @return Resolved protocols, or {"ip"} if the term sets none
     * @throws UnknownProtocolError in strict mode
     */
    std::vector<std::string> resolvedProtocols() const;

    const Term& term_;
    RenderContext& context_;
};

} // namespace aclgen
