/*
 * gatedrepl C++ - Security Filter
 *
 * Ordered substring denylist applied to submitted code before review.
 * This is a fast first-pass filter only: it matches text, not meaning, and
 * cannot see obfuscated or indirect equivalents of a denied operation. The
 * isolation boundary is the interpreter's capability-restricted symbol
 * table, not this list.
 */
#ifndef gatedrepl_REPL_SECURITY_FILTER_HPP
#define gatedrepl_REPL_SECURITY_FILTER_HPP

#include <gatedrepl/core/config.hpp>

#include <string>
#include <vector>

namespace gatedrepl {

enum class SecurityLevel {
    NONE,       // every submission allowed, no review
    BASIC,      // denylist applied, clean code approved automatically
    STRICT      // denylist applied, clean code waits for a reviewer
};

// Persisted names: "none", "basic", "strict"
const char* security_level_name(SecurityLevel level);
bool parse_security_level(const std::string& name, SecurityLevel& out);

struct DenyRule {
    std::string pattern;
    std::string reason;

    DenyRule() {}
    DenyRule(const std::string& p, const std::string& r) : pattern(p), reason(r) {}
};

struct SecurityCheck {
    bool allowed;
    std::string reason;
    std::string matched;    // denylist pattern that fired (empty when allowed)

    SecurityCheck() : allowed(true) {}
};

class SecurityFilter {
public:
    // Uses the default denylist
    SecurityFilter();
    explicit SecurityFilter(const std::vector<DenyRule>& rules);

    // repl.denylist overrides the default list when present
    static SecurityFilter from_config(const Config& cfg);
    static const std::vector<DenyRule>& default_rules();

    // First matching rule wins. NONE always allows.
    SecurityCheck check(const std::string& code, SecurityLevel level) const;

    const std::vector<DenyRule>& rules() const { return rules_; }

private:
    std::vector<DenyRule> rules_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_SECURITY_FILTER_HPP
