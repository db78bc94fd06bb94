/*
 * gatedrepl C++ - Security Filter Implementation
 */
#include <gatedrepl/repl/security_filter.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

namespace gatedrepl {

const char* security_level_name(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::NONE: return "none";
        case SecurityLevel::BASIC: return "basic";
        case SecurityLevel::STRICT: return "strict";
    }
    return "basic";
}

bool parse_security_level(const std::string& name, SecurityLevel& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "none") {
        out = SecurityLevel::NONE;
    } else if (lower == "basic") {
        out = SecurityLevel::BASIC;
    } else if (lower == "strict") {
        out = SecurityLevel::STRICT;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Default denylist
// ============================================================================

namespace {

struct RuleSpec {
    const char* pattern;
    const char* reason;
};

// First match wins; specific paths precede the generic open('/ rule
const RuleSpec kDefaultRules[] = {
    {"import os", "os module import blocked"},
    {"import subprocess", "subprocess module import blocked"},
    {"import sys", "sys module import blocked for security"},
    {"__import__('os')", "dynamic os import blocked"},
    {"__import__('subprocess')", "dynamic subprocess import blocked"},
    {"eval(", "eval() is blocked"},
    {"exec(", "exec() is blocked"},
    {"compile(", "compile() is blocked"},
    {"open('/etc", "system configuration access blocked"},
    {"open('/proc", "process filesystem access blocked"},
    {"open('/sys", "kernel filesystem access blocked"},
    {"open('/", "absolute path file access restricted"},
    {"os.system", "os.system() is blocked"},
    {"subprocess.", "subprocess operations blocked"},
    {"shutil.rmtree(", "recursive deletion blocked"},
    {"importlib.import_module", "dynamic import blocked"},
    {"ctypes.", "foreign function access blocked"},
    {"socket.", "network access blocked"},
    {NULL, NULL}
};

} // namespace

const std::vector<DenyRule>& SecurityFilter::default_rules() {
    static std::vector<DenyRule> rules;
    if (rules.empty()) {
        for (const RuleSpec* spec = kDefaultRules; spec->pattern; ++spec) {
            rules.push_back(DenyRule(spec->pattern, spec->reason));
        }
    }
    return rules;
}

// ============================================================================
// SecurityFilter
// ============================================================================

SecurityFilter::SecurityFilter() : rules_(default_rules()) {}

SecurityFilter::SecurityFilter(const std::vector<DenyRule>& rules) : rules_(rules) {}

SecurityFilter SecurityFilter::from_config(const Config& cfg) {
    Json list = cfg.get_json("repl.denylist");
    if (!list.is_array()) {
        if (!list.is_null()) {
            LOG_WARN("[SecurityFilter] repl.denylist is not an array, using defaults");
        }
        return SecurityFilter();
    }

    std::vector<DenyRule> rules;
    for (size_t i = 0; i < list.size(); ++i) {
        const Json& entry = list[i];
        if (!entry.is_object() || !entry.contains("pattern") || !entry["pattern"].is_string()) {
            LOG_WARN("[SecurityFilter] Skipping malformed denylist entry #%zu", i);
            continue;
        }
        std::string pattern = entry["pattern"].get<std::string>();
        if (pattern.empty()) {
            LOG_WARN("[SecurityFilter] Skipping empty denylist pattern #%zu", i);
            continue;
        }
        std::string reason = entry.value("reason", std::string("blocked pattern"));
        rules.push_back(DenyRule(pattern, reason));
    }

    LOG_INFO("[SecurityFilter] Loaded %zu denylist rules from config", rules.size());
    return SecurityFilter(rules);
}

SecurityCheck SecurityFilter::check(const std::string& code, SecurityLevel level) const {
    SecurityCheck result;

    if (level == SecurityLevel::NONE) {
        result.reason = "Security checks disabled";
        return result;
    }

    for (size_t i = 0; i < rules_.size(); ++i) {
        if (code.find(rules_[i].pattern) != std::string::npos) {
            result.allowed = false;
            result.matched = rules_[i].pattern;
            result.reason = rules_[i].reason + " (matched '" + rules_[i].pattern + "')";
            LOG_DEBUG("[SecurityFilter] Denied: %s", result.reason.c_str());
            return result;
        }
    }

    result.reason = "Code passed security checks";
    return result;
}

} // namespace gatedrepl
