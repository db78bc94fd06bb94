#include <gatedrepl/repl/security_filter.hpp>
#include <gatedrepl/core/config.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl;

TEST(SecurityFilterTest, NoneAllowsEverything) {
    SecurityFilter filter;
    SecurityCheck check = filter.check("import os\nos.system('ls')", SecurityLevel::NONE);
    EXPECT_TRUE(check.allowed);
    EXPECT_EQ(check.reason, "Security checks disabled");
}

TEST(SecurityFilterTest, CleanCodePasses) {
    SecurityFilter filter;
    SecurityCheck check = filter.check("x = [i * i for i in range(10)]\nprint(sum(x))", SecurityLevel::BASIC);
    EXPECT_TRUE(check.allowed);
    EXPECT_EQ(check.reason, "Code passed security checks");
    EXPECT_TRUE(check.matched.empty());
}

TEST(SecurityFilterTest, DeniesDefaultPatterns) {
    SecurityFilter filter;
    const char* samples[] = {
        "import os",
        "import subprocess",
        "import sys",
        "__import__('os')",
        "eval('1 + 1')",
        "exec('x = 1')",
        "compile('1', 'f', 'eval')",
        "open('/tmp/x')",
        "shutil.rmtree('/tmp')",
        "ctypes.CDLL('libc.so.6')",
        "socket.socket()",
        NULL
    };
    for (size_t i = 0; samples[i]; ++i) {
        SecurityCheck check = filter.check(samples[i], SecurityLevel::BASIC);
        EXPECT_FALSE(check.allowed) << samples[i];
        EXPECT_FALSE(check.matched.empty()) << samples[i];
    }
}

TEST(SecurityFilterTest, ReasonNamesMatchedPattern) {
    SecurityFilter filter;
    SecurityCheck check = filter.check("y = eval('2')", SecurityLevel::STRICT);
    ASSERT_FALSE(check.allowed);
    EXPECT_EQ(check.matched, "eval(");
    EXPECT_EQ(check.reason, "eval() is blocked (matched 'eval(')");
}

TEST(SecurityFilterTest, SpecificPathRulesWinOverGenericOpen) {
    SecurityFilter filter;
    SecurityCheck check = filter.check("open('/etc/passwd')", SecurityLevel::BASIC);
    ASSERT_FALSE(check.allowed);
    EXPECT_EQ(check.matched, "open('/etc");
}

TEST(SecurityFilterTest, CustomRules) {
    std::vector<DenyRule> rules;
    rules.push_back(DenyRule("llm_query", "model access disabled"));
    SecurityFilter filter(rules);

    EXPECT_TRUE(filter.check("import os", SecurityLevel::BASIC).allowed);
    SecurityCheck check = filter.check("llm_query('hi')", SecurityLevel::BASIC);
    EXPECT_FALSE(check.allowed);
    EXPECT_EQ(check.reason, "model access disabled (matched 'llm_query')");
}

TEST(SecurityFilterTest, FromConfigSkipsMalformedEntries) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({
        "repl": {"denylist": [
            {"pattern": "math.", "reason": "math disabled"},
            {"reason": "no pattern"},
            {"pattern": ""},
            "bare string",
            {"pattern": "re."}
        ]}
    })"));

    SecurityFilter filter = SecurityFilter::from_config(cfg);
    ASSERT_EQ(filter.rules().size(), 2u);
    EXPECT_EQ(filter.rules()[0].reason, "math disabled");
    EXPECT_EQ(filter.rules()[1].reason, "blocked pattern");
}

TEST(SecurityFilterTest, FromConfigDefaultsWithoutDenylist) {
    Config cfg;
    SecurityFilter filter = SecurityFilter::from_config(cfg);
    EXPECT_EQ(filter.rules().size(), SecurityFilter::default_rules().size());
}

TEST(SecurityFilterTest, ParseLevel) {
    SecurityLevel level = SecurityLevel::BASIC;
    EXPECT_TRUE(parse_security_level("STRICT", level));
    EXPECT_EQ(level, SecurityLevel::STRICT);
    EXPECT_TRUE(parse_security_level(" none ", level));
    EXPECT_EQ(level, SecurityLevel::NONE);
    EXPECT_FALSE(parse_security_level("paranoid", level));
    EXPECT_EQ(level, SecurityLevel::NONE);
    EXPECT_STREQ(security_level_name(SecurityLevel::BASIC), "basic");
}
