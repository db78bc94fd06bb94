#include <gatedrepl/core/config.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace gatedrepl;

TEST(ConfigTest, DottedLookups) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({
        "log": {"level": "debug"},
        "repl": {"max_steps": 1000, "timeout_ms": 2500.0, "artifacts": true,
                 "disabled_capabilities": ["MODULES", 3, "CONTEXT"]}
    })"));

    EXPECT_EQ(cfg.get_string("log.level", "info"), "debug");
    EXPECT_EQ(cfg.get_int("repl.max_steps", 0), 1000);
    EXPECT_EQ(cfg.get_int("repl.timeout_ms", 0), 2500);
    EXPECT_DOUBLE_EQ(cfg.get_double("repl.max_steps", 0.0), 1000.0);
    EXPECT_TRUE(cfg.get_bool("repl.artifacts", false));
    EXPECT_TRUE(cfg.has("repl.max_steps"));
    EXPECT_FALSE(cfg.has("repl.missing"));

    std::vector<std::string> caps = cfg.get_string_array("repl.disabled_capabilities");
    ASSERT_EQ(caps.size(), 2u);
    EXPECT_EQ(caps[1], "CONTEXT");
}

TEST(ConfigTest, MissingOrMistypedKeysUseDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"repl": {"max_steps": "many"}, "flat": 1})"));
    EXPECT_EQ(cfg.get_int("repl.max_steps", 7), 7);
    EXPECT_EQ(cfg.get_string("repl.nothing", "x"), "x");
    EXPECT_FALSE(cfg.get_bool("flat.inner", false));
    EXPECT_TRUE(cfg.get_json("nope").is_null());
    EXPECT_TRUE(cfg.get_string_array("repl.max_steps").empty());
}

TEST(ConfigTest, RejectsMalformedInput) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"a": 1})"));
    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.error().empty());
    EXPECT_FALSE(cfg.load_string("[1, 2]"));
    EXPECT_EQ(cfg.get_int("a", 0), 1);
}

TEST(ConfigTest, LoadFile) {
    test::TempDir dir;
    std::string path = dir.file("config.json");
    ASSERT_TRUE(write_file(path, R"({"state": {"db_path": ":memory:"}})"));

    Config cfg;
    ASSERT_TRUE(cfg.load_file(path));
    EXPECT_EQ(cfg.path(), path);
    EXPECT_EQ(cfg.get_string("state.db_path", ""), ":memory:");
    EXPECT_FALSE(cfg.load_file(dir.file("missing.json")));
}

TEST(ConfigTest, SetCreatesIntermediateObjects) {
    Config cfg;
    cfg.set("repl.security_level", "strict");
    cfg.set("jail.landlock", false);
    EXPECT_EQ(cfg.get_string("repl.security_level", ""), "strict");
    EXPECT_FALSE(cfg.get_bool("jail.landlock", true));
}

TEST(LoggerTest, LevelFromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"log": {"level": " Warning "}})"));
    EXPECT_EQ(parse_log_level(cfg.get_string("log.level", "info")), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::ERROR), LogLevel::ERROR);

    LogLevel saved = Logger::instance().level();
    Logger::instance().set_level(LogLevel::ERROR);
    EXPECT_EQ(Logger::instance().level(), LogLevel::ERROR);
    Logger::instance().set_level(saved);
}
