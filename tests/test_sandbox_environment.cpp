#include <gatedrepl/repl/sandbox_environment.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace gatedrepl;

TEST(SandboxEnvironmentTest, EchoesTrailingExpression) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("x = 6\ny = 7\nx * y");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_text, "42\n");
    EXPECT_TRUE(r.stderr_text.empty());
    EXPECT_EQ(r.locals_snapshot["x"], 6);

    r = env.execute("'text'");
    EXPECT_EQ(r.stdout_text, "'text'\n");

    // print() calls and None results are not echoed twice
    r = env.execute("print('once')");
    EXPECT_EQ(r.stdout_text, "once\n");
    r = env.execute("[].append(1)");
    EXPECT_EQ(r.stdout_text, "");
}

TEST(SandboxEnvironmentTest, ComparisonIsAnExpression) {
    EXPECT_TRUE(SandboxEnvironment::is_expression("x == 1"));
    EXPECT_TRUE(SandboxEnvironment::is_expression("a >= b"));
    EXPECT_TRUE(SandboxEnvironment::is_expression("len(items)"));
    EXPECT_FALSE(SandboxEnvironment::is_expression("x = 1"));
    EXPECT_FALSE(SandboxEnvironment::is_expression("import math"));
    EXPECT_FALSE(SandboxEnvironment::is_expression("for i in x:"));
    EXPECT_FALSE(SandboxEnvironment::is_expression("print(x)"));

    // '=' after a comment marker is not code
    EXPECT_TRUE(SandboxEnvironment::is_expression("total  # total = a + b"));
    EXPECT_TRUE(SandboxEnvironment::is_expression("x ==# odd"));
    EXPECT_FALSE(SandboxEnvironment::is_expression("x = 1  # x == 1"));
}

TEST(SandboxEnvironmentTest, ImportsAreHoisted) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("print(math.floor(2.5))\nimport math");
    EXPECT_TRUE(r.success) << r.stderr_text;
    EXPECT_EQ(r.stdout_text, "2\n");
}

TEST(SandboxEnvironmentTest, FaultKeepsPartialOutputAndState) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("a = 1\nprint('before')\nb = 1 / 0\nc = 3");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stdout_text, "before\n");
    EXPECT_EQ(r.stderr_text, "ZeroDivisionError: division by zero (line 3)");
    EXPECT_TRUE(r.locals_snapshot.contains("a"));
    EXPECT_FALSE(r.locals_snapshot.contains("c"));

    r = env.execute("print(a)");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_text, "1\n");
}

TEST(SandboxEnvironmentTest, SyntaxErrorRunsNothing) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("x = 1\nif x\n    pass");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 12, "SyntaxError:"), 0);
    EXPECT_FALSE(r.locals_snapshot.contains("x"));
}

TEST(SandboxEnvironmentTest, SnapshotSkipsPrivateAndOpaqueValues) {
    SandboxEnvironment env((SandboxOptions()));
    env.execute("_hidden = 1\ndef f():\n    pass\nrows = [{'a': 1}]");
    Json snap = env.snapshot();
    EXPECT_FALSE(snap.contains("_hidden"));
    EXPECT_EQ(snap["f"], "<function>");
    EXPECT_EQ(snap["rows"][0]["a"], 1);

    std::vector<std::string> names = env.variable_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "f");
    EXPECT_EQ(names[1], "rows");
}

TEST(SandboxEnvironmentTest, VariableAsString) {
    SandboxEnvironment env((SandboxOptions()));
    env.execute("answer = 42\nnothing = None\ntext = 'hi'");
    std::string out;
    ASSERT_TRUE(env.variable_as_string("answer", out));
    EXPECT_EQ(out, "42");
    ASSERT_TRUE(env.variable_as_string("text", out));
    EXPECT_EQ(out, "hi");
    EXPECT_FALSE(env.variable_as_string("nothing", out));
    EXPECT_FALSE(env.variable_as_string("missing", out));
}

TEST(SandboxEnvironmentTest, ContextIsReadOnly) {
    SandboxEnvironment env((SandboxOptions()));
    env.load_context_json(Json::parse(R"({"docs": ["a", "b"]})"));
    ASSERT_TRUE(env.has_context());

    ExecutionResult r = env.execute("len(context['docs'])");
    EXPECT_EQ(r.stdout_text, "2\n");
    r = env.execute("context['docs'].append('c')");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 10, "TypeError:"), 0);

    // context is a symbol, not a namespace variable
    EXPECT_FALSE(env.snapshot().contains("context"));
}

TEST(SandboxEnvironmentTest, ContextCapabilityDisabled) {
    SandboxOptions opts;
    opts.capabilities.disable(script::Capability::CONTEXT);
    SandboxEnvironment env(opts);
    env.load_context("ignored");
    EXPECT_FALSE(env.has_context());

    ExecutionResult r = env.execute("context");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text, "NameError: name 'context' is not defined (capability CONTEXT is disabled) (line 1)");
}

TEST(SandboxEnvironmentTest, SeedLocals) {
    SandboxEnvironment env((SandboxOptions()));
    EXPECT_EQ(env.seed_locals(Json::parse(R"({"n": 5, "names": ["x"]})")), 2u);
    EXPECT_EQ(env.seed_locals(Json::array()), 0u);
    EXPECT_EQ(env.execute("n + len(names)").stdout_text, "6\n");
}

TEST(SandboxEnvironmentTest, OutputIsCappedPerExecution) {
    SandboxOptions opts;
    opts.limits.max_output_chars = 10;
    SandboxEnvironment env(opts);

    ExecutionResult r = env.execute("print('x' * 25)");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.output_truncated);
    EXPECT_EQ(r.stdout_text, "xxxxxxxxxx\n... [truncated, 16 chars omitted]");
    EXPECT_EQ(r.to_json()["truncated"], true);

    r = env.execute("print('short')");
    EXPECT_FALSE(r.output_truncated);
    EXPECT_EQ(r.stdout_text, "short\n");
}

TEST(SandboxEnvironmentTest, StepBudgetStopsRunawayLoop) {
    SandboxOptions opts;
    opts.limits.max_steps = 10000;
    SandboxEnvironment env(opts);
    ExecutionResult r = env.execute("i = 0\nwhile True:\n    i += 1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 13, "TimeoutError:"), 0);
    EXPECT_TRUE(r.locals_snapshot["i"].get<int64_t>() > 0);
}

TEST(SandboxEnvironmentTest, WallClockBudgetStopsRunawayLoop) {
    SandboxOptions opts;
    opts.limits.max_steps = 0;
    opts.limits.timeout_ms = 50;
    SandboxEnvironment env(opts);

    ExecutionResult r = env.execute("while True:\n    pass");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 53, "TimeoutError: execution exceeded the time limit of 50"), 0)
        << r.stderr_text;

    // The next execution gets a fresh budget
    r = env.execute("print('after')");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_text, "after\n");
}

TEST(SandboxEnvironmentTest, CancelInterruptsRunningExecution) {
    SandboxOptions opts;
    opts.limits.max_steps = 0;
    opts.limits.timeout_ms = 0;
    SandboxEnvironment env(opts);

    std::atomic<bool> finished(false);
    std::thread canceller([&env, &finished]() {
        // Repeat until the loop has started and observed the request
        while (!finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            env.cancel();
        }
    });
    ExecutionResult r = env.execute("n = 0\nwhile True:\n    n += 1");
    finished.store(true);
    canceller.join();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 33, "TimeoutError: execution cancelled"), 0) << r.stderr_text;
    EXPECT_TRUE(r.locals_snapshot["n"].get<int64_t>() > 0);
}

TEST(SandboxEnvironmentTest, RouterBuffersAreClearedPerExecution) {
    SandboxEnvironment env((SandboxOptions()));
    env.set_model_query([&env](const std::string& prompt) {
        env.router().write("side output for " + prompt);
        return std::string("ok");
    });

    ExecutionResult r = env.execute("print(llm_query('q'))");
    EXPECT_EQ(r.stdout_text, "ok\n");
    EXPECT_EQ(env.router().size(OutputTarget::PRIMARY), 0u);
    EXPECT_EQ(env.router().buffer(OutputTarget::SECONDARY), "side output for q");

    r = env.execute("print('second')");
    EXPECT_EQ(r.stdout_text, "second\n");
    EXPECT_EQ(env.router().size(OutputTarget::PRIMARY), 0u);
    EXPECT_EQ(env.router().size(OutputTarget::SECONDARY), 0u);
}

TEST(SandboxEnvironmentTest, ModelQueryOutputIsSeparated) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("llm_query('hello')");
    EXPECT_EQ(r.stdout_text, "'Error: Sub-LLM not available'\n");

    env.set_model_query([](const std::string& prompt) {
        return "reply:" + prompt;
    });
    r = env.execute("r = llm_query('q')\nprint(r)");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_text, "reply:q\n");
    EXPECT_EQ(env.router().target(), OutputTarget::PRIMARY);
}

TEST(SandboxEnvironmentTest, ModelQueryFailureBecomesScriptError) {
    SandboxEnvironment env((SandboxOptions()));
    env.set_model_query([](const std::string&) -> std::string {
        throw std::runtime_error("backend down");
    });
    ExecutionResult r = env.execute(
        "try:\n"
        "    llm_query('q')\n"
        "except RuntimeError as e:\n"
        "    print('handled', e)\n");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_text, "handled llm_query failed: backend down\n");
}

TEST(SandboxEnvironmentTest, ResultJson) {
    SandboxEnvironment env((SandboxOptions()));
    ExecutionResult r = env.execute("v = 1\nprint(v)");
    Json j = r.to_json();
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["stdout"], "1\n");
    EXPECT_TRUE(j["stderr"].is_null());
    EXPECT_EQ(j["variables"], Json::array({"v"}));
    EXPECT_FALSE(j.contains("truncated"));
}

TEST(SandboxOptionsTest, FromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"repl": {
        "max_steps": 123, "timeout_ms": 0, "max_output_chars": 50,
        "disabled_capabilities": ["model_query", "bogus"]
    }})"));
    SandboxOptions opts = SandboxOptions::from_config(cfg);
    EXPECT_EQ(opts.limits.max_steps, 123);
    EXPECT_EQ(opts.limits.timeout_ms, 0);
    EXPECT_EQ(opts.limits.max_output_chars, 50u);
    EXPECT_FALSE(opts.capabilities.has(script::Capability::MODEL_QUERY));
    EXPECT_TRUE(opts.capabilities.has(script::Capability::OUTPUT));
}
