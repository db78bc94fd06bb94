#include <gatedrepl/repl/repl_service.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace gatedrepl;

namespace {

// Records every save; optionally fails them
class RecordingSink : public ArtifactSink {
public:
    RecordingSink() : fail(false) {}

    bool save_artifact(const std::string& session_id, const std::string& name,
                       const std::string& content, int64_t& version) override {
        if (fail) return false;
        saves.push_back(session_id + "/" + name);
        contents.push_back(content);
        version = static_cast<int64_t>(saves.size()) - 1;
        return true;
    }

    bool fail;
    std::vector<std::string> saves;
    std::vector<std::string> contents;
};

class ReplServiceTest : public ::testing::Test {
protected:
    ReplServiceTest() : service_(make_options()) {}

    ReplServiceOptions make_options() {
        ReplServiceOptions opts;
        opts.staging_root = dir_.file("staging");
        return opts;
    }

    void open(const std::string& id, SecurityLevel level = SecurityLevel::BASIC, int64_t max_iterations = 20) {
        SessionOptions opts;
        opts.security_level = level;
        opts.max_iterations = max_iterations;
        OperationResult r = service_.open_session(id, opts);
        ASSERT_EQ(r.status, "created") << r.message;
    }

    test::TempDir dir_;
    ReplService service_;
};

} // namespace

TEST_F(ReplServiceTest, OpenIsIdempotent) {
    open("s1");
    OperationResult again = service_.open_session("s1", SessionOptions());
    EXPECT_EQ(again.status, "exists");
    EXPECT_EQ(again.state, "idle");

    OperationResult bad = service_.open_session("../x", SessionOptions());
    EXPECT_EQ(bad.status, "error");
    EXPECT_EQ(bad.error_kind, "invalid_argument");
}

TEST_F(ReplServiceTest, BasicRunExecutesImmediately) {
    open("s1");
    ExecuteResult r = service_.run_code("s1", "x = 2\nx * 21");
    EXPECT_EQ(r.status, "success");
    EXPECT_TRUE(r.executed);
    EXPECT_EQ(r.state, "idle");
    EXPECT_EQ(r.iteration, 1);
    EXPECT_EQ(r.execution.stdout_text, "42\n");

    Json j = r.to_json();
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["stdout"], "42\n");
    EXPECT_EQ(j["variables"], Json::array({"x"}));
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(ReplServiceTest, StatePersistsAcrossSubmissions) {
    open("s1");
    service_.run_code("s1", "total = 0");
    service_.run_code("s1", "total += 5");
    ExecuteResult r = service_.run_code("s1", "print(total)");
    EXPECT_EQ(r.execution.stdout_text, "5\n");
    EXPECT_EQ(r.iteration, 3);
}

TEST_F(ReplServiceTest, FaultIsReportedAndStateStaysUsable) {
    open("s1");
    ExecuteResult r = service_.run_code("s1", "y = 1\nraise ValueError('boom')");
    EXPECT_EQ(r.status, "error");
    EXPECT_EQ(r.error_kind, "execution_fault");
    EXPECT_EQ(r.message, "ValueError: boom (line 2)");
    EXPECT_EQ(r.state, "idle");
    EXPECT_EQ(r.to_json()["error"], "ValueError: boom (line 2)");

    SessionSnapshot snap = service_.get_state("s1");
    EXPECT_EQ(snap.last_error, "ValueError: boom (line 2)");
    EXPECT_EQ(snap.iteration, 1);
    ASSERT_EQ(snap.variables.size(), 1u);
    EXPECT_EQ(snap.variables[0], "y");
}

TEST_F(ReplServiceTest, DenylistRejectsAndReturnsToIdle) {
    open("s1");
    OperationResult r = service_.submit_code("s1", "import os\nos.listdir('.')");
    EXPECT_EQ(r.status, "rejected");
    EXPECT_EQ(r.error_kind, "security_violation");
    EXPECT_EQ(r.state, "idle");
    EXPECT_EQ(r.code, "import os\nos.listdir('.')");
    EXPECT_NE(r.message.find("import os"), std::string::npos);

    SessionSnapshot snap = service_.get_state("s1");
    EXPECT_EQ(snap.last_error.compare(0, 20, "Security violation: "), 0);
    EXPECT_EQ(snap.iteration, 0);
    EXPECT_EQ(snap.submission_count, 1);
    EXPECT_TRUE(snap.pending_code.empty());

    EXPECT_EQ(service_.run_code("s1", "1 + 1").status, "success");
}

TEST_F(ReplServiceTest, NoneLevelSkipsDenylist) {
    open("s1", SecurityLevel::NONE);
    // The interpreter still has no os module, so the fault comes from the sandbox
    ExecuteResult r = service_.run_code("s1", "import os");
    EXPECT_EQ(r.error_kind, "execution_fault");
    EXPECT_EQ(r.message.compare(0, 12, "ImportError:"), 0);
}

TEST_F(ReplServiceTest, StrictRequiresApproval) {
    open("s1", SecurityLevel::STRICT);
    OperationResult submitted = service_.submit_code("s1", "print('ok')");
    EXPECT_EQ(submitted.status, "pending_approval");
    EXPECT_EQ(submitted.state, "code_pending_review");
    EXPECT_EQ(submitted.code, "print('ok')");

    // Nothing else may be submitted while a review is pending
    OperationResult second = service_.submit_code("s1", "x = 1");
    EXPECT_EQ(second.status, "error");
    EXPECT_EQ(second.error_kind, "invalid_transition");
    EXPECT_EQ(second.state, "code_pending_review");

    OperationResult approved = service_.resolve_review("s1", true);
    EXPECT_EQ(approved.status, "approved");
    EXPECT_EQ(approved.state, "code_approved");

    ExecuteResult r = service_.execute("s1");
    EXPECT_EQ(r.status, "success");
    EXPECT_EQ(r.execution.stdout_text, "ok\n");
}

TEST_F(ReplServiceTest, StrictRejection) {
    open("s1", SecurityLevel::STRICT);
    service_.submit_code("s1", "x = 1");
    OperationResult r = service_.resolve_review("s1", false);
    EXPECT_EQ(r.status, "rejected");
    EXPECT_EQ(r.message, "rejected by reviewer");
    EXPECT_EQ(r.code, "x = 1");
    EXPECT_EQ(r.state, "idle");
    EXPECT_EQ(service_.get_state("s1").last_error, "Code rejected: rejected by reviewer");

    service_.submit_code("s1", "y = 2");
    r = service_.resolve_review("s1", false, "too broad");
    EXPECT_EQ(r.message, "too broad");
}

TEST_F(ReplServiceTest, StrictDenylistStillRejectsOutright) {
    open("s1", SecurityLevel::STRICT);
    ExecuteResult r = service_.run_code("s1", "eval('1')");
    EXPECT_EQ(r.status, "rejected");
    EXPECT_FALSE(r.executed);
    EXPECT_EQ(r.state, "idle");
}

TEST_F(ReplServiceTest, OutOfOrderOperations) {
    open("s1");
    ExecuteResult r = service_.execute("s1");
    EXPECT_EQ(r.error_kind, "invalid_transition");
    EXPECT_EQ(r.state, "idle");

    OperationResult review = service_.resolve_review("s1", true);
    EXPECT_EQ(review.error_kind, "invalid_transition");
    EXPECT_EQ(review.message, "resolve_review is not allowed in state 'idle'");
}

TEST_F(ReplServiceTest, UnknownSession) {
    EXPECT_EQ(service_.submit_code("nope", "x").error_kind, "unknown_session");
    EXPECT_EQ(service_.execute("nope").error_kind, "unknown_session");
    EXPECT_EQ(service_.get_state("nope").error_kind, "unknown_session");
    EXPECT_EQ(service_.finalize_answer("nope", "a").error_kind, "unknown_session");
    EXPECT_EQ(service_.reset("nope").error_kind, "unknown_session");
    EXPECT_FALSE(service_.cancel("nope"));

    Json j = service_.get_state("nope").to_json();
    EXPECT_EQ(j["status"], "error");
    EXPECT_FALSE(j.contains("state"));
}

TEST_F(ReplServiceTest, IterationLimit) {
    open("s1", SecurityLevel::BASIC, 2);
    EXPECT_EQ(service_.run_code("s1", "a = 1").status, "success");
    EXPECT_EQ(service_.run_code("s1", "b = 2").status, "success");

    ExecuteResult r = service_.run_code("s1", "c = 3");
    EXPECT_EQ(r.status, "error");
    EXPECT_EQ(r.error_kind, "iteration_limit");
    EXPECT_EQ(r.message, "Maximum iterations (2) reached; submit a final answer");

    FinalizeResult done = service_.finalize_variable("s1", "b");
    EXPECT_EQ(done.status, "complete");
    EXPECT_EQ(done.answer, "2");
}

TEST_F(ReplServiceTest, FinalizeAnswerIsTerminal) {
    open("s1");
    service_.run_code("s1", "x = 1");
    FinalizeResult r = service_.finalize_answer("s1", "the answer");
    EXPECT_EQ(r.status, "complete");
    EXPECT_EQ(r.state, "complete");
    EXPECT_EQ(r.to_json()["final_answer"], "the answer");

    SessionSnapshot snap = service_.get_state("s1");
    EXPECT_EQ(snap.state, "complete");
    EXPECT_TRUE(snap.has_final_answer);
    EXPECT_EQ(snap.to_json()["final_answer"], "the answer");

    EXPECT_EQ(service_.run_code("s1", "x = 2").error_kind, "invalid_transition");
    EXPECT_EQ(service_.finalize_answer("s1", "again").error_kind, "invalid_transition");
    EXPECT_EQ(service_.finalize_variable("s1", "x").error_kind, "invalid_transition");
    EXPECT_FALSE(service_.cancel("s1"));
}

TEST_F(ReplServiceTest, FinalizeVariable) {
    open("s1");
    service_.run_code("s1", "result = {'count': 3}\nother = 1");

    FinalizeResult missing = service_.finalize_variable("s1", "nothing");
    EXPECT_EQ(missing.status, "error");
    EXPECT_EQ(missing.error_kind, "invalid_argument");
    EXPECT_EQ(missing.message, "Variable 'nothing' not found in REPL");
    ASSERT_EQ(missing.available_variables.size(), 2u);
    EXPECT_EQ(missing.available_variables[0], "other");
    EXPECT_EQ(missing.state, "idle");

    FinalizeResult r = service_.finalize_variable("s1", "  \"result\" ");
    EXPECT_EQ(r.status, "complete");
    EXPECT_EQ(r.variable_name, "result");
    EXPECT_EQ(r.answer, "{'count': 3}");
}

TEST_F(ReplServiceTest, ResetDestroysSession) {
    open("s1");
    service_.run_code("s1", "x = 1");
    OperationResult r = service_.reset("s1");
    EXPECT_EQ(r.status, "reset");
    EXPECT_EQ(r.message, "Session destroyed");
    EXPECT_EQ(service_.get_state("s1").error_kind, "unknown_session");

    open("s1");
    ExecuteResult again = service_.run_code("s1", "x");
    EXPECT_EQ(again.error_kind, "execution_fault");
}

TEST_F(ReplServiceTest, CancelStopsRunningExecution) {
    ReplServiceOptions opts = make_options();
    opts.sandbox.limits.max_steps = 0;
    opts.sandbox.limits.timeout_ms = 0;
    ReplService service(opts);
    ASSERT_EQ(service.open_session("c1", SessionOptions()).status, "created");

    std::atomic<bool> finished(false);
    std::thread canceller([&service, &finished]() {
        while (!finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            service.cancel("c1");
        }
    });
    ExecuteResult r = service.run_code("c1", "while True:\n    pass");
    finished.store(true);
    canceller.join();

    EXPECT_EQ(r.status, "error");
    EXPECT_EQ(r.error_kind, "execution_fault");
    EXPECT_EQ(r.message.compare(0, 33, "TimeoutError: execution cancelled"), 0) << r.message;
    EXPECT_EQ(r.state, "idle");
    EXPECT_EQ(service.run_code("c1", "1 + 1").execution.stdout_text, "2\n");
}

TEST_F(ReplServiceTest, CancelDuringTeardownIsSafe) {
    LogLevel saved = Logger::instance().level();
    Logger::instance().set_level(LogLevel::ERROR);

    for (int round = 0; round < 20; ++round) {
        std::string id = "t" + std::to_string(round);
        open(id);
        service_.run_code(id, "data = list(range(1000))");

        std::atomic<bool> stop(false);
        std::thread canceller([this, &id, &stop]() {
            while (!stop.load()) service_.cancel(id);
        });
        if (round % 2 == 0) {
            EXPECT_EQ(service_.finalize_answer(id, "done").status, "complete");
        } else {
            EXPECT_EQ(service_.reset(id).status, "reset");
        }
        stop.store(true);
        canceller.join();
        EXPECT_FALSE(service_.cancel(id));
    }

    Logger::instance().set_level(saved);
}

TEST_F(ReplServiceTest, StateOutputPreviewIsTruncated) {
    open("s1");
    service_.run_code("s1", "print('z' * 800)");
    SessionSnapshot snap = service_.get_state("s1");
    EXPECT_EQ(snap.last_output.compare(0, 500, std::string(500, 'z')), 0);
    EXPECT_NE(snap.last_output.find("[truncated, 301 chars omitted]"), std::string::npos);
}

TEST_F(ReplServiceTest, PersistsFieldsToStore) {
    std::shared_ptr<MemoryStateStore> store(new MemoryStateStore());
    service_.set_state_store_factory([store](const std::string&) -> StateStorePtr { return store; });

    SessionOptions opts;
    opts.query = "count the rows";
    opts.context = "row\nrow\n";
    ASSERT_EQ(service_.open_session("p1", opts).status, "created");
    service_.run_code("p1", "n = context.count('row')");

    Json value;
    ASSERT_TRUE(store->get(REPL_STATE_KEY, value));
    EXPECT_EQ(value, "idle");
    ASSERT_TRUE(store->get(REPL_ITERATION_KEY, value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(store->get(REPL_CODE_HISTORY_KEY, value));
    ASSERT_EQ(value.size(), 1u);
    EXPECT_EQ(value[0]["code"], "n = context.count('row')");
    ASSERT_TRUE(store->get(REPL_LOCALS_KEY, value));
    EXPECT_EQ(value["n"], 2);
    ASSERT_TRUE(store->get(REPL_QUERY_KEY, value));
    EXPECT_EQ(value, "count the rows");
    ASSERT_TRUE(store->get(REPL_CONTEXT_KEY, value));
    EXPECT_EQ(value, "row\nrow\n");
    ASSERT_TRUE(store->get(REPL_FINAL_ANSWER_KEY, value));
    EXPECT_TRUE(value.is_null());

    service_.finalize_answer("p1", "2");
    ASSERT_TRUE(store->get(REPL_STATE_KEY, value));
    EXPECT_EQ(value, "complete");
    ASSERT_TRUE(store->get(REPL_FINAL_ANSWER_KEY, value));
    EXPECT_EQ(value, "2");

    service_.reset("p1");
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(ReplServiceTest, ResumeRestoresCountersAndLocals) {
    SqliteStateDatabase db;
    ASSERT_TRUE(db.open(":memory:"));
    ASSERT_TRUE(db.ensure_schema());
    service_.set_state_store_factory([&db](const std::string& id) { return db.session_view(id); });

    open("r1");
    service_.run_code("r1", "kept = [1, 2]\ndef helper():\n    return 1");
    service_.run_code("r1", "kept.append(3)");

    ReplService restarted(make_options());
    restarted.set_state_store_factory([&db](const std::string& id) { return db.session_view(id); });
    SessionOptions opts;
    opts.resume = true;
    ASSERT_EQ(restarted.open_session("r1", opts).status, "created");

    SessionSnapshot snap = restarted.get_state("r1");
    EXPECT_EQ(snap.iteration, 2);
    EXPECT_EQ(snap.history_count, 2u);

    ExecuteResult r = restarted.run_code("r1", "print(kept)");
    EXPECT_EQ(r.execution.stdout_text, "[1, 2, 3]\n");
    EXPECT_EQ(r.iteration, 3);

    // Functions were persisted only as placeholders
    EXPECT_EQ(restarted.run_code("r1", "helper()").error_kind, "execution_fault");
}

TEST_F(ReplServiceTest, ArtifactsAreWrittenWhenEnabled) {
    std::shared_ptr<RecordingSink> sink(new RecordingSink());
    service_.set_artifact_sink(sink);

    SessionOptions opts;
    opts.artifacts_enabled = true;
    ASSERT_EQ(service_.open_session("a1", opts).status, "created");
    service_.run_code("a1", "print('hi')");
    service_.run_code("a1", "1 / 0");

    ASSERT_EQ(sink->saves.size(), 2u);
    EXPECT_EQ(sink->saves[0], "a1/repl_code_0001.txt");
    EXPECT_EQ(sink->saves[1], "a1/repl_code_0002.txt");
    EXPECT_NE(sink->contents[0].find("# stdout:\n# hi\n"), std::string::npos);
    EXPECT_NE(sink->contents[1].find("# Success: False"), std::string::npos);

    // A failing sink does not fail the execution
    sink->fail = true;
    EXPECT_EQ(service_.run_code("a1", "x = 1").status, "success");

    open("quiet");
    service_.run_code("quiet", "x = 1");
    EXPECT_EQ(sink->saves.size(), 2u);
}

TEST_F(ReplServiceTest, ModelQueryReachesSandbox) {
    service_.set_model_query([](const std::string& prompt) { return prompt + "!"; });
    open("m1");
    ExecuteResult r = service_.run_code("m1", "llm_query('hey')");
    EXPECT_EQ(r.execution.stdout_text, "'hey!'\n");
}

TEST(ArtifactFormatTest, Layout) {
    ExecutionResult result;
    result.success = true;
    result.elapsed_seconds = 0.25;
    result.stdout_text = "line one\n\nline two\n";

    std::string text = format_artifact("print('x')", result, 4);
    EXPECT_EQ(text,
              "# REPL Execution - Iteration 4\n"
              "# Execution time: 0.250s\n"
              "# Success: True\n"
              "# SHA-256: " + sha256_hex("print('x')") + "\n"
              "\n"
              "print('x')\n"
              "\n"
              "# --- Output ---\n"
              "# stdout:\n"
              "# line one\n"
              "# line two\n"
              "\n"
              "# stderr:\n"
              "# (none)\n");
    EXPECT_EQ(artifact_name(7), "repl_code_0007.txt");
}

TEST(ReplServiceOptionsTest, FromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"repl": {
        "security_level": "strict", "max_iterations": 9, "artifacts": true, "max_steps": 77
    }})"));
    ReplServiceOptions opts = ReplServiceOptions::from_config(cfg, "/tmp/staging");
    EXPECT_EQ(opts.staging_root, "/tmp/staging");
    EXPECT_EQ(opts.session_defaults.security_level, SecurityLevel::STRICT);
    EXPECT_EQ(opts.session_defaults.max_iterations, 9);
    EXPECT_TRUE(opts.session_defaults.artifacts_enabled);
    EXPECT_EQ(opts.sandbox.limits.max_steps, 77);

    Config bad;
    ASSERT_TRUE(bad.load_string(R"({"repl": {"security_level": "paranoid"}})"));
    EXPECT_EQ(ReplServiceOptions::from_config(bad, "x").session_defaults.security_level, SecurityLevel::BASIC);
}
