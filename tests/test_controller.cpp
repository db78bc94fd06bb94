#include <gatedrepl/repl/controller.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl;

TEST(ControllerTest, StartsIdle) {
    ReplController c(SecurityLevel::BASIC, 20);
    EXPECT_EQ(c.state(), ReplState::IDLE);
    EXPECT_EQ(c.iteration(), 0);
    EXPECT_EQ(c.submission_count(), 0);
    EXPECT_TRUE(c.pending_code().empty());
    EXPECT_FALSE(c.has_final_answer());
}

TEST(ControllerTest, ApprovedSubmissionRunsToIdle) {
    ReplController c(SecurityLevel::BASIC, 20);
    c.submit("x = 1");
    EXPECT_EQ(c.state(), ReplState::PENDING_REVIEW);
    EXPECT_EQ(c.pending_code(), "x = 1");
    EXPECT_EQ(c.submission_count(), 1);

    c.resolve_review(true);
    EXPECT_EQ(c.state(), ReplState::APPROVED);
    c.begin_execution();
    EXPECT_EQ(c.state(), ReplState::EXECUTING);
    c.finish_execution("out\n", "");

    EXPECT_EQ(c.state(), ReplState::IDLE);
    EXPECT_EQ(c.iteration(), 1);
    EXPECT_TRUE(c.pending_code().empty());
    ASSERT_EQ(c.history().size(), 1u);
    EXPECT_EQ(c.history()[0].code, "x = 1");
    EXPECT_EQ(c.history()[0].stdout_text, "out\n");
    EXPECT_EQ(c.history()[0].iteration, 0);
}

TEST(ControllerTest, RejectionDiscardsCodeWithoutIteration) {
    ReplController c(SecurityLevel::STRICT, 20);
    c.submit("eval('1')");
    c.resolve_review(false);
    EXPECT_EQ(c.state(), ReplState::REJECTED);

    std::string discarded = c.reject_with_reason("eval() is blocked");
    EXPECT_EQ(discarded, "eval('1')");
    EXPECT_EQ(c.state(), ReplState::IDLE);
    EXPECT_EQ(c.iteration(), 0);
    EXPECT_TRUE(c.history().empty());
    EXPECT_TRUE(c.pending_code().empty());
    EXPECT_EQ(c.last_rejection(), "eval() is blocked");
}

TEST(ControllerTest, SubmitOutsideIdleThrows) {
    ReplController c(SecurityLevel::BASIC, 20);
    c.submit("a = 1");
    try {
        c.submit("b = 2");
        FAIL() << "expected InvalidTransitionError";
    } catch (const InvalidTransitionError& e) {
        EXPECT_EQ(e.from(), ReplState::PENDING_REVIEW);
        EXPECT_EQ(e.operation(), "submit");
        EXPECT_NE(std::string(e.what()).find("code_pending_review"), std::string::npos);
    }
    EXPECT_EQ(c.pending_code(), "a = 1");
}

TEST(ControllerTest, ExecuteWithoutApprovalThrows) {
    ReplController c(SecurityLevel::BASIC, 20);
    EXPECT_THROW(c.begin_execution(), InvalidTransitionError);
    c.submit("a = 1");
    EXPECT_THROW(c.begin_execution(), InvalidTransitionError);
    EXPECT_THROW(c.finish_execution("", ""), InvalidTransitionError);
    EXPECT_EQ(c.state(), ReplState::PENDING_REVIEW);
}

TEST(ControllerTest, ForceCompleteFromAnyNonTerminalState) {
    ReplController c(SecurityLevel::BASIC, 20);
    c.submit("a = 1");
    c.resolve_review(true);
    c.force_complete("42");
    EXPECT_TRUE(c.is_complete());
    EXPECT_TRUE(c.has_final_answer());
    EXPECT_EQ(c.final_answer(), "42");
    EXPECT_TRUE(c.pending_code().empty());

    EXPECT_THROW(c.force_complete("again"), InvalidTransitionError);
    EXPECT_THROW(c.submit("b = 2"), InvalidTransitionError);
    EXPECT_EQ(c.final_answer(), "42");
}

TEST(ControllerTest, IterationLimit) {
    ReplController c(SecurityLevel::NONE, 2);
    for (int i = 0; i < 2; ++i) {
        EXPECT_FALSE(c.has_exceeded_max_iterations());
        c.submit("pass");
        c.resolve_review(true);
        c.begin_execution();
        c.finish_execution("", "");
    }
    EXPECT_TRUE(c.has_exceeded_max_iterations());
}

TEST(ControllerTest, TransitionTable) {
    EXPECT_TRUE(can_transition(ReplState::IDLE, ReplState::PENDING_REVIEW));
    EXPECT_FALSE(can_transition(ReplState::IDLE, ReplState::EXECUTING));
    EXPECT_TRUE(can_transition(ReplState::REJECTED, ReplState::IDLE));
    EXPECT_FALSE(can_transition(ReplState::APPROVED, ReplState::IDLE));
    EXPECT_FALSE(can_transition(ReplState::COMPLETE, ReplState::IDLE));
    EXPECT_FALSE(can_transition(ReplState::COMPLETE, ReplState::COMPLETE));
}

TEST(ControllerTest, StateNamesRoundTrip) {
    ReplState s;
    ASSERT_TRUE(parse_repl_state("code_pending_review", s));
    EXPECT_EQ(s, ReplState::PENDING_REVIEW);
    ASSERT_TRUE(parse_repl_state("complete", s));
    EXPECT_EQ(s, ReplState::COMPLETE);
    EXPECT_FALSE(parse_repl_state("pending", s));
    EXPECT_STREQ(repl_state_name(ReplState::APPROVED), "code_approved");
}

TEST(ControllerTest, RestoreCollapsesInFlightStates) {
    std::vector<HistoryEntry> history(3);
    ReplController c(SecurityLevel::BASIC, 20);
    c.restore(ReplState::EXECUTING, 3, history, nullptr);
    EXPECT_EQ(c.state(), ReplState::IDLE);
    EXPECT_EQ(c.iteration(), 3);
    EXPECT_EQ(c.history().size(), 3u);

    std::string answer = "done";
    ReplController finished(SecurityLevel::BASIC, 20);
    finished.restore(ReplState::COMPLETE, 1, history, &answer);
    EXPECT_TRUE(finished.is_complete());
    EXPECT_EQ(finished.final_answer(), "done");
}

TEST(ControllerTest, HistoryEntryJson) {
    HistoryEntry entry;
    entry.code = "print(1)";
    entry.stdout_text = "1\n";
    entry.iteration = 4;

    Json j = entry.to_json();
    EXPECT_EQ(j["code"], "print(1)");
    EXPECT_EQ(j["stderr"], "");

    HistoryEntry back;
    ASSERT_TRUE(HistoryEntry::from_json(j, back));
    EXPECT_EQ(back.stdout_text, "1\n");
    EXPECT_EQ(back.iteration, 4);
    EXPECT_FALSE(HistoryEntry::from_json(Json::array(), back));
}
