/*
 * gatedrepl C++ - REPL State Machine
 *
 * Extended finite state machine gating every submission:
 *
 *   IDLE -> PENDING_REVIEW -> APPROVED -> EXECUTING -> IDLE
 *                          \-> REJECTED -> IDLE
 *
 * Any non-terminal state may also move to COMPLETE. The auxiliary data
 * (pending code, iteration counter, submission counter, history, final
 * answer) is carried alongside the state and only changes through the
 * operations below, each of which validates against the transition table.
 * force_complete() is the single sanctioned bypass.
 *
 * Not thread-safe; callers serialize access per session.
 */
#ifndef gatedrepl_REPL_CONTROLLER_HPP
#define gatedrepl_REPL_CONTROLLER_HPP

#include "security_filter.hpp"
#include <gatedrepl/core/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace gatedrepl {

enum class ReplState {
    IDLE,
    PENDING_REVIEW,
    APPROVED,
    REJECTED,
    EXECUTING,
    COMPLETE
};

// Persisted names: "idle", "code_pending_review", "code_approved",
// "code_rejected", "executing", "complete"
const char* repl_state_name(ReplState state);
bool parse_repl_state(const std::string& name, ReplState& out);

// Transition table lookup
bool can_transition(ReplState from, ReplState to);

class InvalidTransitionError : public std::runtime_error {
public:
    InvalidTransitionError(const std::string& operation, ReplState from);

    const std::string& operation() const { return operation_; }
    ReplState from() const { return from_; }

private:
    std::string operation_;
    ReplState from_;
};

struct HistoryEntry {
    std::string code;
    std::string stdout_text;
    std::string stderr_text;
    int64_t iteration;

    HistoryEntry() : iteration(0) {}

    Json to_json() const;
    static bool from_json(const Json& j, HistoryEntry& out);
};

class ReplController {
public:
    ReplController(SecurityLevel level, int64_t max_iterations);

    ReplState state() const { return state_; }
    SecurityLevel security_level() const { return security_level_; }
    int64_t iteration() const { return iteration_; }
    int64_t max_iterations() const { return max_iterations_; }
    int64_t submission_count() const { return submissions_; }
    const std::string& pending_code() const { return pending_code_; }
    const std::vector<HistoryEntry>& history() const { return history_; }
    bool has_final_answer() const { return has_final_answer_; }
    const std::string& final_answer() const { return final_answer_; }

    bool is_complete() const { return state_ == ReplState::COMPLETE; }
    bool has_exceeded_max_iterations() const { return iteration_ >= max_iterations_; }

    // IDLE -> PENDING_REVIEW. Stores the code and bumps the submission counter.
    void submit(const std::string& code);

    // PENDING_REVIEW -> APPROVED | REJECTED
    void resolve_review(bool approved);

    // APPROVED -> EXECUTING
    void begin_execution();

    // EXECUTING -> IDLE. Records history, clears pending code, iteration + 1.
    void finish_execution(const std::string& stdout_text, const std::string& stderr_text);

    // REJECTED -> IDLE. Returns the discarded code.
    std::string reject_with_reason(const std::string& reason);
    const std::string& last_rejection() const { return last_rejection_; }

    // Any non-terminal state -> COMPLETE, bypassing the table
    void force_complete(const std::string& answer);

    // Reload counters from persisted state. In-flight states (pending,
    // approved, rejected, executing) collapse to IDLE.
    void restore(ReplState state, int64_t iteration, const std::vector<HistoryEntry>& history,
                 const std::string* final_answer);

private:
    void transition(const char* operation, ReplState to);

    ReplState state_;
    SecurityLevel security_level_;
    int64_t iteration_;
    int64_t max_iterations_;
    int64_t submissions_;
    std::string pending_code_;
    std::string last_rejection_;
    std::vector<HistoryEntry> history_;
    bool has_final_answer_;
    std::string final_answer_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_CONTROLLER_HPP
