/*
 * gatedrepl C++ - REPL State Machine Implementation
 */
#include <gatedrepl/repl/controller.hpp>
#include <gatedrepl/core/logger.hpp>

namespace gatedrepl {

// ============================================================================
// States and transition table
// ============================================================================

const char* repl_state_name(ReplState state) {
    switch (state) {
        case ReplState::IDLE: return "idle";
        case ReplState::PENDING_REVIEW: return "code_pending_review";
        case ReplState::APPROVED: return "code_approved";
        case ReplState::REJECTED: return "code_rejected";
        case ReplState::EXECUTING: return "executing";
        case ReplState::COMPLETE: return "complete";
    }
    return "idle";
}

bool parse_repl_state(const std::string& name, ReplState& out) {
    static const ReplState all[] = {
        ReplState::IDLE, ReplState::PENDING_REVIEW, ReplState::APPROVED,
        ReplState::REJECTED, ReplState::EXECUTING, ReplState::COMPLETE
    };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (name == repl_state_name(all[i])) {
            out = all[i];
            return true;
        }
    }
    return false;
}

bool can_transition(ReplState from, ReplState to) {
    switch (from) {
        case ReplState::IDLE:
            return to == ReplState::PENDING_REVIEW || to == ReplState::COMPLETE;
        case ReplState::PENDING_REVIEW:
            return to == ReplState::APPROVED || to == ReplState::REJECTED || to == ReplState::COMPLETE;
        case ReplState::APPROVED:
            return to == ReplState::EXECUTING || to == ReplState::COMPLETE;
        case ReplState::REJECTED:
            return to == ReplState::IDLE || to == ReplState::COMPLETE;
        case ReplState::EXECUTING:
            return to == ReplState::IDLE || to == ReplState::COMPLETE;
        case ReplState::COMPLETE:
            return false;
    }
    return false;
}

InvalidTransitionError::InvalidTransitionError(const std::string& operation, ReplState from)
    : std::runtime_error(operation + " is not allowed in state '" + repl_state_name(from) + "'")
    , operation_(operation)
    , from_(from)
{}

// ============================================================================
// HistoryEntry
// ============================================================================

Json HistoryEntry::to_json() const {
    Json j;
    j["code"] = code;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["iteration"] = iteration;
    return j;
}

bool HistoryEntry::from_json(const Json& j, HistoryEntry& out) {
    if (!j.is_object() || !j.contains("code") || !j["code"].is_string()) return false;
    out.code = j["code"].get<std::string>();
    out.stdout_text = j.value("stdout", std::string());
    out.stderr_text = j.value("stderr", std::string());
    out.iteration = j.value("iteration", static_cast<int64_t>(0));
    return true;
}

// ============================================================================
// ReplController
// ============================================================================

ReplController::ReplController(SecurityLevel level, int64_t max_iterations)
    : state_(ReplState::IDLE)
    , security_level_(level)
    , iteration_(0)
    , max_iterations_(max_iterations)
    , submissions_(0)
    , has_final_answer_(false)
{}

void ReplController::transition(const char* operation, ReplState to) {
    if (!can_transition(state_, to)) {
        throw InvalidTransitionError(operation, state_);
    }
    LOG_DEBUG("[Controller] %s: %s -> %s", operation, repl_state_name(state_), repl_state_name(to));
    state_ = to;
}

void ReplController::submit(const std::string& code) {
    if (state_ != ReplState::IDLE) {
        throw InvalidTransitionError("submit", state_);
    }
    transition("submit", ReplState::PENDING_REVIEW);
    pending_code_ = code;
    ++submissions_;
}

void ReplController::resolve_review(bool approved) {
    if (state_ != ReplState::PENDING_REVIEW) {
        throw InvalidTransitionError("resolve_review", state_);
    }
    transition("resolve_review", approved ? ReplState::APPROVED : ReplState::REJECTED);
}

void ReplController::begin_execution() {
    if (state_ != ReplState::APPROVED) {
        throw InvalidTransitionError("begin_execution", state_);
    }
    transition("begin_execution", ReplState::EXECUTING);
}

void ReplController::finish_execution(const std::string& stdout_text, const std::string& stderr_text) {
    if (state_ != ReplState::EXECUTING) {
        throw InvalidTransitionError("finish_execution", state_);
    }
    transition("finish_execution", ReplState::IDLE);

    HistoryEntry entry;
    entry.code = pending_code_;
    entry.stdout_text = stdout_text;
    entry.stderr_text = stderr_text;
    entry.iteration = iteration_;
    history_.push_back(entry);

    pending_code_.clear();
    ++iteration_;
}

std::string ReplController::reject_with_reason(const std::string& reason) {
    if (state_ != ReplState::REJECTED) {
        throw InvalidTransitionError("reject_with_reason", state_);
    }
    transition("reject_with_reason", ReplState::IDLE);

    std::string discarded;
    discarded.swap(pending_code_);
    last_rejection_ = reason;
    LOG_INFO("[Controller] Submission #%lld rejected: %s",
             static_cast<long long>(submissions_), reason.c_str());
    return discarded;
}

void ReplController::force_complete(const std::string& answer) {
    if (state_ == ReplState::COMPLETE) {
        throw InvalidTransitionError("force_complete", state_);
    }
    LOG_DEBUG("[Controller] force_complete: %s -> complete", repl_state_name(state_));
    state_ = ReplState::COMPLETE;
    pending_code_.clear();
    final_answer_ = answer;
    has_final_answer_ = true;
}

void ReplController::restore(ReplState state, int64_t iteration, const std::vector<HistoryEntry>& history,
                             const std::string* final_answer) {
    if (state != ReplState::IDLE && state != ReplState::COMPLETE) {
        LOG_WARN("[Controller] Restored session was in state '%s', resuming as idle",
                 repl_state_name(state));
        state = ReplState::IDLE;
    }
    if (iteration > iteration_) iteration_ = iteration;
    history_ = history;
    pending_code_.clear();

    if (state == ReplState::COMPLETE) {
        state_ = ReplState::COMPLETE;
        has_final_answer_ = final_answer != nullptr;
        final_answer_ = final_answer ? *final_answer : std::string();
    } else {
        state_ = ReplState::IDLE;
    }
}

} // namespace gatedrepl
