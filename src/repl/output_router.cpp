/*
 * gatedrepl C++ - Output Router Implementation
 */
#include <gatedrepl/repl/output_router.hpp>

namespace gatedrepl {

const char* output_target_name(OutputTarget target) {
    return target == OutputTarget::PRIMARY ? "primary" : "secondary";
}

OutputRouter::OutputRouter() : current_(OutputTarget::PRIMARY) {}

std::string& OutputRouter::slot(OutputTarget target) {
    return target == OutputTarget::PRIMARY ? primary_ : secondary_;
}

const std::string& OutputRouter::slot(OutputTarget target) const {
    return target == OutputTarget::PRIMARY ? primary_ : secondary_;
}

void OutputRouter::set_target(OutputTarget target) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = target;
}

OutputTarget OutputRouter::target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void OutputRouter::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot(current_) += text;
}

std::string OutputRouter::buffer(OutputTarget target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(target);
}

size_t OutputRouter::size(OutputTarget target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(target).size();
}

void OutputRouter::clear(OutputTarget target) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot(target).clear();
}

void OutputRouter::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    primary_.clear();
    secondary_.clear();
}

// ============================================================================
// ScopedRedirect
// ============================================================================

OutputRouter::ScopedRedirect::ScopedRedirect(OutputRouter& router, OutputTarget target)
    : router_(router)
    , previous_(router.target())
{
    router_.set_target(target);
}

OutputRouter::ScopedRedirect::~ScopedRedirect() {
    router_.set_target(previous_);
}

} // namespace gatedrepl
