/*
 * gatedrepl C++ - Output Router
 *
 * Two accumulating text buffers, PRIMARY (the calling process) and
 * SECONDARY (the recursively invoked model), plus a current-target pointer.
 * write() appends to the current target. Buffers are cleared explicitly,
 * never between executions.
 *
 * ScopedRedirect switches the target for the lifetime of the guard and
 * restores the previous target on every exit path, including exceptions.
 */
#ifndef gatedrepl_REPL_OUTPUT_ROUTER_HPP
#define gatedrepl_REPL_OUTPUT_ROUTER_HPP

#include <mutex>
#include <string>

namespace gatedrepl {

enum class OutputTarget {
    PRIMARY,
    SECONDARY
};

const char* output_target_name(OutputTarget target);

class OutputRouter {
public:
    OutputRouter();

    void set_target(OutputTarget target);
    OutputTarget target() const;

    void write(const std::string& text);

    std::string buffer(OutputTarget target) const;
    size_t size(OutputTarget target) const;

    void clear(OutputTarget target);
    void clear_all();

    class ScopedRedirect {
    public:
        ScopedRedirect(OutputRouter& router, OutputTarget target);
        ~ScopedRedirect();

    private:
        ScopedRedirect(const ScopedRedirect&);
        ScopedRedirect& operator=(const ScopedRedirect&);

        OutputRouter& router_;
        OutputTarget previous_;
    };

private:
    OutputRouter(const OutputRouter&);
    OutputRouter& operator=(const OutputRouter&);

    std::string& slot(OutputTarget target);
    const std::string& slot(OutputTarget target) const;

    mutable std::mutex mutex_;
    OutputTarget current_;
    std::string primary_;
    std::string secondary_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_OUTPUT_ROUTER_HPP
