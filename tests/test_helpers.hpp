/*
 * gatedrepl C++ - Test helpers
 */
#ifndef gatedrepl_TESTS_TEST_HELPERS_HPP
#define gatedrepl_TESTS_TEST_HELPERS_HPP

#include <gatedrepl/core/utils.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace gatedrepl {
namespace test {

// Fresh directory under $TMPDIR (or /tmp), removed with its contents
class TempDir {
public:
    TempDir() {
        const char* base = getenv("TMPDIR");
        std::string tmpl = std::string(base && base[0] ? base : "/tmp") + "/gatedrepl-test-XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        path_ = buf.data();
    }

    ~TempDir() {
        remove_directory_recursive(path_);
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return join_path(path_, name); }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    std::string path_;
};

} // namespace test
} // namespace gatedrepl

#endif // gatedrepl_TESTS_TEST_HELPERS_HPP
