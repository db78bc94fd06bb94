/*
 * gatedrepl C++ - Host Jail Implementation (Landlock)
 *
 * Uses Linux Landlock LSM to restrict filesystem access for the host
 * process. Landlock is unprivileged (no root/capabilities needed) and
 * available since Linux 5.13. If unsupported, the jail degrades gracefully
 * to directory preparation only.
 */
#include <gatedrepl/core/jail.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <climits>
#include <sys/stat.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#ifdef __linux__

#include <linux/landlock.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

// Landlock ABI v1 access rights
#define GATEDREPL_LANDLOCK_FS_ALL ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

#define GATEDREPL_LANDLOCK_FS_READ ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

#endif // __linux__

namespace gatedrepl {

// Prefix match on path boundaries: "/a/b" is under "/a" but "/ab" is not
static bool path_has_prefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return false;
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

// Resolve symlinks when the path exists, otherwise normalize lexically
static std::string canonical_or_normalized(const std::string& path) {
    char resolved[PATH_MAX];
    const char* rp = realpath(path.c_str(), resolved);
    return rp ? std::string(rp) : normalize_path(path);
}

// ============================================================================
// Jail Implementation
// ============================================================================

Jail& Jail::instance() {
    static Jail j;
    return j;
}

Jail::Jail()
    : active_(false)
    , supported_(false)
{
#ifdef __linux__
    // Check for Landlock support
    struct landlock_ruleset_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = GATEDREPL_LANDLOCK_FS_ALL;
    int fd = landlock_create_ruleset(&attr, sizeof(attr), 0);
    if (fd >= 0) {
        supported_ = true;
        close(fd);
    } else {
        supported_ = (errno != ENOSYS && errno != EOPNOTSUPP);
    }
#endif
}

std::string Jail::resolve_home_dir() const {
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }
    return "/tmp";
}

bool Jail::ensure_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        if (!ensure_directory(path.substr(0, pos))) {
            return false;
        }
    }
    return mkdir(path.c_str(), 0700) == 0 || errno == EEXIST;
}

bool Jail::init(const std::string& base_dir) {
    if (active_) {
        LOG_WARN("[Jail] Already active; layout cannot change");
        return false;
    }

    std::string base = base_dir.empty() ? resolve_home_dir() + "/.gatedrepl" : base_dir;
    base_dir_ = canonical_or_normalized(base);
    db_dir_ = base_dir_ + "/db";
    jail_dir_ = base_dir_ + "/jail";
    artifacts_dir_ = base_dir_ + "/artifacts";

    const std::string* dirs[] = { &base_dir_, &db_dir_, &jail_dir_, &artifacts_dir_ };
    for (size_t i = 0; i < sizeof(dirs) / sizeof(dirs[0]); ++i) {
        if (!ensure_directory(*dirs[i])) {
            LOG_ERROR("[Jail] Failed to create directory: %s (%s)",
                      dirs[i]->c_str(), strerror(errno));
            return false;
        }
    }
    if (!ensure_directory(sessions_dir())) {
        LOG_ERROR("[Jail] Failed to create sessions directory: %s (%s)",
                  sessions_dir().c_str(), strerror(errno));
        return false;
    }

    // realpath() now succeeds; keep the canonical form for prefix checks
    base_dir_ = canonical_or_normalized(base_dir_);
    db_dir_ = base_dir_ + "/db";
    jail_dir_ = base_dir_ + "/jail";
    artifacts_dir_ = base_dir_ + "/artifacts";

    LOG_DEBUG("[Jail] Landlock supported: %s", supported_ ? "yes" : "no");
    LOG_DEBUG("[Jail]   base: %s", base_dir_.c_str());
    LOG_DEBUG("[Jail]   jail: %s", jail_dir_.c_str());

    return true;
}

std::string Jail::sessions_dir() const {
    return jail_dir_ + "/sessions";
}

std::string Jail::state_db_path() const {
    return db_dir_ + "/state.db";
}

void Jail::allow_path(const std::string& path) {
    if (!active_) {
        extra_allowed_paths_.push_back(canonical_or_normalized(path));
    }
}

bool Jail::is_path_in_jail(const std::string& path) const {
    if (jail_dir_.empty()) return false;
    return path_has_prefix(canonical_or_normalized(path), jail_dir_);
}

bool Jail::is_path_allowed(const std::string& path) const {
    if (!active_) return true;

    std::string check_path = canonical_or_normalized(path);
    if (path_has_prefix(check_path, base_dir_)) {
        return true;
    }
    for (size_t i = 0; i < extra_allowed_paths_.size(); ++i) {
        if (path_has_prefix(check_path, extra_allowed_paths_[i])) {
            return true;
        }
    }
    return false;
}

std::string Jail::resolve_in_jail(const std::string& relative_path) const {
    if (relative_path.empty() || relative_path == ".") {
        return jail_dir_;
    }
    if (relative_path[0] == '/') {
        return relative_path;
    }
    return normalize_path(jail_dir_ + "/" + relative_path);
}

bool Jail::activate() {
    if (active_) return true;

#ifndef __linux__
    LOG_WARN("[Jail] Landlock is only available on Linux. Jail NOT active.");
    return false;
#else
    if (!supported_) {
        LOG_WARN("[Jail] Landlock not supported by this kernel. Jail NOT active.");
        return false;
    }
    if (base_dir_.empty()) {
        LOG_ERROR("[Jail] init() must run before activate()");
        return false;
    }

    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = GATEDREPL_LANDLOCK_FS_ALL;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        LOG_ERROR("[Jail] Failed to create Landlock ruleset: %s", strerror(errno));
        return false;
    }

    auto add_rule = [&](const std::string& dir_path, __u64 access) -> bool {
        int dir_fd = open(dir_path.c_str(), O_PATH | O_CLOEXEC);
        if (dir_fd < 0) {
            return false;
        }

        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = access;
        path_attr.parent_fd = dir_fd;

        int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
        close(dir_fd);
        return ret == 0;
    };

    if (!add_rule(base_dir_, GATEDREPL_LANDLOCK_FS_ALL)) {
        LOG_ERROR("[Jail] Cannot add Landlock rule for '%s': %s", base_dir_.c_str(), strerror(errno));
        close(ruleset_fd);
        return false;
    }

    // Read-only system directories so the process can still load libraries
    const char* readonly_dirs[] = {
        "/usr", "/lib", "/lib64", "/etc", "/dev", "/proc", NULL
    };
    for (int i = 0; readonly_dirs[i] != NULL; ++i) {
        if (add_rule(readonly_dirs[i], GATEDREPL_LANDLOCK_FS_READ)) {
            LOG_DEBUG("[Jail] Allowed R/O: %s", readonly_dirs[i]);
        }
    }

    for (size_t i = 0; i < extra_allowed_paths_.size(); ++i) {
        if (add_rule(extra_allowed_paths_[i], GATEDREPL_LANDLOCK_FS_ALL)) {
            LOG_DEBUG("[Jail] Allowed R/W (extra): %s", extra_allowed_paths_[i].c_str());
        }
    }

    // Required before restrict_self for unprivileged processes
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        LOG_ERROR("[Jail] Failed to set no_new_privs: %s", strerror(errno));
        close(ruleset_fd);
        return false;
    }

    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        LOG_ERROR("[Jail] Failed to restrict self: %s", strerror(errno));
        close(ruleset_fd);
        return false;
    }

    close(ruleset_fd);
    active_ = true;

    LOG_INFO("[Jail] Landlock active: R/W %s, R/O system directories", base_dir_.c_str());
    return true;
#endif // __linux__
}

} // namespace gatedrepl
