/*
 * gatedrepl C++ - Host Jail (Landlock)
 *
 * Prepares the on-disk layout used by the REPL host and can restrict
 * filesystem access for the entire process using the Linux Landlock LSM.
 *
 *   <base>/db         state database
 *   <base>/jail       sandbox-visible files
 *   <base>/jail/sessions/<id>   per-session context staging
 *   <base>/artifacts  audit artifacts
 *
 * The interpreter exposes no file primitives at all; the jail is the
 * second line for anything the host process itself touches.
 */
#ifndef gatedrepl_CORE_JAIL_HPP
#define gatedrepl_CORE_JAIL_HPP

#include <string>
#include <vector>

namespace gatedrepl {

class Jail {
public:
    Jail();

    // Process-wide jail used by the CLI driver
    static Jail& instance();

    // Create the directory layout under base_dir (default ~/.gatedrepl).
    // Must be called before activate().
    bool init(const std::string& base_dir = "");

    // Activate the Landlock ruleset. After this call, the process can ONLY
    // write inside base_dir (and extra allowed paths) and read system
    // directories. Returns true on success or if already active. Returns
    // false on error (but does NOT abort - caller decides policy).
    bool activate();

    bool is_active() const { return active_; }

    const std::string& base_dir() const { return base_dir_; }
    const std::string& db_dir() const { return db_dir_; }
    const std::string& jail_dir() const { return jail_dir_; }
    const std::string& artifacts_dir() const { return artifacts_dir_; }

    // <jail>/sessions
    std::string sessions_dir() const;

    // <db>/state.db
    std::string state_db_path() const;

    // Add an extra path to allow (must be called before activate())
    void allow_path(const std::string& path);

    // Check if a path is within the jail directory
    bool is_path_in_jail(const std::string& path) const;

    // Check if a path is within allowed boundaries (always true when inactive)
    bool is_path_allowed(const std::string& path) const;

    // Resolve a relative path within the jail
    std::string resolve_in_jail(const std::string& relative_path) const;

private:
    Jail(const Jail&);
    Jail& operator=(const Jail&);

    bool ensure_directory(const std::string& path);
    std::string resolve_home_dir() const;

    bool active_;
    bool supported_;
    std::string base_dir_;
    std::string db_dir_;
    std::string jail_dir_;
    std::string artifacts_dir_;
    std::vector<std::string> extra_allowed_paths_;
};

} // namespace gatedrepl

#endif // gatedrepl_CORE_JAIL_HPP
