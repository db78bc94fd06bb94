/*
 * gatedrepl C++ - Session State Store
 *
 * Session-scoped key/value store for the persisted REPL fields
 * (repl_state, repl_iteration, repl_code_history, ...). Values are JSON.
 *
 *   StateStore           - interface consumed by the service
 *   MemoryStateStore     - in-process map (default)
 *   SqliteStateDatabase  - owns the sqlite3 handle, hands out per-session
 *                          StateStore views over one shared table
 *
 * Failures are reported by returning false and logging; callers treat the
 * store as an I/O boundary and keep going.
 */
#ifndef gatedrepl_REPL_STATE_STORE_HPP
#define gatedrepl_REPL_STATE_STORE_HPP

#include <gatedrepl/core/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace gatedrepl {

// Persisted field names
extern const char* const REPL_STATE_KEY;
extern const char* const REPL_PENDING_CODE_KEY;
extern const char* const REPL_ITERATION_KEY;
extern const char* const REPL_MAX_ITERATIONS_KEY;
extern const char* const REPL_CODE_HISTORY_KEY;
extern const char* const REPL_SECURITY_LEVEL_KEY;
extern const char* const REPL_FINAL_ANSWER_KEY;
extern const char* const REPL_LAST_OUTPUT_KEY;
extern const char* const REPL_LAST_ERROR_KEY;
extern const char* const REPL_LOCALS_KEY;
extern const char* const REPL_CONTEXT_KEY;
extern const char* const REPL_QUERY_KEY;
extern const char* const REPL_ARTIFACT_ENABLED_KEY;

class StateStore {
public:
    virtual ~StateStore() {}

    // False when the key is absent or unreadable
    virtual bool get(const std::string& key, Json& out) = 0;
    virtual bool set(const std::string& key, const Json& value) = 0;
    virtual bool remove(const std::string& key) = 0;

    // Drop every key of this session
    virtual bool clear() = 0;
};

typedef std::shared_ptr<StateStore> StateStorePtr;

// ============================================================================
// MemoryStateStore
// ============================================================================

class MemoryStateStore : public StateStore {
public:
    bool get(const std::string& key, Json& out) override;
    bool set(const std::string& key, const Json& value) override;
    bool remove(const std::string& key) override;
    bool clear() override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Json> values_;
};

// ============================================================================
// SqliteStateDatabase
// ============================================================================

class SqliteStateDatabase {
public:
    SqliteStateDatabase();
    ~SqliteStateDatabase();

    // Database lifecycle
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Schema management
    bool ensure_schema();

    // Raw access
    bool get(const std::string& session_id, const std::string& key, Json& out);
    bool set(const std::string& session_id, const std::string& key, const Json& value);
    bool remove(const std::string& session_id, const std::string& key);
    bool clear_session(const std::string& session_id);
    std::vector<std::string> list_sessions();
    std::vector<std::string> list_keys(const std::string& session_id);

    // Session-scoped view; the database must outlive it
    StateStorePtr session_view(const std::string& session_id);

    std::string last_error() const;

private:
    SqliteStateDatabase(const SqliteStateDatabase&);
    SqliteStateDatabase& operator=(const SqliteStateDatabase&);

    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db();

    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_STATE_STORE_HPP
