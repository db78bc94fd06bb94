/*
 * gatedrepl C++ - Session State Store Implementation
 *
 * SQLite backend: one table keyed by (session_id, key) holding JSON text.
 */
#include <gatedrepl/repl/state_store.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

namespace gatedrepl {

const char* const REPL_STATE_KEY = "repl_state";
const char* const REPL_PENDING_CODE_KEY = "temp:repl_pending_code";
const char* const REPL_ITERATION_KEY = "repl_iteration";
const char* const REPL_MAX_ITERATIONS_KEY = "repl_max_iterations";
const char* const REPL_CODE_HISTORY_KEY = "repl_code_history";
const char* const REPL_SECURITY_LEVEL_KEY = "repl_security_level";
const char* const REPL_FINAL_ANSWER_KEY = "repl_final_answer";
const char* const REPL_LAST_OUTPUT_KEY = "repl_last_output";
const char* const REPL_LAST_ERROR_KEY = "repl_last_error";
const char* const REPL_LOCALS_KEY = "repl_locals";
const char* const REPL_CONTEXT_KEY = "repl_context";
const char* const REPL_QUERY_KEY = "repl_query";
const char* const REPL_ARTIFACT_ENABLED_KEY = "repl_artifact_enabled";

// ============================================================================
// MemoryStateStore
// ============================================================================

bool MemoryStateStore::get(const std::string& key, Json& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Json>::const_iterator it = values_.find(key);
    if (it == values_.end()) return false;
    out = it->second;
    return true;
}

bool MemoryStateStore::set(const std::string& key, const Json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

bool MemoryStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return true;
}

bool MemoryStateStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    return true;
}

size_t MemoryStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

// ============================================================================
// Session view over the shared database
// ============================================================================

namespace {

class SqliteSessionStore : public StateStore {
public:
    SqliteSessionStore(SqliteStateDatabase& db, const std::string& session_id)
        : db_(db), session_id_(session_id) {}

    bool get(const std::string& key, Json& out) override { return db_.get(session_id_, key, out); }
    bool set(const std::string& key, const Json& value) override { return db_.set(session_id_, key, value); }
    bool remove(const std::string& key) override { return db_.remove(session_id_, key); }
    bool clear() override { return db_.clear_session(session_id_); }

private:
    SqliteStateDatabase& db_;
    std::string session_id_;
};

} // namespace

// ============================================================================
// SqliteStateDatabase
// ============================================================================

SqliteStateDatabase::SqliteStateDatabase() : db_(nullptr) {}

SqliteStateDatabase::~SqliteStateDatabase() {
    close();
}

bool SqliteStateDatabase::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    // Ensure parent directory exists
    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        set_error("cannot create parent directory for " + db_path);
        LOG_ERROR("[StateStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[StateStore] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL for concurrent readers
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA busy_timeout=5000");

    LOG_INFO("[StateStore] Database opened: %s", db_path.c_str());
    return true;
}

void SqliteStateDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteStateDatabase::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string SqliteStateDatabase::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void SqliteStateDatabase::set_error(const std::string& error) {
    last_error_ = error;
}

void SqliteStateDatabase::set_error_from_db() {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool SqliteStateDatabase::exec(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        set_error(err_msg ? err_msg : "unknown");
        LOG_ERROR("[StateStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SqliteStateDatabase::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("database not open");
        return false;
    }

    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS session_state ("
        "  session_id TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY (session_id, key)"
        ")"
    );
    if (!ok) return false;

    exec("CREATE INDEX IF NOT EXISTS idx_session_state_updated ON session_state(updated_at)");

    LOG_DEBUG("[StateStore] Schema ready");
    return true;
}

bool SqliteStateDatabase::get(const std::string& session_id, const std::string& key, Json& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "SELECT value FROM session_state WHERE session_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[StateStore] get prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        std::string text = col_text ? col_text : "null";
        try {
            out = Json::parse(text);
            found = true;
        } catch (const nlohmann::json::parse_error& e) {
            set_error(e.what());
            LOG_WARN("[StateStore] Corrupt value for %s/%s: %s", session_id.c_str(), key.c_str(), e.what());
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

bool SqliteStateDatabase::set(const std::string& session_id, const std::string& key, const Json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "INSERT OR REPLACE INTO session_state (session_id, key, value, updated_at) "
        "VALUES (?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[StateStore] set prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    // Invalid UTF-8 in script output is replaced rather than rejected
    std::string text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, current_timestamp_ms());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        LOG_ERROR("[StateStore] set step failed: %s", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteStateDatabase::remove(const std::string& session_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "DELETE FROM session_state WHERE session_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SqliteStateDatabase::clear_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "DELETE FROM session_state WHERE session_id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    LOG_DEBUG("[StateStore] Cleared session %s", session_id.c_str());
    return true;
}

std::vector<std::string> SqliteStateDatabase::list_sessions() {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return out;

    const char* sql = "SELECT DISTINCT session_id FROM session_state ORDER BY session_id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (col_text) out.push_back(col_text);
    }
    sqlite3_finalize(stmt);
    return out;
}

std::vector<std::string> SqliteStateDatabase::list_keys(const std::string& session_id) {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return out;

    const char* sql = "SELECT key FROM session_state WHERE session_id = ? ORDER BY key";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return out;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (col_text) out.push_back(col_text);
    }
    sqlite3_finalize(stmt);
    return out;
}

StateStorePtr SqliteStateDatabase::session_view(const std::string& session_id) {
    return StateStorePtr(new SqliteSessionStore(*this, session_id));
}

} // namespace gatedrepl
