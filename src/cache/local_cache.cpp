/**
 * @file local_cache.cpp
 * @brief SQLite implementation of LocalCache
 */

#include <opsdeck_cpp/local_cache.hpp>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>
#include <sqlite3.h>

namespace opsdeck {

namespace {

Status sqlite_error(sqlite3* db, const std::string& operation) {
    return absl::InternalError(
        absl::StrFormat("SQLite %s failed: %s", operation, sqlite3_errmsg(db)));
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Owns one prepared statement
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Status prepared(const std::string& operation) const {
        return rc_ == SQLITE_OK ? absl::OkStatus() : sqlite_error(db_, operation);
    }

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind_text(int index, const std::optional<std::string>& value) {
        if (value) {
            bind_text(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind_int(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind_real(int index, double value) {
        sqlite3_bind_double(stmt_, index, value);
    }

    void bind_real(int index, const std::optional<double>& value) {
        if (value) {
            bind_real(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    int step() {
        return sqlite3_step(stmt_);
    }

    /// Step a statement that returns no rows
    Status run(const std::string& operation) {
        int rc = step();
        if (rc != SQLITE_DONE) {
            return sqlite_error(db_, operation);
        }
        return absl::OkStatus();
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(stmt_, col);
        return value != nullptr ? reinterpret_cast<const char*>(value) : "";
    }

    std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return text(col);
    }

    int64_t integer(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    double real(int col) const {
        return sqlite3_column_double(stmt_, col);
    }

    std::optional<double> optional_real(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return real(col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int rc_;
};

/**
 * @brief Scoped transaction, rolled back unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        begun_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    ~Transaction() {
        if (begun_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Status begun() const {
        return begun_ ? absl::OkStatus() : sqlite_error(db_, "begin transaction");
    }

    Status commit() {
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return sqlite_error(db_, "commit");
        }
        committed_ = true;
        return absl::OkStatus();
    }

private:
    sqlite3* db_;
    bool begun_ = false;
    bool committed_ = false;
};

// ============================================================================
// Schema
// ============================================================================

constexpr const char* kCreateSchema = R"sql(
CREATE TABLE IF NOT EXISTS sessions (
    id TEXT PRIMARY KEY,
    repo TEXT NOT NULL,
    status TEXT NOT NULL,
    worktree_path TEXT,
    agent_session_id TEXT,
    created_at INTEGER NOT NULL,
    last_activity INTEGER NOT NULL,
    message_count INTEGER NOT NULL DEFAULT 0,
    total_cost_usd REAL NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS messages (
    id TEXT PRIMARY KEY,
    session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,
    role TEXT NOT NULL,
    content TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    cost_usd REAL,
    tool_name TEXT,
    tool_input TEXT
);
CREATE TABLE IF NOT EXISTS jobs (
    issue_id TEXT PRIMARY KEY,
    repo TEXT NOT NULL,
    issue_num INTEGER NOT NULL,
    issue_title TEXT NOT NULL,
    command TEXT NOT NULL,
    status TEXT NOT NULL,
    start_time REAL NOT NULL,
    completed_time REAL,
    error TEXT,
    log_path TEXT,
    local_path TEXT,
    full_command TEXT,
    cost_total_usd REAL,
    cost_input_tokens INTEGER,
    cost_output_tokens INTEGER,
    cost_cache_read_tokens INTEGER,
    cost_cache_creation_tokens INTEGER,
    cost_model TEXT,
    cached_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS hidden_issues (
    issue_key TEXT PRIMARY KEY,
    repo TEXT NOT NULL,
    issue_num INTEGER NOT NULL,
    issue_title TEXT NOT NULL,
    reason TEXT NOT NULL,
    hidden_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS metadata (
    key TEXT PRIMARY KEY,
    value TEXT
);
CREATE INDEX IF NOT EXISTS idx_sessions_repo ON sessions(repo);
CREATE INDEX IF NOT EXISTS idx_sessions_last_activity ON sessions(last_activity);
CREATE INDEX IF NOT EXISTS idx_messages_session ON messages(session_id);
CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages(timestamp);
CREATE INDEX IF NOT EXISTS idx_jobs_issue ON jobs(repo, issue_num);
)sql";

constexpr const char* kSessionColumns =
    "id, repo, status, worktree_path, agent_session_id, created_at, last_activity, "
    "message_count, total_cost_usd";

constexpr const char* kMessageColumns =
    "id, session_id, role, content, timestamp, cost_usd, tool_name, tool_input";

constexpr const char* kJobColumns =
    "issue_id, repo, issue_num, issue_title, command, status, start_time, completed_time, "
    "error, log_path, local_path, full_command, cost_total_usd, cost_input_tokens, "
    "cost_output_tokens, cost_cache_read_tokens, cost_cache_creation_tokens, cost_model";

Session read_session(const Statement& s) {
    Session session;
    session.id = s.text(0);
    session.repo = s.text(1);
    session.status = parse_session_status(s.text(2));
    session.worktree_path = s.optional_text(3);
    session.agent_session_id = s.optional_text(4);
    session.created_at_ms = s.integer(5);
    session.last_activity_ms = s.integer(6);
    session.message_count = static_cast<int>(s.integer(7));
    session.total_cost_usd = s.real(8);
    return session;
}

SessionMessage read_message(const Statement& s) {
    SessionMessage message;
    message.id = s.text(0);
    message.session_id = s.text(1);
    message.role = parse_message_role(s.text(2));
    message.content = s.text(3);
    message.timestamp_ms = s.integer(4);
    message.cost_usd = s.optional_real(5);
    message.tool_name = s.optional_text(6);
    message.tool_input = s.optional_text(7);
    return message;
}

JobStatus job_status_from_name(const std::string& name) {
    for (auto status : {JobStatus::RUNNING, JobStatus::PENDING, JobStatus::COMPLETED,
                        JobStatus::FAILED, JobStatus::WAITING_APPROVAL, JobStatus::REJECTED,
                        JobStatus::BLOCKED, JobStatus::INTERRUPTED, JobStatus::APPROVED_RESUME}) {
        if (job_status_name(status) == name) {
            return status;
        }
    }
    return JobStatus::UNKNOWN;
}

Job read_job(const Statement& s) {
    Job job;
    job.issue_id = s.text(0);
    job.repo = s.text(1);
    job.issue_num = static_cast<int>(s.integer(2));
    job.issue_title = s.text(3);
    job.command = s.text(4);
    job.status = job_status_from_name(s.text(5));
    job.start_time = s.real(6);
    job.completed_time = s.optional_real(7);
    job.error = s.optional_text(8);
    job.log_path = s.optional_text(9);
    job.local_path = s.optional_text(10);
    job.full_command = s.optional_text(11);
    if (!s.is_null(12)) {
        JobCost cost;
        cost.total_usd = s.real(12);
        cost.input_tokens = s.integer(13);
        cost.output_tokens = s.integer(14);
        cost.cache_read_tokens = s.integer(15);
        cost.cache_creation_tokens = s.integer(16);
        cost.model = s.text(17);
        job.cost = cost;
    }
    return job;
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

LocalCache::LocalCache(sqlite3* db) : db_(db) {}

LocalCache::~LocalCache() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<LocalCache>> LocalCache::open(const std::string& path,
                                                     const EvictionPolicy& policy,
                                                     UpgradeHook on_upgrade) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        Status error = absl::UnavailableError(
            absl::StrFormat("Cannot open cache at %s: %s", path,
                            db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        sqlite3_close(db);
        return error;
    }

    std::unique_ptr<LocalCache> cache(new LocalCache(db));

    auto status = cache->init_schema(on_upgrade);
    if (!status.ok()) {
        return status;
    }

    auto report = cache->evict(policy);
    if (!report.ok()) {
        LOG(WARNING) << "[LocalCache] Startup eviction failed: " << report.status();
    }

    LOG(INFO) << "[LocalCache] Opened " << path << " (schema v" << cache->schema_version_ << ")";
    return cache;
}

Status LocalCache::init_schema(const UpgradeHook& on_upgrade) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto status = exec_locked("PRAGMA foreign_keys = ON");
    if (!status.ok()) {
        return status;
    }
    // In-memory databases report "memory" here, which is fine
    sqlite3_exec(db_, "PRAGMA journal_mode = WAL", nullptr, nullptr, nullptr);

    int stored_version = 0;
    {
        Statement query(db_, "PRAGMA user_version");
        status = query.prepared("read schema version");
        if (!status.ok()) {
            return status;
        }
        if (query.step() == SQLITE_ROW) {
            stored_version = static_cast<int>(query.integer(0));
        }
    }

    status = exec_locked(kCreateSchema);
    if (!status.ok()) {
        return status;
    }

    if (stored_version != 0 && stored_version < kSchemaVersion) {
        LOG(INFO) << "[LocalCache] Upgrading schema v" << stored_version
                  << " -> v" << kSchemaVersion;
        if (on_upgrade) {
            lock.unlock();
            status = on_upgrade(*this, stored_version, kSchemaVersion);
            lock.lock();
            if (!status.ok()) {
                return status;
            }
        }
    } else if (stored_version > kSchemaVersion) {
        LOG(WARNING) << "[LocalCache] Database schema v" << stored_version
                     << " is newer than supported v" << kSchemaVersion;
        schema_version_ = stored_version;
        return absl::OkStatus();
    }

    status = exec_locked(absl::StrCat("PRAGMA user_version = ", kSchemaVersion));
    if (!status.ok()) {
        return status;
    }
    schema_version_ = kSchemaVersion;
    return absl::OkStatus();
}

Status LocalCache::exec_locked(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        Status status = absl::InternalError(
            absl::StrFormat("SQLite exec failed: %s", error != nullptr ? error : "unknown"));
        sqlite3_free(error);
        return status;
    }
    return absl::OkStatus();
}

Status LocalCache::execute(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked(sql);
}

// ============================================================================
// Sessions
// ============================================================================

Status LocalCache::upsert_session_locked(const Session& session) {
    // ON CONFLICT keeps the row (and its messages); REPLACE would delete it
    Statement stmt(db_, absl::StrCat(
        "INSERT INTO sessions (", kSessionColumns, ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) "
        "ON CONFLICT(id) DO UPDATE SET repo = excluded.repo, status = excluded.status, "
        "worktree_path = excluded.worktree_path, agent_session_id = excluded.agent_session_id, "
        "created_at = excluded.created_at, last_activity = excluded.last_activity, "
        "message_count = excluded.message_count, total_cost_usd = excluded.total_cost_usd"));
    auto status = stmt.prepared("upsert session");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, session.id);
    stmt.bind_text(2, session.repo);
    stmt.bind_text(3, session_status_name(session.status));
    stmt.bind_text(4, session.worktree_path);
    stmt.bind_text(5, session.agent_session_id);
    stmt.bind_int(6, session.created_at_ms);
    stmt.bind_int(7, session.last_activity_ms);
    stmt.bind_int(8, session.message_count);
    stmt.bind_real(9, session.total_cost_usd);
    return stmt.run("upsert session");
}

Status LocalCache::upsert_session(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_session_locked(session);
}

Status LocalCache::upsert_sessions(const std::vector<Session>& sessions) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }
    for (const auto& session : sessions) {
        status = upsert_session_locked(session);
        if (!status.ok()) {
            return status;
        }
    }
    return tx.commit();
}

Result<std::optional<Session>> LocalCache::get_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, absl::StrCat("SELECT ", kSessionColumns, " FROM sessions WHERE id = ?1"));
    auto status = stmt.prepared("get session");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<Session>(read_session(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "get session");
    }
    return std::optional<Session>();
}

Result<std::vector<Session>> LocalCache::list_sessions(const std::optional<std::string>& repo) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = absl::StrCat("SELECT ", kSessionColumns, " FROM sessions");
    if (repo) {
        absl::StrAppend(&sql, " WHERE repo = ?1");
    }
    absl::StrAppend(&sql, " ORDER BY last_activity DESC");

    Statement stmt(db_, sql);
    auto status = stmt.prepared("list sessions");
    if (!status.ok()) {
        return status;
    }
    if (repo) {
        stmt.bind_text(1, *repo);
    }

    std::vector<Session> sessions;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        sessions.push_back(read_session(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "list sessions");
    }
    return sessions;
}

Status LocalCache::delete_session_locked(const std::string& id) {
    Statement messages(db_, "DELETE FROM messages WHERE session_id = ?1");
    auto status = messages.prepared("delete session messages");
    if (!status.ok()) {
        return status;
    }
    messages.bind_text(1, id);
    status = messages.run("delete session messages");
    if (!status.ok()) {
        return status;
    }

    Statement session(db_, "DELETE FROM sessions WHERE id = ?1");
    status = session.prepared("delete session");
    if (!status.ok()) {
        return status;
    }
    session.bind_text(1, id);
    return session.run("delete session");
}

Status LocalCache::delete_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }
    status = delete_session_locked(id);
    if (!status.ok()) {
        return status;
    }
    return tx.commit();
}

Result<int> LocalCache::session_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM sessions");
    auto status = stmt.prepared("count sessions");
    if (!status.ok()) {
        return status;
    }
    if (stmt.step() != SQLITE_ROW) {
        return sqlite_error(db_, "count sessions");
    }
    return static_cast<int>(stmt.integer(0));
}

// ============================================================================
// Messages
// ============================================================================

Status LocalCache::upsert_message_locked(const SessionMessage& message) {
    Statement stmt(db_, absl::StrCat(
        "INSERT OR REPLACE INTO messages (", kMessageColumns, ") "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)"));
    auto status = stmt.prepared("upsert message");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, message.id);
    stmt.bind_text(2, message.session_id);
    stmt.bind_text(3, message_role_name(message.role));
    stmt.bind_text(4, message.content);
    stmt.bind_int(5, message.timestamp_ms);
    stmt.bind_real(6, message.cost_usd);
    stmt.bind_text(7, message.tool_name);
    stmt.bind_text(8, message.tool_input);
    return stmt.run("upsert message");
}

Status LocalCache::upsert_message(const SessionMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_message_locked(message);
}

Status LocalCache::upsert_messages(const std::vector<SessionMessage>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }
    for (const auto& message : messages) {
        status = upsert_message_locked(message);
        if (!status.ok()) {
            return status;
        }
    }
    return tx.commit();
}

Result<std::vector<SessionMessage>> LocalCache::list_messages(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, absl::StrCat("SELECT ", kMessageColumns,
                                     " FROM messages WHERE session_id = ?1 ORDER BY timestamp ASC"));
    auto status = stmt.prepared("list messages");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, session_id);

    std::vector<SessionMessage> messages;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        messages.push_back(read_message(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "list messages");
    }
    return messages;
}

Result<int> LocalCache::message_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM messages");
    auto status = stmt.prepared("count messages");
    if (!status.ok()) {
        return status;
    }
    if (stmt.step() != SQLITE_ROW) {
        return sqlite_error(db_, "count messages");
    }
    return static_cast<int>(stmt.integer(0));
}

// ============================================================================
// Jobs
// ============================================================================

Status LocalCache::upsert_job_locked(const Job& job) {
    Statement stmt(db_, absl::StrCat(
        "INSERT OR REPLACE INTO jobs (", kJobColumns, ", cached_at) VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19)"));
    auto status = stmt.prepared("upsert job");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, job.issue_id);
    stmt.bind_text(2, job.repo);
    stmt.bind_int(3, job.issue_num);
    stmt.bind_text(4, job.issue_title);
    stmt.bind_text(5, job.command);
    stmt.bind_text(6, job_status_name(job.status));
    stmt.bind_real(7, job.start_time);
    stmt.bind_real(8, job.completed_time);
    stmt.bind_text(9, job.error);
    stmt.bind_text(10, job.log_path);
    stmt.bind_text(11, job.local_path);
    stmt.bind_text(12, job.full_command);
    if (job.cost) {
        stmt.bind_real(13, job.cost->total_usd);
        stmt.bind_int(14, job.cost->input_tokens);
        stmt.bind_int(15, job.cost->output_tokens);
        stmt.bind_int(16, job.cost->cache_read_tokens);
        stmt.bind_int(17, job.cost->cache_creation_tokens);
        stmt.bind_text(18, job.cost->model);
    } else {
        for (int i = 13; i <= 18; ++i) {
            stmt.bind_text(i, std::optional<std::string>());
        }
    }
    stmt.bind_int(19, now_millis());
    return stmt.run("upsert job");
}

Status LocalCache::upsert_job(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_job_locked(job);
}

Status LocalCache::upsert_jobs(const std::vector<Job>& jobs) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }
    for (const auto& job : jobs) {
        status = upsert_job_locked(job);
        if (!status.ok()) {
            return status;
        }
    }
    return tx.commit();
}

Result<std::optional<Job>> LocalCache::get_job(const std::string& issue_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, absl::StrCat("SELECT ", kJobColumns, " FROM jobs WHERE issue_id = ?1"));
    auto status = stmt.prepared("get job");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, issue_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<Job>(read_job(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "get job");
    }
    return std::optional<Job>();
}

Result<std::vector<Job>> LocalCache::list_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, absl::StrCat("SELECT ", kJobColumns,
                                     " FROM jobs ORDER BY start_time DESC"));
    auto status = stmt.prepared("list jobs");
    if (!status.ok()) {
        return status;
    }

    std::vector<Job> jobs;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        jobs.push_back(read_job(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "list jobs");
    }
    return jobs;
}

Result<std::vector<Job>> LocalCache::list_jobs_for_issue(const std::string& repo, int issue_num) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, absl::StrCat("SELECT ", kJobColumns,
                                     " FROM jobs WHERE repo = ?1 AND issue_num = ?2"
                                     " ORDER BY start_time DESC"));
    auto status = stmt.prepared("list jobs for issue");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, repo);
    stmt.bind_int(2, issue_num);

    std::vector<Job> jobs;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        jobs.push_back(read_job(stmt));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "list jobs for issue");
    }
    return jobs;
}

Status LocalCache::delete_job(const std::string& issue_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM jobs WHERE issue_id = ?1");
    auto status = stmt.prepared("delete job");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, issue_id);
    return stmt.run("delete job");
}

// ============================================================================
// Hidden issues
// ============================================================================

Status LocalCache::hide_issue(const HiddenIssue& issue) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO hidden_issues "
                        "(issue_key, repo, issue_num, issue_title, reason, hidden_at) "
                        "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    auto status = stmt.prepared("hide issue");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, issue.issue_key);
    stmt.bind_text(2, issue.repo);
    stmt.bind_int(3, issue.issue_num);
    stmt.bind_text(4, issue.issue_title);
    stmt.bind_text(5, issue.reason);
    stmt.bind_int(6, issue.hidden_at_ms != 0 ? issue.hidden_at_ms : now_millis());
    return stmt.run("hide issue");
}

Status LocalCache::unhide_issue(const std::string& issue_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM hidden_issues WHERE issue_key = ?1");
    auto status = stmt.prepared("unhide issue");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_text(1, issue_key);
    return stmt.run("unhide issue");
}

Result<std::vector<HiddenIssue>> LocalCache::list_hidden_issues() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT issue_key, repo, issue_num, issue_title, reason, hidden_at "
                        "FROM hidden_issues ORDER BY hidden_at DESC, issue_key");
    auto status = stmt.prepared("list hidden issues");
    if (!status.ok()) {
        return status;
    }

    std::vector<HiddenIssue> hidden;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        HiddenIssue issue;
        issue.issue_key = stmt.text(0);
        issue.repo = stmt.text(1);
        issue.issue_num = static_cast<int>(stmt.integer(2));
        issue.issue_title = stmt.text(3);
        issue.reason = stmt.text(4);
        issue.hidden_at_ms = stmt.integer(5);
        hidden.push_back(std::move(issue));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "list hidden issues");
    }
    return hidden;
}

Result<std::set<std::string>> LocalCache::hidden_issue_keys() {
    auto hidden = list_hidden_issues();
    if (!hidden.ok()) {
        return hidden.status();
    }
    std::set<std::string> keys;
    for (const auto& issue : *hidden) {
        keys.insert(issue.issue_key);
    }
    return keys;
}

// ============================================================================
// Metadata
// ============================================================================

Status LocalCache::set_last_sync_time(std::chrono::system_clock::time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO metadata (key, value) VALUES ('last_sync_time', ?1)");
    auto status = stmt.prepared("set last sync time");
    if (!status.ok()) {
        return status;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    stmt.bind_text(1, std::to_string(ms));
    return stmt.run("set last sync time");
}

Result<std::optional<std::chrono::system_clock::time_point>> LocalCache::last_sync_time() {
    using TimePoint = std::chrono::system_clock::time_point;

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT value FROM metadata WHERE key = 'last_sync_time'");
    auto status = stmt.prepared("get last sync time");
    if (!status.ok()) {
        return status;
    }

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return std::optional<TimePoint>();
    }
    if (rc != SQLITE_ROW) {
        return sqlite_error(db_, "get last sync time");
    }

    int64_t ms = 0;
    if (!absl::SimpleAtoi(stmt.text(0), &ms)) {
        LOG(WARNING) << "[LocalCache] Ignoring malformed last_sync_time '" << stmt.text(0) << "'";
        return std::optional<TimePoint>();
    }
    return std::optional<TimePoint>(TimePoint(std::chrono::milliseconds(ms)));
}

Status LocalCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }
    for (const char* table : {"messages", "sessions", "jobs", "hidden_issues", "metadata"}) {
        status = exec_locked(absl::StrCat("DELETE FROM ", table));
        if (!status.ok()) {
            return status;
        }
    }
    return tx.commit();
}

// ============================================================================
// Eviction
// ============================================================================

namespace {

/// Ids of sessions ranked beyond the cap within their repo
constexpr const char* kSessionsOverCap =
    "SELECT id FROM (SELECT id, ROW_NUMBER() OVER ("
    "PARTITION BY repo ORDER BY last_activity DESC, id) AS pos FROM sessions) "
    "WHERE pos > ?1";

constexpr const char* kJobsOverCap =
    "SELECT issue_id FROM (SELECT issue_id, ROW_NUMBER() OVER ("
    "PARTITION BY repo ORDER BY start_time DESC, issue_id) AS pos FROM jobs) "
    "WHERE pos > ?1";

}  // namespace

Result<int> LocalCache::evict_sessions_by_age(int64_t cutoff_ms) {
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }

    Statement children(db_, "DELETE FROM messages WHERE session_id IN "
                            "(SELECT id FROM sessions WHERE last_activity < ?1)");
    status = children.prepared("evict expired messages");
    if (!status.ok()) {
        return status;
    }
    children.bind_int(1, cutoff_ms);
    status = children.run("evict expired messages");
    if (!status.ok()) {
        return status;
    }

    Statement parents(db_, "DELETE FROM sessions WHERE last_activity < ?1");
    status = parents.prepared("evict expired sessions");
    if (!status.ok()) {
        return status;
    }
    parents.bind_int(1, cutoff_ms);
    status = parents.run("evict expired sessions");
    if (!status.ok()) {
        return status;
    }
    int removed = sqlite3_changes(db_);

    status = tx.commit();
    if (!status.ok()) {
        return status;
    }
    return removed;
}

Result<int> LocalCache::evict_sessions_over_cap(int max_per_repo) {
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }

    Statement children(db_, absl::StrCat(
        "DELETE FROM messages WHERE session_id IN (", kSessionsOverCap, ")"));
    status = children.prepared("evict capped messages");
    if (!status.ok()) {
        return status;
    }
    children.bind_int(1, max_per_repo);
    status = children.run("evict capped messages");
    if (!status.ok()) {
        return status;
    }

    Statement parents(db_, absl::StrCat("DELETE FROM sessions WHERE id IN (", kSessionsOverCap, ")"));
    status = parents.prepared("evict capped sessions");
    if (!status.ok()) {
        return status;
    }
    parents.bind_int(1, max_per_repo);
    status = parents.run("evict capped sessions");
    if (!status.ok()) {
        return status;
    }
    int removed = sqlite3_changes(db_);

    status = tx.commit();
    if (!status.ok()) {
        return status;
    }
    return removed;
}

Result<int> LocalCache::evict_jobs_by_age(double cutoff_seconds) {
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }

    Statement stmt(db_, "DELETE FROM jobs WHERE start_time < ?1");
    status = stmt.prepared("evict expired jobs");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_real(1, cutoff_seconds);
    status = stmt.run("evict expired jobs");
    if (!status.ok()) {
        return status;
    }
    int removed = sqlite3_changes(db_);

    status = tx.commit();
    if (!status.ok()) {
        return status;
    }
    return removed;
}

Result<int> LocalCache::evict_jobs_over_cap(int max_per_repo) {
    Transaction tx(db_);
    auto status = tx.begun();
    if (!status.ok()) {
        return status;
    }

    Statement stmt(db_, absl::StrCat("DELETE FROM jobs WHERE issue_id IN (", kJobsOverCap, ")"));
    status = stmt.prepared("evict capped jobs");
    if (!status.ok()) {
        return status;
    }
    stmt.bind_int(1, max_per_repo);
    status = stmt.run("evict capped jobs");
    if (!status.ok()) {
        return status;
    }
    int removed = sqlite3_changes(db_);

    status = tx.commit();
    if (!status.ok()) {
        return status;
    }
    return removed;
}

Result<EvictionReport> LocalCache::evict(const EvictionPolicy& policy, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    EvictionReport report;

    auto session_cutoff = now_ms - std::chrono::duration_cast<std::chrono::milliseconds>(
        policy.session_max_age).count();
    auto expired = evict_sessions_by_age(session_cutoff);
    if (!expired.ok()) {
        return expired.status();
    }
    report.sessions_expired = *expired;

    if (policy.session_max_per_repo > 0) {
        auto capped = evict_sessions_over_cap(policy.session_max_per_repo);
        if (!capped.ok()) {
            return capped.status();
        }
        report.sessions_over_cap = *capped;
    }

    double job_cutoff = static_cast<double>(now_ms) / 1000.0 -
        static_cast<double>(std::chrono::duration_cast<std::chrono::seconds>(
            policy.job_max_age).count());
    auto old_jobs = evict_jobs_by_age(job_cutoff);
    if (!old_jobs.ok()) {
        return old_jobs.status();
    }
    report.jobs_expired = *old_jobs;

    if (policy.job_max_per_repo > 0) {
        auto capped = evict_jobs_over_cap(policy.job_max_per_repo);
        if (!capped.ok()) {
            return capped.status();
        }
        report.jobs_over_cap = *capped;
    }

    if (report.sessions_expired + report.sessions_over_cap +
        report.jobs_expired + report.jobs_over_cap > 0) {
        LOG(INFO) << "[LocalCache] Evicted sessions(expired=" << report.sessions_expired
                  << ", over_cap=" << report.sessions_over_cap << ") jobs(expired="
                  << report.jobs_expired << ", over_cap=" << report.jobs_over_cap << ")";
    }
    return report;
}

Result<EvictionReport> LocalCache::evict(const EvictionPolicy& policy) {
    return evict(policy, now_millis());
}

}  // namespace opsdeck
