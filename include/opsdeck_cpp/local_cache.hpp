/**
 * @file local_cache.hpp
 * @brief Durable SQLite store for sessions, their messages, and jobs
 *
 * Two record families are kept:
 * - sessions (parent, partitioned by repo) with messages as child records,
 *   deleted together with their session
 * - jobs, independent of sessions, keyed by issue id
 *
 * Hidden issue keys are kept alongside and are never evicted.
 *
 * All writes are insert-or-update by primary key, so repeating a write is
 * harmless and the last write wins. Updating a session never touches its
 * messages.
 *
 * Example usage:
 * @code
 * auto cache = LocalCache::open("/var/lib/opsdeck/cache.db", EvictionPolicy{});
 * if (!cache.ok()) {
 *     LOG(ERROR) << "Cache unavailable: " << cache.status();
 *     return;
 * }
 * (*cache)->upsert_jobs(jobs);
 * auto cached = (*cache)->list_jobs();
 * @endcode
 *
 * Thread safety: all methods may be called from any thread. Each batch and
 * each eviction pass runs in its own transaction, so readers never see a
 * session without its messages or a half-applied batch.
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/types.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct sqlite3;

namespace opsdeck {

/**
 * @brief Bounds applied by the eviction sweep
 *
 * A per-repo cap of 0 disables the cap pass for that family.
 */
struct EvictionPolicy {
    std::chrono::hours session_max_age{24};
    int session_max_per_repo = 10;
    std::chrono::hours job_max_age{24 * 30};
    int job_max_per_repo = 0;
};

/**
 * @brief Number of records removed by one sweep
 */
struct EvictionReport {
    int sessions_expired = 0;
    int sessions_over_cap = 0;
    int jobs_expired = 0;
    int jobs_over_cap = 0;
};

class LocalCache {
public:
    static constexpr int kSchemaVersion = 2;

    /**
     * @brief Called when an existing database has an older schema version
     *
     * Runs inside the open sequence before the sweep. Returning an error
     * aborts open().
     */
    using UpgradeHook = std::function<Status(LocalCache& cache, int old_version, int new_version)>;

    /**
     * @brief Open (or create) the cache and run the eviction sweep
     *
     * Sweep failures are logged and do not fail the open.
     *
     * @param path Database file, or ":memory:"
     * @param policy Eviction bounds for the startup sweep
     * @param on_upgrade Optional schema upgrade hook
     * @return Cache instance, or error if the database cannot be opened or created
     */
    static Result<std::unique_ptr<LocalCache>> open(const std::string& path,
                                                    const EvictionPolicy& policy,
                                                    UpgradeHook on_upgrade = {});

    ~LocalCache();

    LocalCache(const LocalCache&) = delete;
    LocalCache& operator=(const LocalCache&) = delete;

    // ========================================================================
    // Sessions
    // ========================================================================

    Status upsert_session(const Session& session);

    /// All sessions in one transaction
    Status upsert_sessions(const std::vector<Session>& sessions);

    Result<std::optional<Session>> get_session(const std::string& id);

    /**
     * @brief Sessions ordered by last activity, most recent first
     * @param repo When set, only sessions of that repo
     */
    Result<std::vector<Session>> list_sessions(const std::optional<std::string>& repo = std::nullopt);

    /// Delete a session together with its messages
    Status delete_session(const std::string& id);

    Result<int> session_count();

    // ========================================================================
    // Messages
    // ========================================================================

    Status upsert_message(const SessionMessage& message);
    Status upsert_messages(const std::vector<SessionMessage>& messages);

    /// Messages of one session, oldest first
    Result<std::vector<SessionMessage>> list_messages(const std::string& session_id);

    Result<int> message_count();

    // ========================================================================
    // Jobs
    // ========================================================================

    Status upsert_job(const Job& job);
    Status upsert_jobs(const std::vector<Job>& jobs);
    Result<std::optional<Job>> get_job(const std::string& issue_id);

    /// All jobs, newest start time first
    Result<std::vector<Job>> list_jobs();

    Result<std::vector<Job>> list_jobs_for_issue(const std::string& repo, int issue_num);

    Status delete_job(const std::string& issue_id);

    // ========================================================================
    // Hidden issues
    // ========================================================================

    /// Hiding an already hidden issue replaces its record
    Status hide_issue(const HiddenIssue& issue);
    Status unhide_issue(const std::string& issue_key);

    /// Most recently hidden first
    Result<std::vector<HiddenIssue>> list_hidden_issues();
    Result<std::set<std::string>> hidden_issue_keys();

    // ========================================================================
    // Metadata and maintenance
    // ========================================================================

    Status set_last_sync_time(std::chrono::system_clock::time_point when);
    Result<std::optional<std::chrono::system_clock::time_point>> last_sync_time();

    /**
     * @brief Run the eviction sweep
     *
     * Sessions: an age pass, then a per-repo cap pass keeping the most
     * recently active. Jobs: the same by start time. Each pass is one
     * transaction; deleted sessions take their messages with them.
     * Safe to call repeatedly.
     *
     * @param now_ms Reference time in epoch milliseconds
     */
    Result<EvictionReport> evict(const EvictionPolicy& policy, int64_t now_ms);
    Result<EvictionReport> evict(const EvictionPolicy& policy);

    /// Remove every record from every table
    Status clear_all();

    /// Execute raw SQL (used by upgrade hooks)
    Status execute(const std::string& sql);

    int schema_version() const { return schema_version_; }

private:
    explicit LocalCache(sqlite3* db);

    Status init_schema(const UpgradeHook& on_upgrade);
    Status exec_locked(const std::string& sql);
    Status upsert_session_locked(const Session& session);
    Status upsert_message_locked(const SessionMessage& message);
    Status upsert_job_locked(const Job& job);
    Status delete_session_locked(const std::string& id);
    Result<std::vector<std::string>> select_ids_locked(const std::string& sql,
                                                      const std::vector<std::string>& text_args,
                                                      const std::vector<int64_t>& int_args);

    Result<int> evict_sessions_by_age(int64_t cutoff_ms);
    Result<int> evict_sessions_over_cap(int max_per_repo);
    Result<int> evict_jobs_by_age(double cutoff_seconds);
    Result<int> evict_jobs_over_cap(int max_per_repo);

    sqlite3* db_;
    std::mutex mutex_;
    int schema_version_ = 0;
};

}  // namespace opsdeck
