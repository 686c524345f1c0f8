/**
 * @file sync_coordinator.hpp
 * @brief Merges cached, polled and pushed job state into board snapshots
 *
 * The coordinator is the single writer of the aggregated board. It seeds the
 * board from the local cache, polls the status endpoint on an interval, and
 * (when the capability check allows it) applies job events from the
 * process-wide stream. Every update goes through aggregate(), is written
 * through to the cache, and is published as an immutable BoardSnapshot only
 * when something observers care about changed.
 *
 * Example usage:
 * @code
 * SyncCoordinator coordinator(config, scheduler, cache.get(),
 *                             std::make_unique<HttpPollSource>(io, scheduler,
 *                                 config.server.base_url, config.poll_options()),
 *                             std::move(events_client));
 *
 * coordinator.snapshots().subscribe([](const SnapshotPtr& board) {
 *     render(board->issues);
 * });
 *
 * auto status = coordinator.start();
 * @endcode
 */

#pragma once

#include <opsdeck_cpp/aggregation.hpp>
#include <opsdeck_cpp/broadcaster.hpp>
#include <opsdeck_cpp/config.hpp>
#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/local_cache.hpp>
#include <opsdeck_cpp/poll_source.hpp>
#include <opsdeck_cpp/scheduler.hpp>
#include <opsdeck_cpp/stream_client.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opsdeck {

/// What produced a snapshot
enum class SnapshotSource {
    NONE,
    CACHE,
    POLL,
    PUSH,
    WORKFLOW,
    HIDDEN      // hide or unhide of an issue
};

std::string snapshot_source_name(SnapshotSource source);

/**
 * @brief Immutable view of the board at one point in time
 */
struct BoardSnapshot {
    std::vector<Job> jobs;                 // poll order; push-created jobs appended
    IssueMap issues;
    std::optional<Status> error;           // last fetch failure, cleared by any success
    bool loading = true;                   // no poll result yet
    uint64_t revision = 0;
    std::optional<std::chrono::system_clock::time_point> last_sync;
    SnapshotSource source = SnapshotSource::NONE;
    std::set<std::string> hidden;          // issue keys kept off the board columns

    const Job* find_job(const std::string& issue_id) const;

    /// Board column without hidden issues, most recently active first
    std::vector<Issue> column(IssueStatus status,
                              const std::optional<std::string>& repo_filter = std::nullopt) const;
};

using SnapshotPtr = std::shared_ptr<const BoardSnapshot>;

/**
 * @brief Result of the startup capability check
 */
struct Capabilities {
    bool push_available = false;
    std::chrono::seconds poll_interval{5};
    std::string events_url;
};

class SyncCoordinator {
public:
    /**
     * @param config Poll intervals, push switch and server address
     * @param scheduler Poll interval timer
     * @param cache Write-through store, may be null
     * @param poll_source Status endpoint access
     * @param events Process-wide event stream, may be null (poll only)
     */
    SyncCoordinator(SyncConfig config,
                    Scheduler& scheduler,
                    LocalCache* cache,
                    std::unique_ptr<PollSource> poll_source,
                    std::unique_ptr<StreamClient> events = nullptr);

    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    /**
     * @brief Cold start, capability check, first poll, push subscription
     *
     * The cached board (if any) is published before this returns.
     *
     * @return FailedPrecondition if already started
     */
    Status start();

    /// Cancel the poll timer and disconnect the events stream. Idempotent.
    void stop();

    /**
     * @brief Poll now
     *
     * If a poll is in flight, another one follows it immediately so the
     * result reflects state after this call.
     */
    void refresh();

    /**
     * @brief Fetch and apply server-side workflow state for one issue
     *
     * The state is kept and re-applied after every later aggregation.
     *
     * @return NotFound if the issue is not on the board
     */
    Status refresh_workflow(const std::string& issue_key);

    /**
     * @brief Apply one pushed job event (the events stream feeds this)
     *
     * New activity on a hidden issue brings it back onto the board.
     */
    void apply_push_event(const JobEventMessage& event);

    /**
     * @brief Keep an issue off the board columns, persisted in the cache
     *
     * @param reason "user" for a manual hide, "closed" after closing the issue
     * @return NotFound if the issue is not on the board
     */
    Status hide_issue(const std::string& issue_key, const std::string& reason = "user");

    /// @return NotFound if the issue is not hidden
    Status unhide_issue(const std::string& issue_key);

    SnapshotPtr snapshot() const;

    Broadcaster<SnapshotPtr>& snapshots() { return snapshots_; }

    const Capabilities& capabilities() const { return capabilities_; }

    bool running() const { return running_; }

    /// Null when running poll-only
    StreamClient* events() { return events_.get(); }

private:
    void detect_capabilities();
    void load_from_cache();
    void poll_now();
    void schedule_poll();
    void on_poll_result(Result<std::vector<Job>> result);
    void on_event_message(const StreamMessage& message);
    void on_event_state(ConnectionState state);

    IssueMap rebuild(const std::vector<Job>& jobs) const;
    void write_through(const std::vector<Job>& jobs, bool mark_synced);
    bool restore_hidden(BoardSnapshot& next, const std::string& issue_key);
    void publish(std::shared_ptr<BoardSnapshot> next);
    std::shared_ptr<BoardSnapshot> copy_current() const;

    SyncConfig config_;
    Scheduler& scheduler_;
    LocalCache* cache_;
    std::unique_ptr<PollSource> poll_source_;
    std::unique_ptr<StreamClient> events_;

    Capabilities capabilities_;
    bool running_ = false;
    bool poll_in_flight_ = false;
    bool refresh_requested_ = false;
    bool events_were_connected_ = false;
    uint64_t generation_ = 0;
    uint64_t revision_ = 0;
    Scheduler::TimerId poll_timer_ = Scheduler::kNoTimer;

    SubscriptionId events_message_sub_ = 0;
    SubscriptionId events_state_sub_ = 0;

    std::map<std::string, WorkflowState> workflow_states_;

    mutable std::mutex snapshot_mutex_;
    SnapshotPtr current_;

    Broadcaster<SnapshotPtr> snapshots_;
};

}  // namespace opsdeck
