/**
 * @file sync_coordinator.cpp
 * @brief Cold start, poll loop, push merge and snapshot publication
 */

#include <opsdeck_cpp/sync_coordinator.hpp>
#include <opsdeck_cpp/job_codec.hpp>
#include <opsdeck_cpp/transport.hpp>
#include <glog/logging.h>
#include <algorithm>

namespace opsdeck {

namespace {

constexpr const char* kEventsResource = "events";

double now_seconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

std::string snapshot_source_name(SnapshotSource source) {
    switch (source) {
        case SnapshotSource::NONE:     return "NONE";
        case SnapshotSource::CACHE:    return "CACHE";
        case SnapshotSource::POLL:     return "POLL";
        case SnapshotSource::PUSH:     return "PUSH";
        case SnapshotSource::WORKFLOW: return "WORKFLOW";
        case SnapshotSource::HIDDEN:   return "HIDDEN";
        default:                       return "UNKNOWN";
    }
}

const Job* BoardSnapshot::find_job(const std::string& issue_id) const {
    auto it = std::find_if(jobs.begin(), jobs.end(),
                           [&](const Job& job) { return job.issue_id == issue_id; });
    return it == jobs.end() ? nullptr : &*it;
}

std::vector<Issue> BoardSnapshot::column(IssueStatus status,
                                         const std::optional<std::string>& repo_filter) const {
    return issues_for_status(issues, status, repo_filter, hidden);
}

// ============================================================================
// Lifecycle
// ============================================================================

SyncCoordinator::SyncCoordinator(SyncConfig config,
                                 Scheduler& scheduler,
                                 LocalCache* cache,
                                 std::unique_ptr<PollSource> poll_source,
                                 std::unique_ptr<StreamClient> events)
    : config_(std::move(config))
    , scheduler_(scheduler)
    , cache_(cache)
    , poll_source_(std::move(poll_source))
    , events_(std::move(events))
    , current_(std::make_shared<BoardSnapshot>())
    , snapshots_("SyncCoordinator/snapshots") {
}

SyncCoordinator::~SyncCoordinator() {
    stop();
}

Status SyncCoordinator::start() {
    if (running_) {
        return absl::FailedPreconditionError("SyncCoordinator already started");
    }
    running_ = true;
    ++generation_;

    LOG(INFO) << "[SyncCoordinator] Starting against " << config_.server.base_url;

    load_from_cache();
    detect_capabilities();

    if (capabilities_.push_available) {
        events_message_sub_ = events_->messages().subscribe(
            [this](const StreamMessage& message) { on_event_message(message); });
        events_state_sub_ = events_->states().subscribe(
            [this](const ConnectionState& state) { on_event_state(state); });
    }

    poll_now();

    if (capabilities_.push_available) {
        auto status = events_->connect(kEventsResource);
        if (!status.ok()) {
            LOG(WARNING) << "[SyncCoordinator] Events stream not started: " << status;
        }
    }
    return absl::OkStatus();
}

void SyncCoordinator::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ++generation_;

    if (poll_timer_ != Scheduler::kNoTimer) {
        scheduler_.cancel(poll_timer_);
        poll_timer_ = Scheduler::kNoTimer;
    }
    poll_source_->cancel();
    poll_in_flight_ = false;
    refresh_requested_ = false;

    if (events_) {
        events_->messages().unsubscribe(events_message_sub_);
        events_->states().unsubscribe(events_state_sub_);
        events_->disconnect();
    }
    events_were_connected_ = false;

    LOG(INFO) << "[SyncCoordinator] Stopped";
}

void SyncCoordinator::detect_capabilities() {
    Capabilities caps;
    caps.events_url = events_stream_url(config_.server.base_url);

    if (!config_.push.enabled) {
        VLOG(1) << "[SyncCoordinator] Push disabled by configuration";
    } else if (!events_) {
        VLOG(1) << "[SyncCoordinator] No events stream configured";
    } else {
        auto url = parse_url(caps.events_url);
        if (!url.ok()) {
            LOG(WARNING) << "[SyncCoordinator] Push unavailable: " << url.status();
        } else {
            caps.push_available = true;
        }
    }

    caps.poll_interval = caps.push_available ? config_.poll.interval_with_push
                                             : config_.poll.interval;
    capabilities_ = caps;

    LOG(INFO) << "[SyncCoordinator] Push " << (caps.push_available ? "available" : "unavailable")
              << ", polling every " << caps.poll_interval.count() << "s";
}

void SyncCoordinator::load_from_cache() {
    auto next = copy_current();
    next->source = SnapshotSource::CACHE;
    next->loading = true;

    if (cache_) {
        auto jobs = cache_->list_jobs();
        if (jobs.ok()) {
            next->jobs = std::move(*jobs);
            next->issues = rebuild(next->jobs);
        } else {
            LOG(WARNING) << "[SyncCoordinator] Cache read failed: " << jobs.status();
        }

        auto hidden = cache_->hidden_issue_keys();
        if (hidden.ok()) {
            next->hidden = std::move(*hidden);
        } else {
            LOG(WARNING) << "[SyncCoordinator] Cache read failed: " << hidden.status();
        }

        auto last_sync = cache_->last_sync_time();
        if (last_sync.ok()) {
            next->last_sync = *last_sync;
        } else {
            LOG(WARNING) << "[SyncCoordinator] Cache read failed: " << last_sync.status();
        }
    }

    LOG(INFO) << "[SyncCoordinator] Cold start with " << next->jobs.size() << " cached jobs";
    publish(std::move(next));
}

// ============================================================================
// Polling
// ============================================================================

void SyncCoordinator::refresh() {
    if (!running_) {
        return;
    }
    poll_now();
}

void SyncCoordinator::poll_now() {
    if (poll_in_flight_) {
        refresh_requested_ = true;
        return;
    }
    if (poll_timer_ != Scheduler::kNoTimer) {
        scheduler_.cancel(poll_timer_);
        poll_timer_ = Scheduler::kNoTimer;
    }

    poll_in_flight_ = true;
    uint64_t generation = generation_;
    poll_source_->fetch_jobs([this, generation](Result<std::vector<Job>> result) {
        if (generation != generation_) {
            return;
        }
        poll_in_flight_ = false;
        on_poll_result(std::move(result));

        if (!running_ || generation != generation_) {
            return;
        }
        if (refresh_requested_) {
            refresh_requested_ = false;
            poll_now();
        } else {
            schedule_poll();
        }
    });
}

void SyncCoordinator::schedule_poll() {
    uint64_t generation = generation_;
    poll_timer_ = scheduler_.schedule(
        std::chrono::duration_cast<std::chrono::milliseconds>(capabilities_.poll_interval),
        [this, generation]() {
            poll_timer_ = Scheduler::kNoTimer;
            if (generation == generation_ && running_) {
                poll_now();
            }
        });
}

void SyncCoordinator::on_poll_result(Result<std::vector<Job>> result) {
    auto previous = snapshot();

    if (!result.ok()) {
        LOG(WARNING) << "[SyncCoordinator] Poll failed: " << result.status();
        auto next = copy_current();
        next->error = result.status();
        next->loading = false;
        next->source = SnapshotSource::POLL;
        publish(std::move(next));
        return;
    }

    auto next = copy_current();
    next->jobs = std::move(*result);
    next->issues = rebuild(next->jobs);
    next->source = SnapshotSource::POLL;
    next->last_sync = std::chrono::system_clock::now();

    bool changed = has_material_change(previous->issues, next->issues);
    bool notify = changed || previous->error.has_value() || previous->loading;
    next->error.reset();
    next->loading = false;

    write_through(next->jobs, true);

    if (!notify) {
        VLOG(1) << "[SyncCoordinator] Poll unchanged (" << next->jobs.size() << " jobs)";
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        next->revision = revision_;
        current_ = std::move(next);
        return;
    }

    VLOG(1) << "[SyncCoordinator] Poll: " << next->jobs.size() << " jobs, "
            << next->issues.size() << " issues";
    publish(std::move(next));
}

// ============================================================================
// Push
// ============================================================================

void SyncCoordinator::on_event_message(const StreamMessage& message) {
    if (const auto* event = message.get_if<JobEventMessage>()) {
        apply_push_event(*event);
    } else if (const auto* error = message.get_if<ErrorMessage>()) {
        LOG(WARNING) << "[SyncCoordinator] Server event error: " << error->message;
    }
}

void SyncCoordinator::on_event_state(ConnectionState state) {
    if (state != ConnectionState::CONNECTED) {
        return;
    }
    // Events missed while disconnected are only visible through a poll
    if (events_were_connected_) {
        LOG(INFO) << "[SyncCoordinator] Events stream back, catching up";
        refresh();
    }
    events_were_connected_ = true;
}

void SyncCoordinator::apply_push_event(const JobEventMessage& event) {
    if (event.job_id.empty()) {
        VLOG(1) << "[SyncCoordinator] Ignoring job event without id";
        return;
    }

    auto previous = snapshot();
    auto next = copy_current();

    std::optional<Job> known;
    auto it = std::find_if(next->jobs.begin(), next->jobs.end(),
                           [&](const Job& job) { return job.issue_id == event.job_id; });
    if (it != next->jobs.end()) {
        known = *it;
    }

    Job job = ::opsdeck::apply_job_event(known, event, now_seconds());
    if (it != next->jobs.end()) {
        *it = job;
    } else {
        next->jobs.push_back(job);
    }

    next->issues = rebuild(next->jobs);
    next->source = SnapshotSource::PUSH;
    bool restored = restore_hidden(*next, issue_key(job.repo, job.issue_num));

    if (cache_) {
        auto status = cache_->upsert_job(job);
        if (!status.ok()) {
            LOG(ERROR) << "[SyncCoordinator] Cache write failed: " << status;
        }
    }

    if (!restored && !has_material_change(previous->issues, next->issues)) {
        VLOG(1) << "[SyncCoordinator] Push for " << event.job_id << " changed nothing";
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        next->revision = revision_;
        current_ = std::move(next);
        return;
    }

    VLOG(1) << "[SyncCoordinator] Push " << event.job_id << " -> "
            << job_status_name(job.status);
    publish(std::move(next));
}

// ============================================================================
// Hidden issues
// ============================================================================

Status SyncCoordinator::hide_issue(const std::string& issue_key, const std::string& reason) {
    auto next = copy_current();
    auto it = next->issues.find(issue_key);
    if (it == next->issues.end()) {
        return absl::NotFoundError("No issue " + issue_key + " on the board");
    }
    if (!next->hidden.insert(issue_key).second) {
        return absl::OkStatus();
    }

    if (cache_) {
        HiddenIssue hidden;
        hidden.issue_key = issue_key;
        hidden.repo = it->second.repo;
        hidden.issue_num = it->second.issue_num;
        hidden.issue_title = it->second.title;
        hidden.reason = reason;
        auto status = cache_->hide_issue(hidden);
        if (!status.ok()) {
            LOG(ERROR) << "[SyncCoordinator] Cache write failed: " << status;
        }
    }

    LOG(INFO) << "[SyncCoordinator] Hid " << issue_key << " (" << reason << ")";
    next->source = SnapshotSource::HIDDEN;
    publish(std::move(next));
    return absl::OkStatus();
}

Status SyncCoordinator::unhide_issue(const std::string& issue_key) {
    auto next = copy_current();
    if (!restore_hidden(*next, issue_key)) {
        return absl::NotFoundError("Issue " + issue_key + " is not hidden");
    }
    next->source = SnapshotSource::HIDDEN;
    publish(std::move(next));
    return absl::OkStatus();
}

bool SyncCoordinator::restore_hidden(BoardSnapshot& next, const std::string& issue_key) {
    if (next.hidden.erase(issue_key) == 0) {
        return false;
    }
    if (cache_) {
        auto status = cache_->unhide_issue(issue_key);
        if (!status.ok()) {
            LOG(ERROR) << "[SyncCoordinator] Cache write failed: " << status;
        }
    }
    LOG(INFO) << "[SyncCoordinator] Restored hidden issue " << issue_key;
    return true;
}

// ============================================================================
// Workflow enrichment
// ============================================================================

Status SyncCoordinator::refresh_workflow(const std::string& issue_key) {
    auto board = snapshot();
    auto it = board->issues.find(issue_key);
    if (it == board->issues.end()) {
        return absl::NotFoundError("No issue " + issue_key + " on the board");
    }

    uint64_t generation = generation_;
    poll_source_->fetch_workflow_state(
        it->second.repo, it->second.issue_num,
        [this, generation, issue_key](Result<WorkflowState> result) {
            if (generation != generation_) {
                return;
            }
            if (!result.ok()) {
                LOG(WARNING) << "[SyncCoordinator] Workflow fetch for " << issue_key
                             << " failed: " << result.status();
                return;
            }
            workflow_states_[issue_key] = *result;

            auto next = copy_current();
            next->issues = rebuild(next->jobs);
            next->source = SnapshotSource::WORKFLOW;
            publish(std::move(next));
        });
    return absl::OkStatus();
}

// ============================================================================
// Helpers
// ============================================================================

IssueMap SyncCoordinator::rebuild(const std::vector<Job>& jobs) const {
    IssueMap issues = aggregate(jobs);
    for (const auto& [key, state] : workflow_states_) {
        auto it = issues.find(key);
        if (it != issues.end()) {
            apply_workflow_state(it->second, state);
        }
    }
    return issues;
}

void SyncCoordinator::write_through(const std::vector<Job>& jobs, bool mark_synced) {
    if (!cache_) {
        return;
    }
    auto status = cache_->upsert_jobs(jobs);
    if (!status.ok()) {
        LOG(ERROR) << "[SyncCoordinator] Cache write failed: " << status;
        return;
    }
    if (mark_synced) {
        status = cache_->set_last_sync_time(std::chrono::system_clock::now());
        if (!status.ok()) {
            LOG(ERROR) << "[SyncCoordinator] Cache write failed: " << status;
        }
    }
}

void SyncCoordinator::publish(std::shared_ptr<BoardSnapshot> next) {
    SnapshotPtr published;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        next->revision = ++revision_;
        current_ = std::move(next);
        published = current_;
    }
    snapshots_.publish(published);
}

std::shared_ptr<BoardSnapshot> SyncCoordinator::copy_current() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return std::make_shared<BoardSnapshot>(*current_);
}

SnapshotPtr SyncCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

}  // namespace opsdeck
