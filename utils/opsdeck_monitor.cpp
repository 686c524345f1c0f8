/**
 * @file opsdeck_monitor.cpp
 * @brief Terminal board monitor - prints the job board as it changes
 *
 * Usage:
 *   opsdeck_monitor                                   # Board from localhost:8080
 *   opsdeck_monitor --base_url http://buildbox:8080   # Different server
 *   opsdeck_monitor --config opsdeck.yaml             # Settings from YAML
 *   opsdeck_monitor --session abc123                  # Also follow one session
 */

#include <opsdeck_cpp/opsdeck.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>

DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(base_url, "", "Server base URL (overrides config)");
DEFINE_string(cache_path, "", "SQLite cache file (overrides config)");
DEFINE_bool(push, true, "Use the process-wide event stream when available");
DEFINE_string(session, "", "Also stream messages of this session");
DEFINE_string(repo, "", "Only show issues of this repo slug");
DEFINE_bool(quiet, false, "Suppress startup messages");

namespace {

std::string format_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

void print_board(const opsdeck::BoardSnapshot& board) {
    using namespace opsdeck;

    std::optional<std::string> repo_filter;
    if (!FLAGS_repo.empty()) {
        repo_filter = FLAGS_repo;
    }

    std::cout << format_timestamp() << "  board r" << board.revision
              << " (" << snapshot_source_name(board.source) << ", "
              << board.jobs.size() << " jobs, " << board.issues.size() << " issues)";
    if (!board.hidden.empty()) {
        std::cout << " [" << board.hidden.size() << " hidden]";
    }
    if (board.loading) {
        std::cout << " [loading]";
    }
    std::cout << std::endl;

    if (board.error) {
        std::cout << "  ! " << user_message(*board.error) << std::endl;
    }

    for (auto status : {IssueStatus::NEEDS_ACTION, IssueStatus::RUNNING,
                        IssueStatus::FAILED, IssueStatus::DONE}) {
        auto column = board.column(status, repo_filter);
        if (column.empty()) {
            continue;
        }
        std::cout << "  " << display_info(status).label << " (" << column.size() << ")" << std::endl;
        for (const auto& issue : column) {
            std::cout << "    " << std::left << std::setw(24) << issue.key
                      << std::setw(14) << display_info(issue.current_phase).label
                      << issue.title;
            auto latest = latest_job(issue);
            if (latest) {
                std::cout << "  [" << short_command(*latest) << ": "
                          << job_status_name(latest->status) << "]";
            }
            std::cout << std::endl;
        }
    }
}

void print_items(const std::vector<opsdeck::StreamMessage>& batch) {
    using namespace opsdeck;

    for (const auto& item : CoalescedView(batch)) {
        if (item.kind == DisplayItem::Kind::PARAGRAPH) {
            std::cout << item.text << std::endl;
            continue;
        }
        const auto& message = *item.message;
        std::cout << "  <" << message_kind_name(message.kind()) << ">";
        if (const auto* tool = message.get_if<ToolUseMessage>()) {
            std::cout << " " << tool->tool_name;
        } else if (const auto* result = message.get_if<ResultMessage>()) {
            if (result->total_cost_usd) {
                std::cout << " $" << std::fixed << std::setprecision(4) << *result->total_cost_usd;
            }
        } else if (const auto* error = message.get_if<ErrorMessage>()) {
            std::cout << " " << error->message;
        } else if (const auto* change = message.get_if<StatusChangeMessage>()) {
            std::cout << " " << change->status;
        }
        std::cout << std::endl;
    }
}

}  // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage(
        "OpsDeck board monitor - prints the job board as it changes\n"
        "Usage: opsdeck_monitor [--config=FILE] [--base_url=URL] [--session=ID]"
    );
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;
    FLAGS_minloglevel = FLAGS_quiet ? 2 : 0;  // Suppress INFO if quiet

    opsdeck::SyncConfig config;
    if (!FLAGS_config.empty()) {
        auto loaded = opsdeck::load_config(FLAGS_config);
        if (!loaded.ok()) {
            std::cerr << "Failed to load " << FLAGS_config << ": " << loaded.status() << std::endl;
            return 1;
        }
        config = *loaded;
    }
    if (!FLAGS_base_url.empty()) {
        config.server.base_url = FLAGS_base_url;
    }
    if (!FLAGS_cache_path.empty()) {
        config.cache.path = FLAGS_cache_path;
    }
    if (!FLAGS_push) {
        config.push.enabled = false;
    }

    if (!FLAGS_quiet) {
        std::cerr << "OpsDeck Monitor" << std::endl;
        std::cerr << "  Server: " << config.server.base_url << std::endl;
        std::cerr << "  Cache:  " << config.cache.path << std::endl;
        if (!FLAGS_session.empty()) {
            std::cerr << "  Session: " << FLAGS_session << std::endl;
        }
        std::cerr << "  Press Ctrl+C to stop" << std::endl;
        std::cerr << "==========================================" << std::endl;
    }

    auto cache_result = opsdeck::LocalCache::open(config.cache.path, config.cache.eviction);
    if (!cache_result.ok()) {
        std::cerr << "Failed to open cache: " << cache_result.status() << std::endl;
        return 1;
    }
    auto cache = std::move(*cache_result);

    boost::asio::io_context io;
    opsdeck::AsioScheduler scheduler(io);
    const std::string base_url = config.server.base_url;

    std::unique_ptr<opsdeck::StreamClient> events;
    if (config.push.enabled) {
        events = std::make_unique<opsdeck::StreamClient>(
            "events",
            [base_url](const std::string&) { return opsdeck::events_stream_url(base_url); },
            scheduler,
            std::make_unique<opsdeck::WebSocketTransport>(io, config.server.connect_timeout),
            config.events_stream_options());
    }

    opsdeck::SyncCoordinator coordinator(
        config, scheduler, cache.get(),
        std::make_unique<opsdeck::HttpPollSource>(io, scheduler, base_url, config.poll_options()),
        std::move(events));

    coordinator.snapshots().subscribe([](const opsdeck::SnapshotPtr& board) {
        print_board(*board);
    });

    // Optional per-session stream: text chunks are held until something else
    // arrives, then printed as one paragraph
    std::unique_ptr<opsdeck::StreamClient> session;
    std::vector<opsdeck::StreamMessage> pending;
    if (!FLAGS_session.empty()) {
        session = std::make_unique<opsdeck::StreamClient>(
            "session",
            [base_url](const std::string& id) { return opsdeck::session_stream_url(base_url, id); },
            scheduler,
            std::make_unique<opsdeck::WebSocketTransport>(io, config.server.connect_timeout),
            config.session_stream_options());

        session->messages().subscribe([&pending](const opsdeck::StreamMessage& message) {
            pending.push_back(message);
            if (message.kind() != opsdeck::MessageKind::ASSISTANT_TEXT) {
                print_items(pending);
                pending.clear();
            }
        });
        session->errors().subscribe([](const opsdeck::Status& error) {
            std::cerr << format_timestamp() << "  session: " << opsdeck::user_message(error)
                      << " (" << error.message() << ")" << std::endl;
        });
    }

    auto start_status = coordinator.start();
    if (!start_status.ok()) {
        std::cerr << "Failed to start: " << start_status << std::endl;
        return 1;
    }
    if (session) {
        auto status = session->connect(FLAGS_session);
        if (!status.ok()) {
            std::cerr << "Failed to follow session: " << status << std::endl;
            return 1;
        }
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        if (!FLAGS_quiet) {
            std::cerr << "\nShutting down..." << std::endl;
        }
        if (session) {
            session->disconnect();
            if (!pending.empty()) {
                print_items(pending);
                pending.clear();
            }
        }
        coordinator.stop();
        io.stop();
    });

    io.run();
    return 0;
}
