/**
 * @file opsdeck.hpp
 * @brief Main header for opsdeck-sync - include this to use the library
 */

#pragma once

#include "error.hpp"
#include "types.hpp"
#include "presentation.hpp"
#include "message_codec.hpp"
#include "job_codec.hpp"
#include "aggregation.hpp"
#include "local_cache.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "poll_source.hpp"
#include "stream_client.hpp"
#include "config.hpp"
#include "sync_coordinator.hpp"

/**
 * @brief opsdeck-sync - job and issue synchronization core
 *
 * The library is built from these parts:
 *
 * 1. MessageCodec - decodes stream frames into typed messages and coalesces text
 * 2. StreamClient - reconnecting, heartbeating, multi-subscriber stream connection
 * 3. Aggregation  - pure derivation of issues, phases and board columns from jobs
 * 4. LocalCache   - SQLite store for sessions, messages and jobs with eviction
 * 5. SyncCoordinator - cache, poll and push merged into immutable board snapshots
 *
 * Example usage:
 *
 * @code
 * using namespace opsdeck;
 *
 * auto config = load_config("opsdeck.yaml");
 * if (!config.ok()) {
 *     LOG(ERROR) << "Bad configuration: " << config.status();
 *     return;
 * }
 *
 * boost::asio::io_context io;
 * AsioScheduler scheduler(io);
 *
 * auto cache = LocalCache::open(config->cache.path, config->cache.eviction);
 * if (!cache.ok()) {
 *     LOG(ERROR) << "Cache unavailable: " << cache.status();
 *     return;
 * }
 *
 * auto base = config->server.base_url;
 * auto events = std::make_unique<StreamClient>(
 *     "events",
 *     [base](const std::string&) { return events_stream_url(base); },
 *     scheduler,
 *     std::make_unique<WebSocketTransport>(io, config->server.connect_timeout),
 *     config->events_stream_options());
 *
 * SyncCoordinator coordinator(
 *     *config, scheduler, cache->get(),
 *     std::make_unique<HttpPollSource>(io, scheduler, base, config->poll_options()),
 *     std::move(events));
 *
 * coordinator.snapshots().subscribe([](const SnapshotPtr& board) {
 *     for (const auto& [key, issue] : board->issues) {
 *         LOG(INFO) << key << " " << issue_status_name(derive_status(issue));
 *     }
 * });
 *
 * coordinator.start();
 * io.run();
 * @endcode
 */
