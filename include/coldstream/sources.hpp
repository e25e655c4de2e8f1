#pragma once

/// @file include/coldstream/sources.hpp
/// @brief Source collaborator interfaces and the SourcePump driving them.
///
/// # Module: Sources
///
/// Transport is external: a HistoricalSource pages a bounded time range
/// from the vendor API, a LiveSource yields records from the event stream.
/// Implementations receive a SourceCredentials by const reference; the
/// core never reads it.
///
/// SourcePump runs both producers on their own threads and feeds a
/// Coordinator, so a slow historical page never stalls live intake:
///   - history thread: page → submit_page, then end_backfill(ok | failed)
///   - live thread:    next() → submit; on disconnect re-open() up to
///                     `max_reconnects` consecutive failures, waiting
///                     `reconnect_delay` between attempts
///
/// start() fails with kBothSourcesUnavailable when neither source opens.

#include "coldstream/coordinator.hpp"
#include "coldstream/normalizer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace coldstream {

// ─── SourceCredentials ────────────────────────────────────────────────────────

/// Service-account credentials for the vendor API. Immutable once built.
struct SourceCredentials {
    std::string api_base = "https://api.disruptive-technologies.com/v2";
    std::string project_id;
    std::string key_id;
    std::string secret;
};

// ─── HistoricalSource ─────────────────────────────────────────────────────────

enum class PageStatus {
    kMore,    ///< Further pages follow
    kLast,    ///< Final page of the range
    kFailed,  ///< Paging aborted; `records` may still hold partial data
};

struct Page {
    std::vector<RawRecord> records;
    PageStatus             status = PageStatus::kMore;
    std::string            error;
};

class HistoricalSource {
public:
    virtual ~HistoricalSource() = default;

    /// Prepare paging. False means the source is unavailable.
    [[nodiscard]] virtual bool open() = 0;

    /// Fetch the next page, time-ascending.
    [[nodiscard]] virtual Page next_page() = 0;
};

// ─── LiveSource ───────────────────────────────────────────────────────────────

class LiveSource {
public:
    virtual ~LiveSource() = default;

    /// (Re)connect to the stream. False means the attempt failed.
    [[nodiscard]] virtual bool open() = 0;

    /// Block for the next record. Returns nullopt on disconnect or once
    /// `stop` is requested.
    [[nodiscard]] virtual std::optional<RawRecord> next(std::stop_token stop) = 0;
};

// ─── SourcePump ───────────────────────────────────────────────────────────────

struct PumpConfig {
    std::size_t               max_reconnects  = 5;
    std::chrono::milliseconds reconnect_delay{1000};
    bool                      verbose = false;
};

enum class PumpStatus {
    kStarted,
    kAlreadyStarted,
    kBothSourcesUnavailable,
};

[[nodiscard]] std::string_view to_string(PumpStatus status) noexcept;

class SourcePump {
public:
    /// All collaborators must outlive the pump.
    SourcePump(core::Coordinator& coordinator,
               HistoricalSource&  history,
               LiveSource&        live,
               PumpConfig         config = PumpConfig{});
    ~SourcePump();

    SourcePump(const SourcePump&)            = delete;
    SourcePump& operator=(const SourcePump&) = delete;

    /// Open both sources and start the producer threads.
    [[nodiscard]] PumpStatus start();

    /// Request both threads to stop and join them. Idempotent.
    void stop();

    /// Block until historical paging has ended.
    void wait_history();

    /// Block until the live thread has given up or been stopped.
    void wait_live();

    [[nodiscard]] bool history_done() const noexcept { return history_done_.load(); }
    [[nodiscard]] bool live_running() const noexcept { return live_running_.load(); }
    [[nodiscard]] std::size_t reconnects() const noexcept { return reconnects_.load(); }
    [[nodiscard]] std::size_t pages() const noexcept { return pages_.load(); }

private:
    void run_history(std::stop_token stop);
    void run_live(std::stop_token stop, bool connected);

    /// Sleep for `reconnect_delay` unless `stop` fires first. False if stopped.
    [[nodiscard]] bool pause(std::stop_token stop) const;

    core::Coordinator& coordinator_;
    HistoricalSource&  history_;
    LiveSource&        live_;
    PumpConfig         config_;

    std::jthread             history_thread_;
    std::jthread             live_thread_;
    std::atomic<bool>        started_{false};
    std::atomic<bool>        history_done_{false};
    std::atomic<bool>        live_running_{false};
    std::atomic<std::size_t> reconnects_{0};
    std::atomic<std::size_t> pages_{0};
};

} // namespace coldstream
