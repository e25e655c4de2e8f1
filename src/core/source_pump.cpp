/// @file src/core/source_pump.cpp
/// @brief SourcePump — concurrent historical and live producers.

#include "coldstream/sources.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <mutex>

namespace coldstream {

std::string_view to_string(PumpStatus status) noexcept {
    switch (status) {
        case PumpStatus::kStarted:                return "STARTED";
        case PumpStatus::kAlreadyStarted:         return "ALREADY_STARTED";
        case PumpStatus::kBothSourcesUnavailable: return "BOTH_SOURCES_UNAVAILABLE";
    }
    return "UNKNOWN";
}

// ─── Constructor / destructor ─────────────────────────────────────────────────

SourcePump::SourcePump(core::Coordinator& coordinator,
                       HistoricalSource&  history,
                       LiveSource&        live,
                       PumpConfig         config)
    : coordinator_(coordinator)
    , history_(history)
    , live_(live)
    , config_(config)
{}

SourcePump::~SourcePump() {
    stop();
}

// ─── start / stop ─────────────────────────────────────────────────────────────

PumpStatus SourcePump::start() {
    if (started_.exchange(true)) {
        return PumpStatus::kAlreadyStarted;
    }

    const bool history_ok = history_.open();
    const bool live_ok    = live_.open();
    if (!history_ok && !live_ok) {
        started_ = false;
        if (config_.verbose) {
            fmt::print(stderr, "[coldstream] neither historical nor live source available\n");
        }
        return PumpStatus::kBothSourcesUnavailable;
    }

    if (history_ok) {
        history_thread_ = std::jthread([this](std::stop_token st) { run_history(st); });
    } else {
        if (config_.verbose) {
            fmt::print(stderr, "[coldstream] historical source unavailable, live-only\n");
        }
        coordinator_.end_backfill(false);
        history_done_ = true;
    }

    live_running_ = true;
    live_thread_  = std::jthread([this, live_ok](std::stop_token st) { run_live(st, live_ok); });
    return PumpStatus::kStarted;
}

void SourcePump::stop() {
    history_thread_.request_stop();
    live_thread_.request_stop();
    wait_history();
    wait_live();
}

void SourcePump::wait_history() {
    if (history_thread_.joinable()) {
        history_thread_.join();
    }
}

void SourcePump::wait_live() {
    if (live_thread_.joinable()) {
        live_thread_.join();
    }
}

// ─── Producers ────────────────────────────────────────────────────────────────

void SourcePump::run_history(std::stop_token stop) {
    bool complete = false;
    while (!stop.stop_requested()) {
        Page page = history_.next_page();
        ++pages_;
        coordinator_.submit_page(page.records);

        if (page.status == PageStatus::kLast) {
            complete = true;
            break;
        }
        if (page.status == PageStatus::kFailed) {
            if (config_.verbose) {
                fmt::print(stderr, "[coldstream] historical paging failed after {} pages: {}\n",
                           pages_.load(), page.error);
            }
            break;
        }
    }
    // A stop request mid-paging leaves the backfill incomplete.
    coordinator_.end_backfill(complete);
    history_done_ = true;
}

void SourcePump::run_live(std::stop_token stop, bool connected) {
    std::size_t failures = 0;  // consecutive failed open() attempts

    while (!stop.stop_requested()) {
        if (!connected) {
            if (failures >= config_.max_reconnects) {
                if (config_.verbose) {
                    fmt::print(stderr, "[coldstream] live stream: giving up after {} attempts\n",
                               failures);
                }
                break;
            }
            if (!pause(stop)) {
                break;
            }
            connected = live_.open();
            if (connected) {
                failures = 0;
                ++reconnects_;
                if (config_.verbose) {
                    fmt::print(stderr, "[coldstream] live stream reconnected\n");
                }
            } else {
                ++failures;
            }
            continue;
        }

        if (auto record = live_.next(stop)) {
            coordinator_.submit(*record, Source::Live);
            continue;
        }
        if (stop.stop_requested()) {
            break;
        }
        connected = false;
        failures  = 0;
        if (config_.verbose) {
            fmt::print(stderr, "[coldstream] live stream disconnected\n");
        }
    }
    live_running_ = false;
}

bool SourcePump::pause(std::stop_token stop) const {
    std::mutex                  m;
    std::condition_variable_any cv;
    std::unique_lock            lock(m);
    cv.wait_for(lock, stop, config_.reconnect_delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace coldstream
