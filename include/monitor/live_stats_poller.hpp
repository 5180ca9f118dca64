#pragma once

#include "hardware/snapshot_collector.hpp"
#include "utils/logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace RigTune {
namespace Monitor {

// Bounded queue between the poller thread and its consumer.
// When full, the oldest sample is dropped so the consumer always sees recent data.
class StatsChannel {
public:
    explicit StatsChannel(size_t capacity = 64);

    StatsChannel(const StatsChannel&) = delete;
    StatsChannel& operator=(const StatsChannel&) = delete;

    void push(const Hardware::LiveStats& stats);

    // Waits up to timeout; nullopt on timeout or when closed and drained
    std::optional<Hardware::LiveStats> pop(std::chrono::milliseconds timeout);
    std::optional<Hardware::LiveStats> try_pop();

    void close();
    bool closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped() const;

private:
    size_t capacity_;
    std::deque<Hardware::LiveStats> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_;
    size_t dropped_;
};

// Calls capture_live_stats() on one background thread every interval
class LiveStatsPoller {
public:
    LiveStatsPoller(Hardware::SnapshotCollector& collector, StatsChannel& channel,
                    std::chrono::milliseconds interval);
    ~LiveStatsPoller();

    LiveStatsPoller(const LiveStatsPoller&) = delete;
    LiveStatsPoller& operator=(const LiveStatsPoller&) = delete;

    void start();
    // Joins the thread; a poll already inside the GPU tool finishes first
    void stop();
    bool is_running() const { return running_.load(); }

    size_t polls_completed() const { return polls_.load(); }

private:
    void run();

    Hardware::SnapshotCollector& collector_;
    StatsChannel& channel_;
    std::chrono::milliseconds interval_;
    Utils::ModuleLogger logger_;

    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<size_t> polls_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_;
};

} // namespace Monitor
} // namespace RigTune
