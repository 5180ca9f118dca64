#include "monitor/live_stats_poller.hpp"

namespace RigTune {
namespace Monitor {

StatsChannel::StatsChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), closed_(false), dropped_(0) {}

void StatsChannel::push(const Hardware::LiveStats& stats) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(stats);
    }
    cv_.notify_one();
}

std::optional<Hardware::LiveStats> StatsChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Hardware::LiveStats stats = queue_.front();
    queue_.pop_front();
    return stats;
}

std::optional<Hardware::LiveStats> StatsChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Hardware::LiveStats stats = queue_.front();
    queue_.pop_front();
    return stats;
}

void StatsChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool StatsChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t StatsChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t StatsChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

LiveStatsPoller::LiveStatsPoller(Hardware::SnapshotCollector& collector, StatsChannel& channel,
                                 std::chrono::milliseconds interval)
    : collector_(collector), channel_(channel), interval_(interval), logger_("MONITOR"),
      running_(false), polls_(0), stop_requested_(false) {}

LiveStatsPoller::~LiveStatsPoller() {
    stop();
}

void LiveStatsPoller::start() {
    if (running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&LiveStatsPoller::run, this);
    logger_.info("Live stats polling started (every " + std::to_string(interval_.count()) + " ms)");
}

void LiveStatsPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        logger_.info("Live stats polling stopped after " + std::to_string(polls_.load()) + " polls");
    }
    running_.store(false);
}

void LiveStatsPoller::run() {
    while (true) {
        channel_.push(collector_.capture_live_stats());
        polls_.fetch_add(1);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (wake_cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
    }
}

} // namespace Monitor
} // namespace RigTune
