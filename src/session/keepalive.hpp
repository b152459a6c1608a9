#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "util/logger.hpp"

namespace parley {

// Something that wants a periodic tick (client sessions ping their peer).
class KeepAliveTarget {
public:
    virtual ~KeepAliveTarget() = default;

    // Called from the ticker thread; must not block.
    virtual void keepalive_tick() = 0;
};

// Background ticker shared by all sessions of a process.
// Targets are held weakly; expired ones are dropped on the next tick.
class KeepAlive {
public:
    KeepAlive() = default;
    ~KeepAlive() { stop(); }

    KeepAlive(const KeepAlive&) = delete;
    KeepAlive& operator=(const KeepAlive&) = delete;

    void add(const std::shared_ptr<KeepAliveTarget>& target);
    void remove(const KeepAliveTarget* target);

    size_t size() const;

    // Tick every registered target once. Returns the number ticked.
    size_t tick_all();

    // Start the ticker thread. interval_seconds <= 0 disables it.
    void start(int interval_seconds, const Logger& logger);

    void stop();

private:
    mutable std::mutex targets_mutex_;
    std::unordered_map<const KeepAliveTarget*, std::weak_ptr<KeepAliveTarget>> targets_;

    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace parley
