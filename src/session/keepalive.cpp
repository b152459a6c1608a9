#include "session/keepalive.hpp"

#include <chrono>
#include <vector>

namespace parley {

void KeepAlive::add(const std::shared_ptr<KeepAliveTarget>& target) {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_[target.get()] = target;
}

void KeepAlive::remove(const KeepAliveTarget* target) {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_.erase(target);
}

size_t KeepAlive::size() const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    return targets_.size();
}

size_t KeepAlive::tick_all() {
    // Tick outside the lock; a target may remove itself while being ticked.
    std::vector<std::shared_ptr<KeepAliveTarget>> live;
    {
        std::lock_guard<std::mutex> lock(targets_mutex_);
        live.reserve(targets_.size());
        for (auto it = targets_.begin(); it != targets_.end();) {
            if (auto t = it->second.lock()) {
                live.push_back(std::move(t));
                ++it;
            } else {
                it = targets_.erase(it);
            }
        }
    }

    for (auto& t : live) t->keepalive_tick();
    return live.size();
}

void KeepAlive::start(int interval_seconds, const Logger& logger) {
    if (interval_seconds <= 0) {
        logger.info("Keep-alive pings disabled");
        return;
    }
    stop_.store(false);

    thread_ = std::thread([this, interval_seconds, &logger] {
        while (!stop_.load()) {
            {
                std::unique_lock<std::mutex> lock(wait_mutex_);
                wait_cv_.wait_for(lock, std::chrono::seconds(interval_seconds),
                                  [this] { return stop_.load(); });
            }

            if (stop_.load()) break;

            size_t n = tick_all();
            logger.debug("Keep-alive: pinged %zu session(s)", n);
        }
    });
}

void KeepAlive::stop() {
    stop_.store(true);
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace parley
