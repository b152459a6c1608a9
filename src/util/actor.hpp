#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include <tbb/concurrent_queue.h>

#include "util/worker_pool.hpp"

namespace parley {

// A component whose messages are handled one at a time, in posting order,
// on a shared worker pool. Different actors run concurrently with each other.
//
// post() never blocks. The first message posted to an idle actor enqueues a
// drain task into the pool; the task keeps handling messages until the
// mailbox is empty. The task holds a strong reference, so an actor with
// pending messages stays alive until they are handled.
//
// Derived classes must be created with std::make_shared.
template <typename Msg>
class Actor : public std::enable_shared_from_this<Actor<Msg>> {
public:
    virtual ~Actor() = default;

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    // Enqueue a message. Returns false if the mailbox has been closed.
    bool post(Msg msg) {
        if (closed_.load(std::memory_order_acquire)) return false;
        queue_.push(std::move(msg));
        if (pending_.fetch_add(1, std::memory_order_acq_rel) == 0) {
            schedule();
        }
        return true;
    }

    // Refuse further messages. Already queued messages are still handled.
    void close_mailbox() { closed_.store(true, std::memory_order_release); }

    bool mailbox_closed() const { return closed_.load(std::memory_order_acquire); }

    // Messages posted but not yet fully handled.
    size_t pending() const { return pending_.load(std::memory_order_acquire); }

protected:
    explicit Actor(WorkerPool& pool) : pool_(pool) {}

    // Handle one message. Never called concurrently for the same actor.
    virtual void handle(Msg& msg) = 0;

private:
    WorkerPool& pool_;
    tbb::concurrent_queue<Msg> queue_;
    std::atomic<size_t> pending_{0};
    std::atomic<bool> closed_{false};

    void schedule() {
        auto self = this->shared_from_this();
        pool_.enqueue([self] { self->drain(); });
    }

    void drain() {
        // Every counted message was pushed before it was counted, so while
        // pending_ is non-zero try_pop finds one.
        do {
            Msg msg;
            if (queue_.try_pop(msg)) handle(msg);
        } while (pending_.fetch_sub(1, std::memory_order_acq_rel) > 1);
    }
};

} // namespace parley
