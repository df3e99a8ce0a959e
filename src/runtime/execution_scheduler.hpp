#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "registry/command_dispatcher.hpp"
#include "runtime/pending_call.hpp"

namespace hostbridge::runtime {

// Bridges many producer threads (connections) into the host's single
// execution turn. Producers submit(); the host calls tick() from its
// idle/tick hook and only there do handlers run.
class ExecutionScheduler {
public:
    explicit ExecutionScheduler(std::size_t max_batch = 8);

    // Any thread. Enqueues at the tail and returns the slot to wait on.
    std::shared_ptr<CompletionSlot> submit(std::string call_id,
                                           registry::ResolvedCall call);

    // Execution thread only. Runs up to max_batch queued calls in FIFO
    // order and returns how many ran. Never waits for work. A tick from a
    // thread other than the execution thread, or from inside a handler,
    // runs nothing.
    std::size_t tick();

    // Pins the execution thread to the caller. Without it the first thread
    // to tick is pinned.
    void bind_to_current_thread();

    // Drops queued calls without running them and abandons their slots.
    std::size_t discard_pending();

    // Counts a result that was fulfilled but dropped by its waiting side
    // before delivery.
    void note_discarded() { discarded_total_.fetch_add(1); }

    std::size_t pending_count() const;
    std::uint64_t executed_total() const { return executed_total_.load(); }
    std::uint64_t discarded_total() const { return discarded_total_.load(); }
    std::size_t max_batch() const { return max_batch_; }

private:
    bool claim_execution_thread();
    bool pop_front(PendingCall& out);

    const std::size_t max_batch_;
    mutable std::mutex mutex_;
    std::deque<PendingCall> queue_;

    std::mutex owner_mutex_;
    std::thread::id owner_;
    bool in_tick_ = false;

    std::atomic<std::uint64_t> executed_total_{0};
    std::atomic<std::uint64_t> discarded_total_{0};
};

}  // namespace hostbridge::runtime
