#include "runtime/execution_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace hostbridge::runtime {

ExecutionScheduler::ExecutionScheduler(const std::size_t max_batch)
    : max_batch_(std::max<std::size_t>(1, max_batch)) {}

std::shared_ptr<CompletionSlot> ExecutionScheduler::submit(
    std::string call_id, registry::ResolvedCall call) {
    PendingCall pending;
    pending.call_id = std::move(call_id);
    pending.call = std::move(call);
    pending.enqueued_at = std::chrono::steady_clock::now();
    pending.completion = std::make_shared<CompletionSlot>();
    auto slot = pending.completion;

    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(pending));
        depth = queue_.size();
    }
    LOG_DEBUG("Scheduler: queued call, depth=" + std::to_string(depth));
    return slot;
}

void ExecutionScheduler::bind_to_current_thread() {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    owner_ = std::this_thread::get_id();
}

bool ExecutionScheduler::claim_execution_thread() {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    const auto self = std::this_thread::get_id();
    if (owner_ == std::thread::id()) {
        owner_ = self;
        return true;
    }
    return owner_ == self;
}

bool ExecutionScheduler::pop_front(PendingCall& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t ExecutionScheduler::tick() {
    if (!claim_execution_thread()) {
        LOG_ERROR("Scheduler: tick refused, caller is not the execution thread");
        return 0;
    }
    if (in_tick_) {
        LOG_WARN("Scheduler: re-entrant tick from inside a handler ignored");
        return 0;
    }

    in_tick_ = true;
    std::size_t executed = 0;
    while (executed < max_batch_) {
        PendingCall pending;
        if (!pop_front(pending)) {
            break;
        }

        const auto started = std::chrono::steady_clock::now();
        const auto waited_ms = std::chrono::duration<double, std::milli>(
                                   started - pending.enqueued_at)
                                   .count();
        const std::string name =
            pending.call.entry != nullptr ? pending.call.entry->spec.name : "<unresolved>";

        auto response = registry::CommandDispatcher::invoke(pending.call);
        ++executed;
        executed_total_.fetch_add(1);

        const auto ran_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - started)
                                .count();
        LOG_DEBUG("Scheduler: " + pending.call_id + " " + name + " waited " +
                  std::to_string(waited_ms) + " ms, ran " + std::to_string(ran_ms) +
                  " ms");

        if (!pending.completion->fulfil(std::move(response))) {
            discarded_total_.fetch_add(1);
            LOG_INFO("Scheduler: " + pending.call_id + " " + name +
                     " completed after its connection was dropped; result discarded");
        }
    }
    in_tick_ = false;
    return executed;
}

std::size_t ExecutionScheduler::discard_pending() {
    std::deque<PendingCall> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(queue_);
    }
    for (auto& pending : dropped) {
        static_cast<void>(pending.completion->abandon());
        discarded_total_.fetch_add(1);
    }
    if (!dropped.empty()) {
        LOG_WARN("Scheduler: discarded " + std::to_string(dropped.size()) +
                 " queued calls");
    }
    return dropped.size();
}

std::size_t ExecutionScheduler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace hostbridge::runtime
