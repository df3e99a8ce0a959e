#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "protocol/envelope_contract.hpp"
#include "registry/command_dispatcher.hpp"

namespace hostbridge::runtime {

// Filled once by the scheduler, read once by the connection that submitted
// the call. A connection that goes away abandons the slot; the response that
// eventually arrives is then dropped.
class CompletionSlot {
public:
    // Returns false when the slot was abandoned and the response discarded.
    bool fulfil(protocol::ResponseEnvelope response) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_ || response_.has_value()) {
            return false;
        }
        response_ = std::move(response);
        cv_.notify_all();
        return true;
    }

    // True once a response is available.
    bool wait_for(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return response_.has_value(); });
    }

    std::optional<protocol::ResponseEnvelope> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<protocol::ResponseEnvelope> out = std::move(response_);
        response_.reset();
        return out;
    }

    // Returns true when a response had already been filled and is dropped
    // here instead of by the scheduler.
    bool abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool dropped = !abandoned_ && response_.has_value();
        abandoned_ = true;
        response_.reset();
        cv_.notify_all();
        return dropped;
    }

    bool abandoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<protocol::ResponseEnvelope> response_;
    bool abandoned_ = false;
};

struct PendingCall {
    std::string call_id;
    registry::ResolvedCall call;
    std::chrono::steady_clock::time_point enqueued_at;
    std::shared_ptr<CompletionSlot> completion;
};

}  // namespace hostbridge::runtime
