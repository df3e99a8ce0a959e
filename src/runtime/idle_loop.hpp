#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hostbridge::runtime {

// Stand-in for the modeling host's UI loop: one thread, one turn per
// iteration, idle handlers run at the end of each turn. Everything that
// touches document state happens inside this loop.
class IdleLoop {
public:
    explicit IdleLoop(std::chrono::milliseconds interval = std::chrono::milliseconds(10));

    void add_idle_handler(std::string name, std::function<void()> handler);

    // One turn: every idle handler once, in registration order.
    void run_once();

    // Turns until the token is set. Sleeps `interval` between turns.
    void run(const std::shared_ptr<std::atomic_bool>& stop_token);

    std::uint64_t iterations() const { return iterations_; }

private:
    struct IdleHandler {
        std::string name;
        std::function<void()> handler;
    };

    std::chrono::milliseconds interval_;
    std::vector<IdleHandler> handlers_;
    std::uint64_t iterations_ = 0;
};

}  // namespace hostbridge::runtime
