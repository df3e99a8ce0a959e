#include "runtime/idle_loop.hpp"

#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace hostbridge::runtime {

IdleLoop::IdleLoop(const std::chrono::milliseconds interval) : interval_(interval) {}

void IdleLoop::add_idle_handler(std::string name, std::function<void()> handler) {
    LOG_DEBUG("IdleLoop: registered idle handler " + name);
    handlers_.push_back(IdleHandler{std::move(name), std::move(handler)});
}

void IdleLoop::run_once() {
    for (const auto& idle : handlers_) {
        idle.handler();
    }
    ++iterations_;
}

void IdleLoop::run(const std::shared_ptr<std::atomic_bool>& stop_token) {
    LOG_INFO("IdleLoop: entering host loop, interval " +
             std::to_string(interval_.count()) + " ms");
    while (!(stop_token && stop_token->load())) {
        run_once();
        std::this_thread::sleep_for(interval_);
    }
    LOG_INFO("IdleLoop: left host loop after " + std::to_string(iterations_) +
             " iterations");
}

}  // namespace hostbridge::runtime
