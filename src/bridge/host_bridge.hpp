#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/envelope_contract.hpp"
#include "registry/command_dispatcher.hpp"
#include "registry/command_registry.hpp"
#include "runtime/execution_scheduler.hpp"
#include "transport/socket.hpp"

namespace hostbridge::bridge {

// The in-host end of the bridge. Owns the listening socket, one thread per
// client connection, and hands resolved calls to the scheduler, which the
// host drains on its own turn. At most one HostBridge per process may be
// listening at a time.
class HostBridge {
public:
    HostBridge(core::config::BridgeConfig config,
               const registry::CommandRegistry& registry,
               runtime::ExecutionScheduler& scheduler,
               std::vector<std::string> redactions = {});
    ~HostBridge();

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    // Binds and starts accepting. Returns the port actually bound, which
    // differs from the configured one when that is 0.
    core::errors::Result<std::uint16_t> start();

    // Closes the listener and every connection, then joins all threads.
    // Calls still queued stay with the scheduler; their results are
    // discarded when they run.
    void stop();

    bool is_running() const { return running_.load(); }
    std::uint16_t port() const { return port_; }
    std::size_t open_connection_count() const;
    std::uint64_t accepted_total() const { return accepted_total_.load(); }
    const std::string& session_id() const { return session_id_; }

private:
    struct Connection {
        std::uint64_t id = 0;
        transport::SocketHandle socket;
        bool keep_alive = true;
        std::atomic<bool> finished{false};
        std::thread worker;
    };

    void accept_loop();
    void serve(const std::shared_ptr<Connection>& connection);
    bool handle_line(Connection& connection, const std::string& line);
    std::optional<protocol::ResponseEnvelope> await_completion(
        Connection& connection,
        const std::shared_ptr<runtime::CompletionSlot>& slot,
        const std::string& call_id);
    void abandon_call(runtime::CompletionSlot& slot, const std::string& call_id,
                      const std::string& reason);
    bool send_response(Connection& connection, protocol::ResponseEnvelope response);
    void reap_finished_connections();

    static std::atomic<bool> s_listening_;

    core::config::BridgeConfig config_;
    registry::CommandDispatcher dispatcher_;
    runtime::ExecutionScheduler& scheduler_;
    std::vector<std::string> redactions_;
    std::string session_id_;

    std::atomic<bool> running_{false};
    transport::SocketHandle listener_;
    std::uint16_t port_ = 0;
    std::thread accept_thread_;

    mutable std::mutex connections_mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::uint64_t next_connection_id_ = 0;
    std::atomic<std::uint64_t> accepted_total_{0};
};

}  // namespace hostbridge::bridge
