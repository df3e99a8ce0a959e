#include "bridge/host_bridge.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/envelope_codec.hpp"

namespace hostbridge::bridge {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using protocol::ResponseEnvelope;

namespace {

// Slice length for blocking waits, so shutdown is noticed promptly.
constexpr int kPollSliceMs = 100;

bool is_blank(const std::string& line) {
    for (const char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

}  // namespace

std::atomic<bool> HostBridge::s_listening_{false};

HostBridge::HostBridge(core::config::BridgeConfig config,
                       const registry::CommandRegistry& registry,
                       runtime::ExecutionScheduler& scheduler,
                       std::vector<std::string> redactions)
    : config_(std::move(config)),
      dispatcher_(registry),
      scheduler_(scheduler),
      redactions_(std::move(redactions)),
      session_id_(core::config::generate_session_id()) {}

HostBridge::~HostBridge() {
    stop();
}

core::errors::Result<std::uint16_t> HostBridge::start() {
    if (running_.load()) {
        return BridgeError{ErrorKind::Internal, "Bridge is already running.",
                           "bridge_already_running"};
    }

    bool expected = false;
    if (!s_listening_.compare_exchange_strong(expected, true)) {
        return BridgeError{ErrorKind::Internal,
                           "Another bridge instance is already listening in this process.",
                           "bridge_already_running",
                           "Stop the running bridge before starting a new one."};
    }

    auto listening = transport::listen_tcp(config_.host, config_.port);
    if (core::errors::is_error(listening)) {
        s_listening_.store(false);
        const auto& err = core::errors::get_error(listening);
        LOG_ERROR("HostBridge: failed to start [" + err.code + "]: " + err.message);
        return err;
    }
    listener_ = std::move(core::errors::get_value(listening));

    auto bound = transport::bound_port(listener_);
    if (core::errors::is_error(bound)) {
        listener_.reset();
        s_listening_.store(false);
        return core::errors::get_error(bound);
    }
    port_ = core::errors::get_value(bound);

    running_.store(true);
    accept_thread_ = std::thread([this] { accept_loop(); });
    LOG_INFO("HostBridge: " + session_id_ + " listening on " + config_.host + ":" +
             std::to_string(port_) + (config_.keep_alive ? "" : " (one request per connection)"));
    return port_;
}

void HostBridge::stop() {
    const bool was_running = running_.exchange(false);
    if (!was_running) {
        return;
    }

    listener_.shutdown_both();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listener_.reset();

    std::vector<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        connection->socket.shutdown_both();
    }
    for (auto& connection : connections) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }

    s_listening_.store(false);
    LOG_INFO("HostBridge: " + session_id_ + " stopped, closed " +
             std::to_string(connections.size()) + " connections");
}

std::size_t HostBridge::open_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::size_t open = 0;
    for (const auto& connection : connections_) {
        if (!connection->finished.load()) {
            ++open;
        }
    }
    return open;
}

void HostBridge::reap_finished_connections() {
    std::vector<std::shared_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.begin();
        while (it != connections_.end()) {
            if ((*it)->finished.load()) {
                finished.push_back(*it);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : finished) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }
}

void HostBridge::accept_loop() {
    while (running_.load()) {
        pollfd pfd{listener_.fd(), POLLIN, 0};
        const int rc = poll(&pfd, 1, kPollSliceMs);
        reap_finished_connections();
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("HostBridge: poll on listener failed: " +
                      std::string(std::strerror(errno)));
            break;
        }
        if (rc == 0 || !running_.load()) {
            continue;
        }

        const int fd = ::accept4(listener_.fd(), nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED || !running_.load()) {
                continue;
            }
            LOG_ERROR("HostBridge: accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        auto connection = std::make_shared<Connection>();
        connection->socket = transport::SocketHandle(fd);
        connection->keep_alive = config_.keep_alive;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection->id = ++next_connection_id_;
            connections_.push_back(connection);
        }
        accepted_total_.fetch_add(1);
        LOG_INFO("HostBridge: connection " + std::to_string(connection->id) + " opened");
        connection->worker = std::thread([this, connection] { serve(connection); });
    }
}

void HostBridge::serve(const std::shared_ptr<Connection>& connection) {
    transport::LineReader reader(config_.max_message_bytes);
    const std::string label = "connection " + std::to_string(connection->id);

    while (running_.load()) {
        std::string line;
        const auto status =
            reader.read_line(connection->socket.fd(), line, kPollSliceMs);
        if (status == transport::ReadStatus::Timeout) {
            continue;
        }
        if (status == transport::ReadStatus::Closed) {
            LOG_INFO("HostBridge: " + label + " closed by client");
            break;
        }
        if (status == transport::ReadStatus::Error) {
            LOG_WARN("HostBridge: " + label + " read error: " +
                     std::string(std::strerror(errno)));
            break;
        }
        if (status == transport::ReadStatus::Overflow) {
            LOG_WARN("HostBridge: " + label + " sent an oversized request");
            static_cast<void>(send_response(
                *connection,
                ResponseEnvelope::failure(
                    ErrorKind::Decode,
                    "Request exceeds " + std::to_string(config_.max_message_bytes) +
                        " bytes.")));
            break;
        }

        if (is_blank(line)) {
            continue;
        }
        if (!handle_line(*connection, line)) {
            break;
        }
        if (!connection->keep_alive) {
            break;
        }
    }

    connection->socket.shutdown_both();
    connection->finished.store(true);
}

bool HostBridge::handle_line(Connection& connection, const std::string& line) {
    const std::string call_id = core::config::generate_call_id();

    auto decoded = protocol::decode_command(line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("HostBridge: " + call_id + " rejected [" + err.code + "]: " + err.message);
        return send_response(connection, ResponseEnvelope::failure(err));
    }
    const auto& command = core::errors::get_value(decoded);

    auto resolved = dispatcher_.resolve(command);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        LOG_WARN("HostBridge: " + call_id + " rejected [" + err.code + "]: " + err.message);
        return send_response(connection, ResponseEnvelope::failure(err));
    }

    LOG_INFO("HostBridge: " + call_id + " queued " + command.name + " from connection " +
             std::to_string(connection.id));
    auto slot = scheduler_.submit(call_id, core::errors::get_value(resolved));

    auto response = await_completion(connection, slot, call_id);
    if (!response.has_value()) {
        return false;
    }
    return send_response(connection, std::move(response.value()));
}

std::optional<ResponseEnvelope> HostBridge::await_completion(
    Connection& connection, const std::shared_ptr<runtime::CompletionSlot>& slot,
    const std::string& call_id) {
    while (!slot->wait_for(std::chrono::milliseconds(kPollSliceMs))) {
        if (!running_.load()) {
            abandon_call(*slot, call_id, "bridge stopping");
            return std::nullopt;
        }
        // A client that only shut down its sending side still reads; keep
        // waiting for it. Only a reset or error ends the call here.
        if (transport::connection_broken(connection.socket.fd())) {
            abandon_call(*slot, call_id, "client disconnected while the call was pending");
            return std::nullopt;
        }
    }
    return slot->take();
}

void HostBridge::abandon_call(runtime::CompletionSlot& slot, const std::string& call_id,
                              const std::string& reason) {
    if (slot.abandon()) {
        // Filled between the last wait and the abandon; the scheduler
        // already counted it as delivered.
        scheduler_.note_discarded();
        LOG_INFO("HostBridge: " + call_id + " abandoned with its result ready, " + reason);
        return;
    }
    LOG_INFO("HostBridge: " + call_id + " abandoned, " + reason);
}

bool HostBridge::send_response(Connection& connection, ResponseEnvelope response) {
    protocol::redact_response(response, redactions_);
    const std::string payload = protocol::encode_response(response) + "\n";
    auto written = transport::write_all(connection.socket.fd(), payload);
    if (core::errors::is_error(written)) {
        LOG_WARN("HostBridge: connection " + std::to_string(connection.id) +
                 " dropped response: " + core::errors::get_error(written).message);
        return false;
    }
    return true;
}

}  // namespace hostbridge::bridge
