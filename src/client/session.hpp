#pragma once

#include "client/session_events.hpp"
#include "client/session_state.hpp"
#include "client/task_registry.hpp"
#include "client/transfer_endpoint.hpp"
#include "common/config.hpp"
#include "common/signaling_channel.hpp"
#include <boost/asio.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

namespace net = boost::asio;

// ============================================================================
// Session Callbacks (session -> front-end)
// ============================================================================
struct SessionCallbacks {
    std::function<void()> on_ready_to_publish;
    std::function<void()> on_register_accepted;
    std::function<void()> on_session_ready;
    std::function<void(const std::vector<std::string>& roster)> on_roster_updated;
    std::function<void(const std::string& message)> on_fatal_error;
    std::function<void(const SessionError& error)> on_error;
    std::function<void(const std::string& ticket)> on_ticket_published;
    std::function<void(const std::filesystem::path& path)> on_file_received;
};

// ============================================================================
// Session Connectors
// ============================================================================
// Factories for the two subsystems bootstrapped at start(). The defaults
// dial the configured relay and open a TransferEndpoint.
struct SessionConnectors {
    using SignalingResult = std::expected<std::shared_ptr<SignalingChannel>, ConnectError>;
    using TransferResult = std::expected<std::shared_ptr<BlobTransfer>, TransferError>;

    std::function<net::awaitable<SignalingResult>(net::any_io_executor)> connect_signaling;
    std::function<net::awaitable<TransferResult>(net::any_io_executor)> init_transfer;

    static SessionConnectors defaults(const PeerDropConfig& config);
};

// ============================================================================
// Session - presence and transfer signaling state machine
// ============================================================================
//
// Sole consumer of the event bus and sole producer of the outbound queue.
// Background tasks (bootstrap, reader, writer, transfers) communicate with
// it only by posting SessionEvents. All methods must be called on the
// session's executor.
//
class Session {
public:
    Session(net::any_io_executor ex,
            PeerDropConfig config,
            SessionConnectors connectors,
            SessionCallbacks callbacks = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Starting -> Bootstrapping: pick the nickname and launch the bootstrap task
    void start();

    // Consume the event bus until stop(). Events still queued at stop() are
    // dropped, so the loop may finish after the Session is destroyed.
    net::awaitable<void> run();

    // Handle every event already queued; returns how many were handled
    size_t poll();

    // Queue a front-end command; fails at once if the event bus is full.
    // The caller surfaces the error, it is not passed to on_error.
    std::expected<void, SessionError> submit(Command command);

    // Best-effort DisconnectUser, then stop()
    void shutdown();

    // Close both queues and the transfer endpoint
    void stop();

    // ========================================================================
    // Getters
    // ========================================================================

    const SessionState& state() const { return state_; }
    const char* state_name() const { return peerdrop::state_name(state_); }
    const std::string& nickname() const { return nickname_; }
    const std::vector<std::string>& roster() const { return roster_; }
    const std::optional<std::filesystem::path>& pending_file() const { return pending_file_; }
    std::shared_ptr<SignalingChannel> channel() const { return channel_; }
    std::shared_ptr<BlobTransfer> transfer() const { return transfer_; }
    const TaskRegistry& tasks() const { return tasks_; }
    size_t pending_events() const { return bus_->size(); }
    size_t pending_outbound() const { return outbound_->size(); }

private:
    void handle(SessionEvent event);

    void on_bootstrap_succeeded(BootstrapSucceeded& event);
    void on_ready_to_register();
    void on_message(Message& message);
    void on_command(Command& command);
    void on_disconnect();

    void spawn_reader(std::shared_ptr<SignalingChannel> channel);
    void spawn_writer(std::shared_ptr<SignalingChannel> channel, std::shared_ptr<OutboundQueue> outbound);
    void spawn_publish(std::filesystem::path path, std::string peer);
    void spawn_resolve(std::string ticket);

    // Queue a protocol message for the writer
    bool send(const Message& message);

    void report(ErrorKind kind, std::string detail);
    void fail(ErrorKind kind, std::string reason);

    net::any_io_executor ex_;
    PeerDropConfig config_;
    SessionConnectors connectors_;
    SessionCallbacks callbacks_;

    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<OutboundQueue> outbound_;
    TaskRegistry tasks_;

    SessionState state_;
    std::string nickname_;
    std::vector<std::string> roster_;
    std::optional<std::filesystem::path> pending_file_;

    std::shared_ptr<SignalingChannel> channel_;
    std::shared_ptr<BlobTransfer> transfer_;
};

} // namespace peerdrop
