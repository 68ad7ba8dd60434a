#include "client/session.hpp"
#include "client/identity.hpp"
#include "common/log.hpp"
#include "common/ws_client_coro.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <stdexcept>
#include <type_traits>

namespace peerdrop {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::SESSION_LOGGER);
    return instance;
}

class BootstrapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void post_event(EventBus& bus, SessionEvent event) {
    const char* name = event_name(event);
    if (bus.try_send(std::move(event))) {
        return;
    }
    if (bus.is_closed()) {
        logger().debug("Event bus closed, dropping {}", name);
    } else {
        logger().error("Event bus full, dropping {}", name);
    }
}

// ============================================================================
// Default connectors
// ============================================================================

net::awaitable<SessionConnectors::SignalingResult>
connect_relay(net::any_io_executor ex, RelayConfig relay) {
    auto client = co_await WsClientCoro::connect(ex, relay);
    if (!client) {
        co_return std::unexpected(client.error());
    }
    co_return std::shared_ptr<SignalingChannel>(std::move(*client));
}

net::awaitable<SessionConnectors::TransferResult>
open_endpoint(net::any_io_executor ex, TransferConfig transfer) {
    auto endpoint = co_await TransferEndpoint::initialize(ex, transfer);
    if (!endpoint) {
        co_return std::unexpected(endpoint.error());
    }
    co_return std::shared_ptr<BlobTransfer>(std::move(*endpoint));
}

// ============================================================================
// Background tasks
// ============================================================================

net::awaitable<std::shared_ptr<SignalingChannel>> connect_or_throw(
    std::function<net::awaitable<SessionConnectors::SignalingResult>(net::any_io_executor)> connect,
    net::any_io_executor ex) {
    auto result = co_await connect(ex);
    if (!result) {
        throw BootstrapError(connect_error_message(result.error()));
    }
    co_return std::move(*result);
}

net::awaitable<std::shared_ptr<BlobTransfer>> init_or_throw(
    std::function<net::awaitable<SessionConnectors::TransferResult>(net::any_io_executor)> init,
    net::any_io_executor ex) {
    auto result = co_await init(ex);
    if (!result) {
        throw BootstrapError(transfer_error_message(result.error()));
    }
    co_return std::move(*result);
}

// Signaling connect and transfer setup run concurrently; the first failure
// cancels the other and fails the whole bootstrap.
net::awaitable<void> bootstrap(SessionConnectors connectors,
                               net::any_io_executor ex,
                               std::shared_ptr<OutboundQueue> outbound,
                               std::shared_ptr<EventBus> bus) {
    using namespace net::experimental::awaitable_operators;

    if (!connectors.connect_signaling || !connectors.init_transfer) {
        post_event(*bus, BootstrapFailed{"session connectors not configured"});
        co_return;
    }

    std::string failure;
    try {
        auto [channel, transfer] = co_await (
            connect_or_throw(connectors.connect_signaling, ex) &&
            init_or_throw(connectors.init_transfer, ex));

        logger().info("Bootstrap complete: relay {}, transfer {}", channel->describe(), transfer->describe());
        post_event(*bus, BootstrapSucceeded{std::move(channel), std::move(transfer), std::move(outbound)});
        co_return;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    logger().error("Bootstrap failed: {}", failure);
    post_event(*bus, BootstrapFailed{std::move(failure)});
}

net::awaitable<void> read_loop(std::shared_ptr<SignalingChannel> channel, std::shared_ptr<EventBus> bus) {
    for (;;) {
        auto frame = co_await channel->read_frame();
        if (!frame) {
            co_return;
        }

        auto message = decode(*frame);
        if (message) {
            logger().debug("<- {}", message_type_name(*message));
            post_event(*bus, MessageReceived{std::move(*message)});
        } else {
            logger().warn("Undecodable frame from relay: {}", decode_error_message(message.error()));
            post_event(*bus, DecodeFailed{message.error()});
        }
    }
}

net::awaitable<void> write_loop(std::shared_ptr<SignalingChannel> channel,
                                std::shared_ptr<OutboundQueue> outbound,
                                std::shared_ptr<EventBus> bus) {
    while (auto frame = co_await outbound->read()) {
        auto sent = co_await channel->write_frame(std::move(*frame));
        if (!sent) {
            post_event(*bus, SendFailed{sent.error().detail});
        }
    }

    // Outbound queue closed and drained
    co_await channel->close();
}

net::awaitable<void> close_channel(std::shared_ptr<SignalingChannel> channel) {
    co_await channel->close();
}

net::awaitable<void> publish_task(std::shared_ptr<BlobTransfer> transfer,
                                  std::filesystem::path path,
                                  std::string peer,
                                  std::shared_ptr<EventBus> bus) {
    auto ticket = co_await transfer->publish(path);
    if (ticket) {
        post_event(*bus, PublishCompleted{std::move(*ticket), std::move(peer)});
    } else {
        post_event(*bus, TransferFailed{"publish", ticket.error()});
    }
}

net::awaitable<void> resolve_task(std::shared_ptr<BlobTransfer> transfer,
                                  std::string ticket,
                                  std::shared_ptr<EventBus> bus) {
    auto path = co_await transfer->resolve(std::move(ticket));
    if (path) {
        post_event(*bus, FileResolved{std::move(*path)});
    } else {
        post_event(*bus, TransferFailed{"resolve", path.error()});
    }
}

} // anonymous namespace

SessionConnectors SessionConnectors::defaults(const PeerDropConfig& config) {
    SessionConnectors connectors;
    connectors.connect_signaling = [relay = config.relay](net::any_io_executor ex) {
        return connect_relay(std::move(ex), relay);
    };
    connectors.init_transfer = [transfer = config.transfer](net::any_io_executor ex) {
        return open_endpoint(std::move(ex), transfer);
    };
    return connectors;
}

// ============================================================================
// Session
// ============================================================================

Session::Session(net::any_io_executor ex,
                 PeerDropConfig config,
                 SessionConnectors connectors,
                 SessionCallbacks callbacks)
    : ex_(ex)
    , config_(std::move(config))
    , connectors_(std::move(connectors))
    , callbacks_(std::move(callbacks))
    , bus_(EventBus::create(config_.session.event_queue_capacity, ex))
    , outbound_(OutboundQueue::create(config_.session.outbound_queue_capacity, ex))
    , tasks_(ex)
    , state_(Starting{outbound_})
{}

Session::~Session() {
    stop();
}

void Session::start() {
    auto* starting = std::get_if<Starting>(&state_);
    if (!starting) {
        logger().warn("start() ignored in state {}", state_name());
        return;
    }

    if (!config_.session.nickname.empty() && is_valid_nickname(config_.session.nickname)) {
        nickname_ = config_.session.nickname;
    } else {
        if (!config_.session.nickname.empty()) {
            logger().warn("Configured nickname '{}' is not usable, generating one", config_.session.nickname);
        }
        nickname_ = generate_nickname();
    }
    logger().info("Starting session as '{}'", nickname_);

    auto outbound = std::move(starting->outbound);
    state_ = Bootstrapping{};

    tasks_.spawn("bootstrap", bootstrap(connectors_, ex_, std::move(outbound), bus_));
}

net::awaitable<void> Session::run() {
    // The bus outlives the session; once it is closed `this` may be gone
    auto bus = bus_;
    while (auto event = co_await bus->read()) {
        if (bus->is_closed()) {
            break;
        }
        handle(std::move(*event));
    }
    logger().debug("Event loop finished");
}

size_t Session::poll() {
    size_t handled = 0;
    while (auto event = bus_->try_receive()) {
        handle(std::move(*event));
        ++handled;
    }
    return handled;
}

std::expected<void, SessionError> Session::submit(Command command) {
    if (!bus_->try_send(CommandSubmitted{std::move(command)})) {
        SessionError error{ErrorKind::QUEUE_FULL,
                           bus_->is_closed() ? "session stopped" : "event queue full, command dropped"};
        logger().warn("{}", session_error_message(error));
        return std::unexpected(error);
    }
    return {};
}

void Session::shutdown() {
    if (channel_ && is_live(state_)) {
        send(DisconnectUser{nickname_});
    }
    stop();
}

void Session::stop() {
    outbound_->close();
    bus_->close();
    if (transfer_) {
        transfer_->stop();
    }
}

// ============================================================================
// Event dispatch
// ============================================================================

void Session::handle(SessionEvent event) {
    logger().trace("{} in {}", event_name(event), state_name());

    std::visit([this](auto& ev) {
        using T = std::decay_t<decltype(ev)>;

        if constexpr (std::is_same_v<T, BootstrapSucceeded>) {
            if (std::holds_alternative<Bootstrapping>(state_)) {
                on_bootstrap_succeeded(ev);
            } else {
                // Session was closed while bootstrapping; release what was opened
                ev.transfer->stop();
                tasks_.spawn("close-channel", close_channel(std::move(ev.channel)));
            }
        } else if constexpr (std::is_same_v<T, BootstrapFailed>) {
            if (is_live(state_)) {
                fail(ErrorKind::BOOTSTRAP, ev.reason);
            }
        } else if constexpr (std::is_same_v<T, ReadyToRegister>) {
            if (std::holds_alternative<Registering>(state_)) {
                on_ready_to_register();
            }
        } else if constexpr (std::is_same_v<T, MessageReceived>) {
            on_message(ev.message);
        } else if constexpr (std::is_same_v<T, DecodeFailed>) {
            report(ErrorKind::DECODE, decode_error_message(ev.error));
        } else if constexpr (std::is_same_v<T, ChannelClosed>) {
            if (is_live(state_)) {
                fail(ErrorKind::CONNECTION_LOST, ev.reason);
            }
        } else if constexpr (std::is_same_v<T, SendFailed>) {
            report(ErrorKind::SEND, ev.detail);
        } else if constexpr (std::is_same_v<T, CommandSubmitted>) {
            on_command(ev.command);
        } else if constexpr (std::is_same_v<T, PublishCompleted>) {
            if (std::holds_alternative<Ready>(state_)) {
                logger().info("Announcing file for {}", ev.peer);
                send(SendFile{ev.ticket});
                if (callbacks_.on_ticket_published) {
                    callbacks_.on_ticket_published(ev.ticket);
                }
            }
        } else if constexpr (std::is_same_v<T, FileResolved>) {
            if (std::holds_alternative<Ready>(state_)) {
                if (callbacks_.on_file_received) {
                    callbacks_.on_file_received(ev.path);
                }
            }
        } else if constexpr (std::is_same_v<T, TransferFailed>) {
            report(ErrorKind::TRANSFER, ev.operation + ": " + transfer_error_message(ev.error));
        }
    }, event);
}

void Session::on_bootstrap_succeeded(BootstrapSucceeded& event) {
    channel_ = std::move(event.channel);
    transfer_ = std::move(event.transfer);

    spawn_reader(channel_);
    spawn_writer(channel_, std::move(event.outbound));

    state_ = Registering{};
    if (callbacks_.on_ready_to_publish) {
        callbacks_.on_ready_to_publish();
    }

    if (!bus_->try_send(ReadyToRegister{})) {
        fail(ErrorKind::BOOTSTRAP, "event queue full before registration");
    }
}

void Session::on_ready_to_register() {
    send(Register{nickname_});
    state_ = AwaitingRegisterAck{};
}

void Session::on_message(Message& message) {
    if (std::holds_alternative<RegisterSuccess>(message)) {
        if (!std::holds_alternative<AwaitingRegisterAck>(state_)) {
            logger().debug("Ignoring register_success in {}", state_name());
            return;
        }
        state_ = Ready{};
        logger().info("Registered as '{}'", nickname_);
        if (callbacks_.on_register_accepted) {
            callbacks_.on_register_accepted();
        }
        if (callbacks_.on_session_ready) {
            callbacks_.on_session_ready();
        }
    } else if (auto* list = std::get_if<ActiveUsersList>(&message)) {
        if (!std::holds_alternative<Ready>(state_)) {
            return;
        }
        roster_ = std::move(list->nicknames);
        if (callbacks_.on_roster_updated) {
            callbacks_.on_roster_updated(roster_);
        }
    } else if (auto* incoming = std::get_if<ReceiveFile>(&message)) {
        if (!std::holds_alternative<Ready>(state_)) {
            return;
        }
        spawn_resolve(std::move(incoming->ticket));
    } else if (auto* relay_error = std::get_if<ErrorDeserializingJson>(&message)) {
        if (is_live(state_)) {
            report(ErrorKind::DECODE, "relay could not decode our message: " + relay_error->detail);
        }
    } else {
        logger().debug("Ignoring client-bound {} from relay", message_type_name(message));
    }
}

void Session::on_command(Command& command) {
    if (std::holds_alternative<Disconnect>(command)) {
        on_disconnect();
        return;
    }

    if (!std::holds_alternative<Ready>(state_)) {
        logger().debug("Ignoring command in state {}", state_name());
        return;
    }

    if (auto* select = std::get_if<SelectFileForTransfer>(&command)) {
        pending_file_ = std::move(select->path);
        logger().info("Selected {}", pending_file_->string());
    } else if (std::holds_alternative<RequestRoster>(command)) {
        send(GetActiveUsersList{nickname_});
    } else if (auto* publish = std::get_if<PublishToPeer>(&command)) {
        if (!pending_file_) {
            report(ErrorKind::TRANSFER, "no file selected");
            return;
        }
        auto path = std::move(*pending_file_);
        pending_file_.reset();
        spawn_publish(std::move(path), std::move(publish->nickname));
    }
}

void Session::on_disconnect() {
    if (!is_live(state_)) {
        return;
    }

    if (channel_) {
        send(DisconnectUser{nickname_});
    }
    outbound_->close();
    if (transfer_) {
        transfer_->stop();
    }

    logger().info("'{}' disconnected", nickname_);
    roster_.clear();
    pending_file_.reset();
    nickname_.clear();
    state_ = Closed{};
}

// ============================================================================
// Task spawning
// ============================================================================

void Session::spawn_reader(std::shared_ptr<SignalingChannel> channel) {
    tasks_.spawn("reader", read_loop(std::move(channel), bus_),
        [bus = bus_](const TaskInfo& info) {
            std::string reason = info.state == TaskState::FAILED
                ? info.exit_reason
                : std::string("connection closed by relay");
            post_event(*bus, ChannelClosed{std::move(reason)});
        });
}

void Session::spawn_writer(std::shared_ptr<SignalingChannel> channel, std::shared_ptr<OutboundQueue> outbound) {
    tasks_.spawn("writer", write_loop(std::move(channel), std::move(outbound), bus_));
}

void Session::spawn_publish(std::filesystem::path path, std::string peer) {
    logger().info("Publishing {} for {}", path.string(), peer);
    tasks_.spawn("publish", publish_task(transfer_, std::move(path), std::move(peer), bus_));
}

void Session::spawn_resolve(std::string ticket) {
    logger().info("Resolving incoming ticket");
    tasks_.spawn("resolve", resolve_task(transfer_, std::move(ticket), bus_));
}

// ============================================================================
// Helpers
// ============================================================================

bool Session::send(const Message& message) {
    if (!is_live(state_)) {
        logger().debug("Not sending {} in state {}", message_type_name(message), state_name());
        return false;
    }

    if (!outbound_->try_send(encode(message))) {
        report(ErrorKind::QUEUE_FULL,
               std::string(outbound_->is_closed() ? "outbound queue closed, dropped " : "outbound queue full, dropped ")
               + std::string(message_type_name(message)));
        return false;
    }

    logger().debug("-> {}", message_type_name(message));
    return true;
}

void Session::report(ErrorKind kind, std::string detail) {
    SessionError error{kind, std::move(detail)};
    logger().warn("{}", session_error_message(error));
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

void Session::fail(ErrorKind kind, std::string reason) {
    SessionError error{kind, std::move(reason)};
    logger().error("Session failed: {}", session_error_message(error));
    state_ = Failed{error.detail};
    if (callbacks_.on_fatal_error) {
        callbacks_.on_fatal_error(session_error_message(error));
    }
}

} // namespace peerdrop
