#pragma once

#include "client/session_events.hpp"
#include <memory>
#include <string>
#include <variant>

namespace peerdrop {

// ============================================================================
// Session States
// ============================================================================
//
//   Starting -> Bootstrapping -> Registering -> AwaitingRegisterAck -> Ready
//
// Failed is absorbing and reachable from every state on a fatal event.
// Closed is absorbing and entered on an explicit Disconnect.
//

struct Starting {
    // Consumer end of the outbound queue, moved into the bootstrap task
    std::shared_ptr<OutboundQueue> outbound;
};

struct Bootstrapping {};
struct Registering {};
struct AwaitingRegisterAck {};
struct Ready {};

struct Failed {
    std::string reason;
};

struct Closed {};

using SessionState = std::variant<
    Starting,
    Bootstrapping,
    Registering,
    AwaitingRegisterAck,
    Ready,
    Failed,
    Closed>;

const char* state_name(const SessionState& state);

// True for the states that may still issue protocol traffic
bool is_live(const SessionState& state);

} // namespace peerdrop
