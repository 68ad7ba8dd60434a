#include "client/session_state.hpp"

namespace peerdrop {

const char* state_name(const SessionState& state) {
    switch (state.index()) {
        case 0: return "STARTING";
        case 1: return "BOOTSTRAPPING";
        case 2: return "REGISTERING";
        case 3: return "AWAITING_REGISTER_ACK";
        case 4: return "READY";
        case 5: return "FAILED";
        case 6: return "CLOSED";
        default: return "UNKNOWN";
    }
}

bool is_live(const SessionState& state) {
    return !std::holds_alternative<Failed>(state) && !std::holds_alternative<Closed>(state);
}

} // namespace peerdrop
