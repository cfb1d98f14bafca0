#pragma once

#include "command.hpp"
#include "dispatcher.hpp"
#include "operation.hpp"
#include "state.hpp"
#include <variant>
#include <vector>

namespace pkgdash {

// Reported back by the interactive loop once a request was handed to the dispatcher
struct DispatchAck {
    OperationHandle handle;
};

using Message = std::variant<KeyCommand, DispatchAck, OperationResult>;

// Background work the interactive loop must submit after a transition
using Effects = std::vector<Request>;

// Apply one message to the state. Never blocks and never touches the
// backend; any background work is returned as requests.
Effects apply(AppState& state, const Message& message);

// Requests for the first frame: load the starting view
Effects start(AppState& state);

} // namespace pkgdash
