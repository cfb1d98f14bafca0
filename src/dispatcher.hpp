#pragma once

#include "backend.hpp"
#include "message_queue.hpp"
#include "operation.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pkgdash {

using Inbox = MessageQueue<OperationResult>;
using InboxPtr = std::shared_ptr<Inbox>;

// Outcome of a submission
struct OperationHandle {
    OperationKey key;
    uint64_t sequence = 0;
    bool accepted = false;
    std::string rejection;  // set when not accepted
};

// Runs each request on its own detached thread and posts exactly one
// OperationResult to the inbox when the backend call returns.
//
// Install, uninstall, upgrade and details allow one unit of work per
// (package id, kind); a second submission is rejected. Search and refresh
// supersede: the newer unit becomes the tracked one and the older one's
// result is left for the state machine to discard by sequence number.
class Dispatcher {
public:
    Dispatcher(BackendPtr backend, InboxPtr inbox);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    OperationHandle submit(const Request& request);

    bool is_active(const OperationKey& key) const;
    size_t active_count() const;

private:
    // Shared with running units of work, which may outlive the dispatcher
    struct Registry {
        mutable std::mutex mutex;
        std::map<OperationKey, uint64_t> active;  // key -> tracked sequence
    };

    BackendPtr backend_;
    InboxPtr inbox_;
    std::shared_ptr<Registry> registry_;
};

} // namespace pkgdash
