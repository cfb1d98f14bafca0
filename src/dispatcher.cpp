#include "dispatcher.hpp"
#include "log.hpp"
#include <system_error>
#include <thread>

namespace pkgdash {

Dispatcher::Dispatcher(BackendPtr backend, InboxPtr inbox)
    : backend_(std::move(backend)),
      inbox_(std::move(inbox)),
      registry_(std::make_shared<Registry>()) {
}

OperationHandle Dispatcher::submit(const Request& request) {
    OperationHandle handle;
    handle.key = request.key;
    handle.sequence = request.sequence;

    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto it = registry_->active.find(request.key);
        if (it != registry_->active.end() && !supersedes_running(request.key.kind)) {
            handle.rejection = describe(request.key) + " is already running";
            log_warn("rejected: " + handle.rejection);
            return handle;
        }
        registry_->active[request.key] = request.sequence;
    }

    log_info("dispatch " + kind_name(request.key.kind) + " " + request.key.package_id +
             " #" + std::to_string(request.sequence));

    auto backend = backend_;
    auto inbox = inbox_;
    auto registry = registry_;

    try {
        std::thread([backend, inbox, registry, request]() {
            OperationResult result = execute(*backend, request);

            {
                std::lock_guard<std::mutex> lock(registry->mutex);
                auto it = registry->active.find(request.key);
                if (it != registry->active.end() && it->second == request.sequence) {
                    registry->active.erase(it);
                }
            }

            if (result.succeeded()) {
                log_info("done " + kind_name(request.key.kind) + " " + request.key.package_id +
                         " #" + std::to_string(request.sequence));
            } else {
                log_warn("failed " + kind_name(request.key.kind) + " " + request.key.package_id +
                         " (" + error_kind_name(result.error.kind) + "): " + result.error.message);
            }
            inbox->push(std::move(result));
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(registry_->mutex);
            auto it = registry_->active.find(request.key);
            if (it != registry_->active.end() && it->second == request.sequence) {
                registry_->active.erase(it);
            }
        }
        handle.rejection = std::string("could not start worker: ") + e.what();
        log_error(handle.rejection);
        return handle;
    }

    handle.accepted = true;
    return handle;
}

bool Dispatcher::is_active(const OperationKey& key) const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->active.count(key) > 0;
}

size_t Dispatcher::active_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->active.size();
}

} // namespace pkgdash
