#include "backend.hpp"

namespace pkgdash {

OperationResult execute(const Backend& backend, const Request& request) {
    OperationResult result;
    result.key = request.key;
    result.sequence = request.sequence;
    result.view = request.view;

    switch (request.key.kind) {
        case OperationKind::Search: {
            auto listed = backend.search(request.query, request.filter);
            result.packages = std::move(listed.packages);
            result.error = listed.error;
            break;
        }
        case OperationKind::Refresh: {
            ListResult listed;
            if (request.view == View::Upgrades) {
                listed = backend.list_upgrades();
            } else if (request.view == View::Search) {
                listed = backend.search(request.query, request.filter);
            } else {
                listed = backend.list_installed();
            }
            result.packages = std::move(listed.packages);
            result.error = listed.error;
            break;
        }
        case OperationKind::Details: {
            auto fetched = backend.fetch_details(request.key.package_id);
            result.details = std::move(fetched.details);
            result.error = fetched.error;
            break;
        }
        case OperationKind::Install:
        case OperationKind::Uninstall:
        case OperationKind::Upgrade: {
            ActionResult action;
            if (request.key.kind == OperationKind::Install) {
                action = backend.install(request.key.package_id);
            } else if (request.key.kind == OperationKind::Uninstall) {
                action = backend.uninstall(request.key.package_id);
            } else {
                action = backend.upgrade(request.key.package_id);
            }
            result.output = std::move(action.output);
            result.error = action.error;
            break;
        }
    }

    return result;
}

} // namespace pkgdash
