#include "operation.hpp"

namespace pkgdash {

View next_view(View view) {
    switch (view) {
        case View::Search: return View::Installed;
        case View::Installed: return View::Upgrades;
        case View::Upgrades: return View::Search;
    }
    return View::Installed;
}

View previous_view(View view) {
    switch (view) {
        case View::Search: return View::Upgrades;
        case View::Installed: return View::Search;
        case View::Upgrades: return View::Installed;
    }
    return View::Installed;
}

std::string view_label(View view) {
    switch (view) {
        case View::Search: return "Search";
        case View::Installed: return "Installed";
        case View::Upgrades: return "Upgrades";
    }
    return "";
}

std::string kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Install: return "install";
        case OperationKind::Uninstall: return "uninstall";
        case OperationKind::Upgrade: return "upgrade";
        case OperationKind::Search: return "search";
        case OperationKind::Refresh: return "refresh";
        case OperationKind::Details: return "details";
    }
    return "";
}

bool is_package_action(OperationKind kind) {
    return kind == OperationKind::Install ||
           kind == OperationKind::Uninstall ||
           kind == OperationKind::Upgrade;
}

bool supersedes_running(OperationKind kind) {
    return kind == OperationKind::Search || kind == OperationKind::Refresh;
}

std::string view_scope_id(View view) {
    switch (view) {
        case View::Search: return "@search";
        case View::Installed: return "@installed";
        case View::Upgrades: return "@upgrades";
    }
    return "@installed";
}

std::string describe(const OperationKey& key) {
    switch (key.kind) {
        case OperationKind::Install: return "Installing " + key.package_id;
        case OperationKind::Uninstall: return "Uninstalling " + key.package_id;
        case OperationKind::Upgrade: return "Upgrading " + key.package_id;
        case OperationKind::Search: return "Searching";
        case OperationKind::Refresh:
            if (!key.package_id.empty() && key.package_id[0] == '@') {
                return "Loading " + key.package_id.substr(1);
            }
            return "Loading " + key.package_id;
        case OperationKind::Details: return "Fetching details for " + key.package_id;
    }
    return key.package_id;
}

std::string error_kind_name(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::None: return "none";
        case BackendErrorKind::SpawnFailed: return "spawn failed";
        case BackendErrorKind::NonZeroExit: return "non-zero exit";
        case BackendErrorKind::ParseFailed: return "unparsable output";
        case BackendErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}

} // namespace pkgdash
