#pragma once

#include "package.hpp"
#include <cstdint>
#include <string>

namespace pkgdash {

enum class OperationKind {
    Install,
    Uninstall,
    Upgrade,
    Search,
    Refresh,
    Details,
};

enum class OperationStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
};

// The three package lists the user switches between
enum class View {
    Search = 0,
    Installed = 1,
    Upgrades = 2,
};

constexpr int VIEW_COUNT = 3;

View next_view(View view);
View previous_view(View view);
std::string view_label(View view);

std::string kind_name(OperationKind kind);

// Install, uninstall and upgrade change what is on the system
bool is_package_action(OperationKind kind);

// Whether a newer submission replaces a running one instead of being rejected
bool supersedes_running(OperationKind kind);

// List fetches are tracked under a pseudo package id naming their view
std::string view_scope_id(View view);

// Operations are tracked per (package id, kind)
struct OperationKey {
    std::string package_id;
    OperationKind kind = OperationKind::Refresh;

    bool operator<(const OperationKey& other) const {
        if (package_id != other.package_id) return package_id < other.package_id;
        return kind < other.kind;
    }
    bool operator==(const OperationKey& other) const {
        return package_id == other.package_id && kind == other.kind;
    }
};

struct Operation {
    OperationKey key;
    OperationStatus status = OperationStatus::Pending;
    uint64_t sequence = 0;
    std::string message;  // failure cause or backend output summary

    bool is_active() const {
        return status == OperationStatus::Pending || status == OperationStatus::Running;
    }
    bool is_terminal() const { return !is_active(); }
};

// Human-readable "Upgrading Foo" style description
std::string describe(const OperationKey& key);

// One unit of background work, produced by the state machine
struct Request {
    OperationKey key;
    uint64_t sequence = 0;
    View view = View::Installed;          // list the result belongs to
    std::string query;                    // Search only
    SourceFilter filter = SourceFilter::All;
};

enum class BackendErrorKind {
    None,
    SpawnFailed,
    NonZeroExit,
    ParseFailed,
    Timeout,
};

struct BackendError {
    BackendErrorKind kind = BackendErrorKind::None;
    std::string message;

    bool is_error() const { return kind != BackendErrorKind::None; }
};

std::string error_kind_name(BackendErrorKind kind);

// Message a unit of work sends back when it completes
struct OperationResult {
    OperationKey key;
    uint64_t sequence = 0;
    View view = View::Installed;
    BackendError error;
    PackageList packages;      // Search / Refresh
    PackageDetails details;    // Details
    std::string output;        // Install / Uninstall / Upgrade

    bool succeeded() const { return !error.is_error(); }
};

} // namespace pkgdash
