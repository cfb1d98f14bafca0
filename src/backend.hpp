#pragma once

#include "operation.hpp"
#include "package.hpp"
#include <memory>
#include <string>

namespace pkgdash {

// Result of a listing or search
struct ListResult {
    PackageList packages;
    BackendError error;

    bool has_error() const { return error.is_error(); }
};

// Result of install / uninstall / upgrade
struct ActionResult {
    std::string output;
    BackendError error;

    bool has_error() const { return error.is_error(); }
};

struct DetailResult {
    PackageDetails details;
    BackendError error;

    bool has_error() const { return error.is_error(); }
};

// Abstract base class for package manager backends.
// Every call blocks until the package manager finishes, so callers must
// invoke them off the interactive loop.
class Backend {
public:
    virtual ~Backend() = default;

    // Get the name of this backend (e.g., "winget")
    virtual std::string name() const = 0;

    // Check if the package manager is available on the system
    virtual bool is_available() const = 0;

    virtual ListResult list_installed() const = 0;
    virtual ListResult search(const std::string& query, SourceFilter filter) const = 0;
    virtual ListResult list_upgrades() const = 0;
    virtual DetailResult fetch_details(const std::string& id) const = 0;

    virtual ActionResult install(const std::string& id) const = 0;
    virtual ActionResult uninstall(const std::string& id) const = 0;
    virtual ActionResult upgrade(const std::string& id) const = 0;
};

// Shared, since abandoned units of work may outlive the interactive loop
using BackendPtr = std::shared_ptr<Backend>;

// Run the backend call a request names and package the outcome as a message
OperationResult execute(const Backend& backend, const Request& request);

} // namespace pkgdash
