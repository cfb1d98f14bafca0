#pragma once

#include "backend.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pkgdash {

class WingetBackend : public Backend {
public:
    struct Options {
        std::string executable = "winget";
        int timeout_seconds = 0;  // 0 = no timeout
    };

    WingetBackend() = default;
    explicit WingetBackend(Options options) : options_(std::move(options)) {}

    std::string name() const override { return "winget"; }
    bool is_available() const override;

    ListResult list_installed() const override;
    ListResult search(const std::string& query, SourceFilter filter) const override;
    ListResult list_upgrades() const override;
    DetailResult fetch_details(const std::string& id) const override;

    ActionResult install(const std::string& id) const override;
    ActionResult uninstall(const std::string& id) const override;
    ActionResult upgrade(const std::string& id) const override;

private:
    // How a non-zero exit status is treated
    enum class ExitPolicy {
        Strict,         // any non-zero exit is a failure
        AllowOutput,    // listings exit non-zero for "no results"; fail only without output
    };

    // Run winget with the given arguments; on success returns cleaned stdout
    ActionResult run(const std::vector<std::string>& args, ExitPolicy policy) const;

    Options options_;
};

// Parsers for winget's human-readable output
namespace winget {

// Normalise CRLF and keep only the final segment of progress-overwritten lines
std::string clean_output(const std::string& raw);

// Header column names and their starting display columns
using Columns = std::vector<std::pair<std::string, size_t>>;

Columns detect_columns(const std::string& header);

// Parse a list/search/upgrade table; rows without a Source column get default_source
PackageList parse_table(const std::string& output, Source default_source = Source::Unknown);

PackageDetails parse_show(const std::string& output);

} // namespace winget

} // namespace pkgdash
