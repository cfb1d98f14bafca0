#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pkgdash {

// Catalog a package comes from
enum class Source {
    Winget,
    MsStore,
    Unknown,
};

Source parse_source(const std::string& text);
std::string source_name(Source source);

// Global filter applied to every view's list
enum class SourceFilter {
    All,
    Winget,
    MsStore,
};

SourceFilter cycle(SourceFilter filter);
bool matches(SourceFilter filter, Source source);
std::string filter_name(SourceFilter filter);

// Fields reported by `show`, fetched on demand
struct PackageDetails {
    std::string id;
    std::string name;
    std::string version;
    std::string publisher;
    std::string description;
    std::string homepage;
    std::string license;
    std::string source;
};

struct Package {
    std::string id;
    std::string name;
    std::string version;
    std::optional<std::string> available_version;  // only in upgrade listings
    Source source = Source::Unknown;
    std::optional<PackageDetails> details;

    // Identity is id + source; versions and details may differ between snapshots
    bool operator==(const Package& other) const {
        return id == other.id && source == other.source;
    }
};

using PackageList = std::vector<Package>;

// Overlay fetched details onto list data, keeping list values where the fetch left gaps
PackageDetails merge_details(const Package& pkg, const PackageDetails& fetched);

// Returns a copy of pkg carrying details
Package with_details(const Package& pkg, const PackageDetails& details);

} // namespace pkgdash
