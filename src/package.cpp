#include "package.hpp"
#include "util.hpp"

namespace pkgdash {

Source parse_source(const std::string& text) {
    std::string lower = to_lower(trim(text));
    if (lower == "winget") return Source::Winget;
    if (lower == "msstore") return Source::MsStore;
    return Source::Unknown;
}

std::string source_name(Source source) {
    switch (source) {
        case Source::Winget: return "winget";
        case Source::MsStore: return "msstore";
        case Source::Unknown: break;
    }
    return "";
}

SourceFilter cycle(SourceFilter filter) {
    switch (filter) {
        case SourceFilter::All: return SourceFilter::Winget;
        case SourceFilter::Winget: return SourceFilter::MsStore;
        case SourceFilter::MsStore: return SourceFilter::All;
    }
    return SourceFilter::All;
}

bool matches(SourceFilter filter, Source source) {
    switch (filter) {
        case SourceFilter::All: return true;
        case SourceFilter::Winget: return source == Source::Winget;
        case SourceFilter::MsStore: return source == Source::MsStore;
    }
    return true;
}

std::string filter_name(SourceFilter filter) {
    switch (filter) {
        case SourceFilter::All: return "All";
        case SourceFilter::Winget: return "winget";
        case SourceFilter::MsStore: return "msstore";
    }
    return "All";
}

PackageDetails merge_details(const Package& pkg, const PackageDetails& fetched) {
    PackageDetails merged = fetched;
    if (merged.id.empty()) merged.id = pkg.id;
    if (merged.name.empty()) merged.name = pkg.name;
    if (merged.version.empty()) merged.version = pkg.version;
    if (merged.source.empty()) merged.source = source_name(pkg.source);
    return merged;
}

Package with_details(const Package& pkg, const PackageDetails& details) {
    Package copy = pkg;
    copy.details = details;
    return copy;
}

} // namespace pkgdash
