#include "providers/winget.hpp"
#include "log.hpp"
#include "process.hpp"
#include "util.hpp"
#include <cctype>
#include <sstream>

namespace pkgdash {

namespace winget {

namespace {

bool is_separator(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.size() <= 10) return false;
    if (trimmed.find('-') == std::string::npos) return false;
    return trimmed.find_first_not_of("- ") == std::string::npos;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Slice [col_start, col_end) in display columns out of a UTF-8 line
std::string slice_columns(const std::string& line, size_t col_start, size_t col_end) {
    std::string field;
    size_t width = 0;
    size_t i = 0;
    while (i < line.size() && width < col_end) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;

        if (width >= col_start) {
            field.append(line, i, len);
        }
        i += len;
        ++width;
    }
    return trim(field);
}

int column_index(const Columns& cols, const std::string& name) {
    for (size_t i = 0; i < cols.size(); ++i) {
        if (cols[i].first == name) return static_cast<int>(i);
    }
    return -1;
}

// "3 upgrades available." style summaries after the table. Data rows span
// the table width and never end in a full stop.
bool is_footer(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || !std::isdigit(static_cast<unsigned char>(trimmed[0]))) return false;
    return line.size() <= 20 || trimmed.back() == '.';
}

} // anonymous namespace

std::string clean_output(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());

    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find('\n', start);
        if (end == std::string::npos) end = raw.size();

        std::string line = raw.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t last_cr = line.rfind('\r');
        if (last_cr != std::string::npos) {
            line = line.substr(last_cr + 1);
        }

        cleaned += line;
        if (end < raw.size()) cleaned += '\n';
        start = end + 1;
    }
    return cleaned;
}

Columns detect_columns(const std::string& header) {
    Columns cols;
    size_t i = 0;
    while (i < header.size()) {
        while (i < header.size() && header[i] == ' ') ++i;
        if (i >= header.size()) break;

        size_t start = i;
        while (i < header.size() && header[i] != ' ') ++i;
        cols.emplace_back(header.substr(start, i - start), start);
    }
    return cols;
}

PackageList parse_table(const std::string& output, Source default_source) {
    PackageList packages;
    auto lines = split_lines(output);

    size_t sep_idx = 0;
    bool found = false;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_separator(lines[i])) {
            sep_idx = i;
            found = true;
            break;
        }
    }
    if (!found) {
        return packages;
    }

    Columns cols = detect_columns(lines[sep_idx - 1]);
    int name_idx = column_index(cols, "Name");
    int id_idx = column_index(cols, "Id");
    int ver_idx = column_index(cols, "Version");
    int avail_idx = column_index(cols, "Available");
    int source_idx = column_index(cols, "Source");

    if (id_idx < 0) {
        return packages;
    }

    auto field = [&cols](const std::string& line, int idx) -> std::string {
        if (idx < 0) return "";
        size_t col_start = cols[idx].second;
        size_t col_end = (static_cast<size_t>(idx) + 1 < cols.size())
            ? cols[idx + 1].second
            : std::string::npos;
        return slice_columns(line, col_start, col_end);
    };

    for (size_t i = sep_idx + 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (trim(line).empty()) continue;
        if (is_footer(line)) break;

        Package pkg;
        pkg.id = field(line, id_idx);
        if (pkg.id.empty()) continue;

        pkg.name = field(line, name_idx);
        pkg.version = field(line, ver_idx);

        std::string available = field(line, avail_idx);
        if (!available.empty()) {
            pkg.available_version = available;
        }

        pkg.source = (source_idx >= 0) ? parse_source(field(line, source_idx)) : default_source;
        packages.push_back(std::move(pkg));
    }

    return packages;
}

PackageDetails parse_show(const std::string& output) {
    PackageDetails detail;
    auto lines = split_lines(output);

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        std::string trimmed = trim(line);

        // "Found Visual Studio Code [Microsoft.VisualStudioCode]"
        if (trimmed.rfind("Found ", 0) == 0) {
            size_t open = trimmed.rfind('[');
            size_t close = trimmed.rfind(']');
            if (open != std::string::npos && close != std::string::npos && open < close) {
                detail.name = trim(trimmed.substr(6, open - 6));
                detail.id = trimmed.substr(open + 1, close - open - 1);
            }
            continue;
        }

        // Only top-level "Key: Value" lines
        if (line.empty() || line[0] == ' ' || line[0] == '\t') continue;

        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, colon));
        std::string value = trim(trimmed.substr(colon + 1));

        if (key == "Version" || key == "PackageVersion") {
            detail.version = value;
        } else if (key == "Publisher") {
            detail.publisher = value;
        } else if (key == "Description") {
            // Continuation lines are indented
            while (i + 1 < lines.size() && lines[i + 1].rfind("  ", 0) == 0) {
                ++i;
                if (!value.empty()) value += ' ';
                value += trim(lines[i]);
            }
            detail.description = value;
        } else if (key == "Homepage") {
            detail.homepage = value;
        } else if (key == "Publisher Url") {
            if (detail.homepage.empty()) detail.homepage = value;
        } else if (key == "License") {
            detail.license = value;
        } else if (key == "Source") {
            detail.source = value;
        }
    }

    return detail;
}

} // namespace winget

namespace {

void add_source_args(std::vector<std::string>& args, SourceFilter filter) {
    if (filter == SourceFilter::All) return;
    args.push_back("--source");
    args.push_back(filter_name(filter));
}

Source filter_source(SourceFilter filter) {
    switch (filter) {
        case SourceFilter::Winget: return Source::Winget;
        case SourceFilter::MsStore: return Source::MsStore;
        case SourceFilter::All: break;
    }
    return Source::Unknown;
}

} // anonymous namespace

bool WingetBackend::is_available() const {
    return command_exists(options_.executable);
}

ActionResult WingetBackend::run(const std::vector<std::string>& args, ExitPolicy policy) const {
    ActionResult result;

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.executable);
    argv.insert(argv.end(), args.begin(), args.end());

    log_info("run: " + options_.executable + " " + (args.empty() ? "" : args[0]));
    auto exec = exec_command(argv, options_.timeout_seconds);

    if (exec.spawn_failed) {
        result.error = {BackendErrorKind::SpawnFailed,
                        "Failed to run " + options_.executable + ". Is it installed?"};
    } else if (exec.timed_out) {
        result.error = {BackendErrorKind::Timeout,
                        options_.executable + " timed out after " +
                        std::to_string(options_.timeout_seconds) + "s"};
    } else if (exec.exit_code != 0 &&
               (policy == ExitPolicy::Strict || trim(exec.stdout_output).empty())) {
        // winget reports most failures on stdout
        std::string cause = trim(exec.stderr_output);
        if (cause.empty()) cause = trim(winget::clean_output(exec.stdout_output));
        if (cause.empty()) cause = "exit code " + std::to_string(exec.exit_code);
        result.error = {BackendErrorKind::NonZeroExit, options_.executable + " failed: " + cause};
    } else {
        result.output = winget::clean_output(exec.stdout_output);
    }

    if (result.has_error()) {
        log_warn(result.error.message);
    }
    return result;
}

ListResult WingetBackend::list_installed() const {
    ListResult result;
    auto run_result = run({"list", "--accept-source-agreements"}, ExitPolicy::AllowOutput);
    if (run_result.has_error()) {
        result.error = run_result.error;
        return result;
    }
    result.packages = winget::parse_table(run_result.output);
    return result;
}

ListResult WingetBackend::search(const std::string& query, SourceFilter filter) const {
    ListResult result;

    if (query.empty()) {
        return result;
    }

    std::vector<std::string> args = {"search", query, "--accept-source-agreements"};
    add_source_args(args, filter);

    auto run_result = run(args, ExitPolicy::AllowOutput);
    if (run_result.has_error()) {
        result.error = run_result.error;
        return result;
    }

    // With --source winget omits the Source column
    result.packages = winget::parse_table(run_result.output, filter_source(filter));

    // Sort by relevance (exact match, starts with, contains, shorter names first)
    sort_by_relevance(result.packages, query);

    return result;
}

ListResult WingetBackend::list_upgrades() const {
    ListResult result;
    auto run_result = run({"upgrade", "--accept-source-agreements"}, ExitPolicy::AllowOutput);
    if (run_result.has_error()) {
        result.error = run_result.error;
        return result;
    }
    result.packages = winget::parse_table(run_result.output);
    return result;
}

DetailResult WingetBackend::fetch_details(const std::string& id) const {
    DetailResult result;
    auto run_result = run({"show", "--id", id, "--exact", "--accept-source-agreements"},
                          ExitPolicy::Strict);
    if (run_result.has_error()) {
        result.error = run_result.error;
        return result;
    }

    result.details = winget::parse_show(run_result.output);
    if (result.details.id.empty() && result.details.name.empty()) {
        result.error = {BackendErrorKind::ParseFailed, "No package details found for " + id};
    }
    return result;
}

ActionResult WingetBackend::install(const std::string& id) const {
    return run({"install", "--id", id, "--exact",
                "--accept-source-agreements", "--accept-package-agreements"}, ExitPolicy::Strict);
}

ActionResult WingetBackend::uninstall(const std::string& id) const {
    return run({"uninstall", "--id", id, "--exact", "--accept-source-agreements"},
               ExitPolicy::Strict);
}

ActionResult WingetBackend::upgrade(const std::string& id) const {
    return run({"upgrade", "--id", id, "--exact",
                "--accept-source-agreements", "--accept-package-agreements"}, ExitPolicy::Strict);
}

} // namespace pkgdash
