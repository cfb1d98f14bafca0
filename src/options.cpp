#include "options.hpp"
#include <cstdlib>
#include <cstring>

namespace pkgdash {

namespace {

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return strcmp(arg, short_name) == 0 || strcmp(arg, long_name) == 0;
}

bool parse_view(const std::string& text, View& view) {
    if (text == "search") view = View::Search;
    else if (text == "installed") view = View::Installed;
    else if (text == "upgrades") view = View::Upgrades;
    else return false;
    return true;
}

} // anonymous namespace

Options parse_options(int argc, const char* const argv[]) {
    Options options;
    bool view_given = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            options.show_help = true;
            continue;
        }
        if (is_flag(arg, "-v", "--version")) {
            options.show_version = true;
            continue;
        }
        if (is_flag(arg, "-c", "--confirm")) {
            options.confirm_actions = true;
            continue;
        }

        // Everything below takes a value
        bool takes_value = is_flag(arg, "-w", "--winget") || is_flag(arg, "-t", "--timeout") ||
                           is_flag(arg, "-V", "--view") || is_flag(arg, "-q", "--query") ||
                           is_flag(arg, "-L", "--log");
        if (!takes_value) {
            options.error = std::string("Unknown option '") + arg + "'";
            return options;
        }
        if (i + 1 >= argc) {
            options.error = std::string("Option '") + arg + "' requires a value";
            return options;
        }
        std::string value = argv[++i];

        if (is_flag(arg, "-w", "--winget")) {
            options.winget_path = value;
        } else if (is_flag(arg, "-t", "--timeout")) {
            char* end = nullptr;
            long seconds = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || seconds < 0 || seconds > 86400) {
                options.error = "Invalid timeout '" + value + "'";
                return options;
            }
            options.timeout_seconds = static_cast<int>(seconds);
        } else if (is_flag(arg, "-V", "--view")) {
            if (!parse_view(value, options.initial_view)) {
                options.error = "Unknown view '" + value + "' (search, installed, upgrades)";
                return options;
            }
            view_given = true;
        } else if (is_flag(arg, "-q", "--query")) {
            options.initial_query = value;
        } else {
            options.log_path = value;
        }
    }

    // An initial query opens on the search results unless a view was named
    if (!options.initial_query.empty() && !view_given) {
        options.initial_view = View::Search;
    }

    return options;
}

} // namespace pkgdash
