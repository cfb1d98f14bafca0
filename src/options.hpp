#pragma once

#include "operation.hpp"
#include <string>

namespace pkgdash {

struct Options {
    std::string winget_path = "winget";
    int timeout_seconds = 0;
    View initial_view = View::Installed;
    std::string initial_query;
    bool confirm_actions = false;
    std::string log_path;

    bool show_help = false;
    bool show_version = false;

    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

Options parse_options(int argc, const char* const argv[]);

} // namespace pkgdash
