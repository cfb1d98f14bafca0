#include "app.hpp"
#include "options.hpp"
#include <cstdio>

void print_help(const char* program_name) {
    printf("pkgdash - Terminal dashboard for the winget package manager\n\n");
    printf("Usage: %s [OPTIONS]\n\n", program_name);
    printf("Options:\n");
    printf("  -w, --winget <path>     winget executable (default: winget)\n");
    printf("  -t, --timeout <secs>    Kill winget calls after this long (default: none)\n");
    printf("  -V, --view <name>       Start in view: search, installed, upgrades\n");
    printf("  -q, --query <text>      Search for text on startup\n");
    printf("  -c, --confirm           Ask before install/uninstall/upgrade\n");
    printf("  -L, --log <file>        Append a log to file\n");
    printf("  -h, --help              Show this help message\n");
    printf("  -v, --version           Show version\n\n");
    printf("Controls:\n");
    printf("  Tab/1/2/3  - Switch view (Search, Installed, Upgrades)\n");
    printf("  Up/Down    - Navigate packages\n");
    printf("  PgUp/PgDn  - Navigate by page\n");
    printf("  /          - Search\n");
    printf("  f          - Cycle source filter (All, winget, msstore)\n");
    printf("  i/x/u      - Install / uninstall / upgrade selected package\n");
    printf("  Enter      - Package details\n");
    printf("  r          - Refresh\n");
    printf("  ?          - Help\n");
    printf("  q          - Quit\n");
}

void print_version() {
    printf("pkgdash version 0.4.0\n");
}

int main(int argc, char* argv[]) {
    pkgdash::Options options = pkgdash::parse_options(argc, argv);

    if (options.has_error()) {
        fprintf(stderr, "Error: %s\n", options.error.c_str());
        fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return 2;
    }
    if (options.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (options.show_version) {
        print_version();
        return 0;
    }

    return pkgdash::run_app(options);
}
