#pragma once

#include "operation.hpp"
#include "package.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pkgdash {

// One view's list and cursor
struct ViewState {
    PackageList packages;
    std::vector<size_t> visible;    // indices into packages passing the filter
    std::optional<size_t> cursor;   // index into visible; empty = no selection
    bool loaded = false;
    std::string query;              // Search view: last submitted query
};

struct HelpOverlay {};

struct DetailOverlay {
    std::string package_id;
};

struct ConfirmOverlay {
    OperationKey key;
};

// At most one overlay is shown; monostate means none
using Overlay = std::variant<std::monostate, HelpOverlay, DetailOverlay, ConfirmOverlay>;

enum class InputMode {
    Normal,
    Search,
};

struct AppState {
    View view = View::Installed;
    SourceFilter filter = SourceFilter::All;
    std::array<ViewState, VIEW_COUNT> views;

    std::string query;                  // text in the search bar
    InputMode input_mode = InputMode::Normal;

    std::map<OperationKey, Operation> operations;
    std::map<OperationKey, uint64_t> latest_sequence;
    uint64_t next_sequence = 1;

    Overlay overlay;
    std::map<std::string, PackageDetails> detail_cache;

    std::string status;
    bool confirm_actions = false;
    bool should_quit = false;

    ViewState& list(View v) { return views[static_cast<size_t>(v)]; }
    const ViewState& list(View v) const { return views[static_cast<size_t>(v)]; }
    ViewState& current() { return list(view); }
    const ViewState& current() const { return list(view); }
};

// Recompute the visible subset, keeping the selected package selected if it survives
void refilter(ViewState& list, SourceFilter filter);

// Swap in a freshly fetched list and clamp the cursor to it
void replace_list(ViewState& list, PackageList packages, SourceFilter filter);

// Package at position `index` of the visible subset
const Package* visible_at(const ViewState& list, size_t index);

const Package* selected_package(const AppState& state);

// Most recent operation (highest sequence) on a package id, any kind
const Operation* latest_operation(const AppState& state, const std::string& package_id);

bool has_active_operation(const AppState& state);

} // namespace pkgdash
