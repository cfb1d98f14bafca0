#include "state_machine.hpp"
#include "log.hpp"
#include "util.hpp"
#include <algorithm>

namespace pkgdash {

namespace {

// Record a new PENDING operation, superseding any earlier one on the same key
Request make_request(AppState& state, const OperationKey& key, View view) {
    Request request;
    request.key = key;
    request.sequence = state.next_sequence++;
    request.view = view;
    request.filter = state.filter;

    state.latest_sequence[key] = request.sequence;

    Operation op;
    op.key = key;
    op.status = OperationStatus::Pending;
    op.sequence = request.sequence;
    state.operations[key] = op;

    return request;
}

bool is_running(const AppState& state, const OperationKey& key) {
    auto it = state.operations.find(key);
    return it != state.operations.end() && it->second.is_active();
}

void request_list(AppState& state, View view, Effects& effects) {
    if (view == View::Search) {
        const std::string& query = state.list(View::Search).query;
        if (query.empty()) {
            state.status = "Type / to search.";
            return;
        }
        Request request = make_request(state, {view_scope_id(view), OperationKind::Search}, view);
        request.query = query;
        state.status = "Searching for \"" + query + "\"...";
        effects.push_back(std::move(request));
        return;
    }

    effects.push_back(make_request(state, {view_scope_id(view), OperationKind::Refresh}, view));
    state.status = "Loading " + to_lower(view_label(view)) + "...";
}

void request_details(AppState& state, Effects& effects) {
    const Package* pkg = selected_package(state);
    if (pkg == nullptr) {
        state.overlay = DetailOverlay{};
        return;
    }

    state.overlay = DetailOverlay{pkg->id};
    if (state.detail_cache.count(pkg->id) > 0) {
        return;
    }

    OperationKey key{pkg->id, OperationKind::Details};
    if (is_running(state, key)) {
        return;
    }
    effects.push_back(make_request(state, key, state.view));
}

bool detail_open(const AppState& state) {
    return std::holds_alternative<DetailOverlay>(state.overlay);
}

void selection_changed(AppState& state, Effects& effects) {
    if (detail_open(state)) {
        request_details(state, effects);
    }
}

void move_cursor(AppState& state, long target, bool wrap, Effects& effects) {
    ViewState& list = state.current();
    if (list.visible.empty()) {
        return;
    }

    long len = static_cast<long>(list.visible.size());
    long next = target;
    if (wrap) {
        next = ((target % len) + len) % len;
    } else {
        next = std::clamp(target, 0L, len - 1);
    }

    if (list.cursor && static_cast<long>(*list.cursor) == next) {
        return;
    }
    list.cursor = static_cast<size_t>(next);
    selection_changed(state, effects);
}

long cursor_position(const AppState& state) {
    const ViewState& list = state.current();
    return list.cursor ? static_cast<long>(*list.cursor) : 0;
}

void switch_view(AppState& state, View view, Effects& effects) {
    if (view == state.view) {
        return;
    }
    state.view = view;

    ViewState& list = state.current();
    bool fetching = is_running(state, {view_scope_id(view),
        view == View::Search ? OperationKind::Search : OperationKind::Refresh});
    if (!list.loaded && !fetching) {
        request_list(state, view, effects);
    } else if (!fetching) {
        state.status = view_label(view) + ": " + std::to_string(list.visible.size()) + " packages";
    }
    selection_changed(state, effects);
}

void request_action(AppState& state, const OperationKey& key, Effects& effects) {
    if (is_running(state, key)) {
        // Rejected, the running operation is left as it is
        state.status = describe(key) + " is already running";
        log_warn("command rejected: " + state.status);
        return;
    }
    effects.push_back(make_request(state, key, state.view));
    state.status = describe(key) + "...";
}

void action_command(AppState& state, OperationKind kind, Effects& effects) {
    const Package* pkg = selected_package(state);
    if (pkg == nullptr) {
        state.status = "No package selected";
        return;
    }

    OperationKey key{pkg->id, kind};
    if (state.confirm_actions) {
        state.overlay = ConfirmOverlay{key};
        return;
    }
    request_action(state, key, effects);
}

void pop_code_point(std::string& text) {
    while (!text.empty()) {
        unsigned char c = static_cast<unsigned char>(text.back());
        text.pop_back();
        if ((c & 0xC0) != 0x80) break;
    }
}

// Give every package in every list the cached details for its id
void attach_details(AppState& state, const std::string& id, const PackageDetails& details) {
    for (auto& list : state.views) {
        for (auto& pkg : list.packages) {
            if (pkg.id == id) {
                pkg = with_details(pkg, details);
            }
        }
    }
}

Effects apply_command(AppState& state, const KeyCommand& cmd) {
    Effects effects;

    switch (cmd.type) {
        case CommandType::None:
            break;

        case CommandType::Quit:
            state.should_quit = true;
            break;

        case CommandType::MoveUp:
            move_cursor(state, cursor_position(state) - 1, true, effects);
            break;

        case CommandType::MoveDown:
            move_cursor(state, cursor_position(state) + 1, true, effects);
            break;

        case CommandType::Scroll:
            move_cursor(state, cursor_position(state) + cmd.amount, false, effects);
            break;

        case CommandType::PageUp:
            move_cursor(state, cursor_position(state) - std::max(1, cmd.amount), false, effects);
            break;

        case CommandType::PageDown:
            move_cursor(state, cursor_position(state) + std::max(1, cmd.amount), false, effects);
            break;

        case CommandType::Home:
            move_cursor(state, 0, false, effects);
            break;

        case CommandType::End:
            move_cursor(state, static_cast<long>(state.current().visible.size()) - 1, false, effects);
            break;

        case CommandType::Select:
            move_cursor(state, cmd.amount, false, effects);
            break;

        case CommandType::SwitchView:
            switch_view(state, cmd.view, effects);
            break;

        case CommandType::NextView:
            switch_view(state, next_view(state.view), effects);
            break;

        case CommandType::PreviousView:
            switch_view(state, previous_view(state.view), effects);
            break;

        case CommandType::CycleFilter:
            state.filter = cycle(state.filter);
            for (auto& list : state.views) {
                refilter(list, state.filter);
            }
            state.status = "Filter: " + filter_name(state.filter);
            selection_changed(state, effects);
            break;

        case CommandType::FocusSearch:
            state.input_mode = InputMode::Search;
            break;

        case CommandType::SearchInput:
            state.query += cmd.text;
            break;

        case CommandType::SearchBackspace:
            pop_code_point(state.query);
            break;

        case CommandType::SubmitSearch:
            state.input_mode = InputMode::Normal;
            if (state.query.empty()) {
                state.status = "Type a query to search.";
                break;
            }
            state.list(View::Search).query = state.query;
            request_list(state, View::Search, effects);
            switch_view(state, View::Search, effects);
            break;

        case CommandType::CancelSearch:
            state.input_mode = InputMode::Normal;
            break;

        case CommandType::Install:
            action_command(state, OperationKind::Install, effects);
            break;

        case CommandType::Uninstall:
            action_command(state, OperationKind::Uninstall, effects);
            break;

        case CommandType::Upgrade:
            action_command(state, OperationKind::Upgrade, effects);
            break;

        case CommandType::Refresh:
            request_list(state, state.view, effects);
            break;

        case CommandType::ToggleHelp:
            if (std::holds_alternative<HelpOverlay>(state.overlay)) {
                state.overlay = std::monostate{};
            } else {
                state.overlay = HelpOverlay{};
            }
            break;

        case CommandType::ToggleDetail:
            if (detail_open(state)) {
                state.overlay = std::monostate{};
            } else {
                request_details(state, effects);
            }
            break;

        case CommandType::CloseOverlay:
            state.overlay = std::monostate{};
            break;

        case CommandType::Confirm:
            if (auto* confirm = std::get_if<ConfirmOverlay>(&state.overlay)) {
                OperationKey key = confirm->key;
                state.overlay = std::monostate{};
                request_action(state, key, effects);
            }
            break;

        case CommandType::Cancel:
            if (std::holds_alternative<ConfirmOverlay>(state.overlay)) {
                state.overlay = std::monostate{};
                state.status = "Cancelled";
            }
            break;

        case CommandType::ClearFinished:
            for (auto it = state.operations.begin(); it != state.operations.end();) {
                if (it->second.is_terminal()) {
                    it = state.operations.erase(it);
                } else {
                    ++it;
                }
            }
            state.status.clear();
            break;
    }

    return effects;
}

Effects apply_ack(AppState& state, const DispatchAck& ack) {
    auto it = state.operations.find(ack.handle.key);
    if (it == state.operations.end() || it->second.sequence != ack.handle.sequence) {
        return {};
    }

    if (ack.handle.accepted) {
        it->second.status = OperationStatus::Running;
    } else {
        state.operations.erase(it);
        state.status = ack.handle.rejection;
    }
    return {};
}

void refresh_after_action(AppState& state, Effects& effects) {
    for (View view : {View::Installed, View::Upgrades}) {
        if (state.list(view).loaded || state.view == view) {
            effects.push_back(make_request(state, {view_scope_id(view), OperationKind::Refresh}, view));
        }
    }

    const ViewState& search = state.list(View::Search);
    if (search.loaded && !search.query.empty()) {
        Request request = make_request(state, {view_scope_id(View::Search), OperationKind::Search},
                                       View::Search);
        request.query = search.query;
        effects.push_back(std::move(request));
    }
}

Effects apply_result(AppState& state, const OperationResult& result) {
    Effects effects;

    // Only the latest submission for a key may land
    auto latest = state.latest_sequence.find(result.key);
    if (latest == state.latest_sequence.end() || latest->second != result.sequence) {
        log_info("discarding stale " + kind_name(result.key.kind) + " result #" +
                 std::to_string(result.sequence));
        return effects;
    }

    Operation& op = state.operations[result.key];
    op.key = result.key;
    op.sequence = result.sequence;
    if (result.succeeded()) {
        op.status = OperationStatus::Succeeded;
        op.message.clear();
    } else {
        op.status = OperationStatus::Failed;
        op.message = result.error.message;
    }

    switch (result.key.kind) {
        case OperationKind::Search:
        case OperationKind::Refresh: {
            if (!result.succeeded()) {
                // Keep showing the previous list
                state.status = "Error: " + result.error.message;
                break;
            }

            PackageList packages = result.packages;
            for (auto& pkg : packages) {
                auto cached = state.detail_cache.find(pkg.id);
                if (cached != state.detail_cache.end()) {
                    pkg = with_details(pkg, cached->second);
                }
            }

            ViewState& list = state.list(result.view);
            replace_list(list, std::move(packages), state.filter);

            if (result.view == state.view) {
                size_t count = list.visible.size();
                state.status = std::to_string(count) + " package" + (count == 1 ? "" : "s") + " found";
                selection_changed(state, effects);
            }
            break;
        }

        case OperationKind::Details: {
            if (!result.succeeded()) {
                state.status = "Error: " + result.error.message;
                break;
            }

            PackageDetails details = result.details;
            for (const auto& list : state.views) {
                auto pkg = std::find_if(list.packages.begin(), list.packages.end(),
                    [&result](const Package& p) { return p.id == result.key.package_id; });
                if (pkg != list.packages.end()) {
                    details = merge_details(*pkg, result.details);
                    break;
                }
            }
            if (details.id.empty()) {
                details.id = result.key.package_id;
            }

            state.detail_cache[result.key.package_id] = details;
            attach_details(state, result.key.package_id, details);
            break;
        }

        case OperationKind::Install:
        case OperationKind::Uninstall:
        case OperationKind::Upgrade: {
            state.detail_cache.erase(result.key.package_id);
            if (result.succeeded()) {
                state.status = describe(result.key) + " - done";
            } else {
                state.status = describe(result.key) + " - failed: " + result.error.message;
            }
            refresh_after_action(state, effects);
            break;
        }
    }

    return effects;
}

} // anonymous namespace

Effects apply(AppState& state, const Message& message) {
    if (const auto* cmd = std::get_if<KeyCommand>(&message)) {
        return apply_command(state, *cmd);
    }
    if (const auto* ack = std::get_if<DispatchAck>(&message)) {
        return apply_ack(state, *ack);
    }
    return apply_result(state, std::get<OperationResult>(message));
}

Effects start(AppState& state) {
    Effects effects;
    if (state.view == View::Search && !state.query.empty()) {
        state.list(View::Search).query = state.query;
    }
    request_list(state, state.view, effects);
    return effects;
}

} // namespace pkgdash
