/*
State machine tests: navigation, admission, stale-result discard, list refresh.
*/
#include "state_machine.hpp"
#include "test_support.hpp"

using namespace pkgdash;
using pkgdash::testing::make_package;

static KeyCommand cmd(CommandType type, int amount = 0)
{
    KeyCommand c;
    c.type = type;
    c.amount = amount;
    return c;
}

static void accept(AppState& state, const Request& request)
{
    OperationHandle handle;
    handle.key = request.key;
    handle.sequence = request.sequence;
    handle.accepted = true;
    apply(state, DispatchAck{handle});
}

static OperationResult list_result(const Request& request, const PackageList& packages)
{
    OperationResult result;
    result.key = request.key;
    result.sequence = request.sequence;
    result.view = request.view;
    result.packages = packages;
    return result;
}

static OperationResult done(const Request& request)
{
    OperationResult result;
    result.key = request.key;
    result.sequence = request.sequence;
    result.view = request.view;
    return result;
}

// INSTALLED view loaded with the given packages, cursor on the first one
static AppState installed_state(const PackageList& packages)
{
    AppState state;
    Effects effects = start(state);
    accept(state, effects[0]);
    apply(state, list_result(effects[0], packages));
    return state;
}

static int test_start_loads_installed(void)
{
    AppState state;
    Effects effects = start(state);
    EXPECT(effects.size() == 1, "one startup request");
    EXPECT(effects[0].key.kind == OperationKind::Refresh, "startup refresh");
    EXPECT(effects[0].view == View::Installed, "startup view");
    EXPECT(state.operations[effects[0].key].status == OperationStatus::Pending, "pending before ack");

    accept(state, effects[0]);
    EXPECT(state.operations[effects[0].key].status == OperationStatus::Running, "running after ack");

    apply(state, list_result(effects[0], {make_package("A"), make_package("B")}));
    EXPECT(state.current().packages.size() == 2, "list replaced");
    EXPECT(state.current().cursor && *state.current().cursor == 0, "cursor on first");
    EXPECT(state.operations[effects[0].key].status == OperationStatus::Succeeded, "refresh succeeded");
    return 0;
}

static int test_navigation_is_deterministic(void)
{
    PackageList packages;
    for (int i = 0; i < 30; ++i) packages.push_back(make_package("P" + std::to_string(i)));

    AppState a = installed_state(packages);
    AppState b = installed_state(packages);

    const CommandType script[] = {
        CommandType::MoveDown, CommandType::MoveDown, CommandType::PageDown,
        CommandType::MoveUp, CommandType::End, CommandType::MoveDown,
        CommandType::Home, CommandType::MoveUp, CommandType::CycleFilter,
        CommandType::PageUp,
    };

    size_t ops_before = a.operations.size();
    for (CommandType type : script) {
        Effects ea = apply(a, cmd(type, 10));
        Effects eb = apply(b, cmd(type, 10));
        EXPECT(ea.empty() && eb.empty(), "navigation requests no background work");
        EXPECT(a.current().cursor == b.current().cursor, "same cursor");
        EXPECT(a.filter == b.filter, "same filter");
    }
    EXPECT(a.operations.size() == ops_before, "operations untouched");
    EXPECT(a.current().packages.size() == 30, "list untouched");
    return 0;
}

static int test_navigation_bounds(void)
{
    AppState state = installed_state({make_package("A"), make_package("B"), make_package("C")});

    apply(state, cmd(CommandType::MoveUp));
    EXPECT(*state.current().cursor == 2, "up from first wraps to last");
    apply(state, cmd(CommandType::MoveDown));
    EXPECT(*state.current().cursor == 0, "down from last wraps to first");

    apply(state, cmd(CommandType::PageDown, 20));
    EXPECT(*state.current().cursor == 2, "page down clamps");
    apply(state, cmd(CommandType::PageUp, 20));
    EXPECT(*state.current().cursor == 0, "page up clamps");

    apply(state, cmd(CommandType::Select, 1));
    EXPECT(*state.current().cursor == 1, "select row");
    apply(state, cmd(CommandType::Select, 99));
    EXPECT(*state.current().cursor == 2, "select clamps");
    return 0;
}

static int test_cursor_clamps_on_replace(void)
{
    ViewState list;
    PackageList five;
    for (int i = 0; i < 5; ++i) five.push_back(make_package("P" + std::to_string(i)));

    replace_list(list, five, SourceFilter::All);
    list.cursor = 4;

    replace_list(list, {make_package("X"), make_package("Y")}, SourceFilter::All);
    EXPECT(list.cursor && *list.cursor == 1, "cursor clamped to last");

    replace_list(list, {}, SourceFilter::All);
    EXPECT(!list.cursor, "empty list clears selection");

    replace_list(list, {make_package("Z")}, SourceFilter::All);
    EXPECT(list.cursor && *list.cursor == 0, "selection comes back on first package");
    return 0;
}

static int test_uninstall_refreshes_installed(void)
{
    AppState state = installed_state({make_package("Alpha"), make_package("Foo"), make_package("Zed")});
    apply(state, cmd(CommandType::Select, 1));
    EXPECT(selected_package(state)->id == "Foo", "Foo selected");

    Effects effects = apply(state, cmd(CommandType::Uninstall));
    EXPECT(effects.size() == 1, "one uninstall request");
    OperationKey key{"Foo", OperationKind::Uninstall};
    EXPECT(effects[0].key == key, "uninstall keyed on Foo");

    accept(state, effects[0]);
    EXPECT(state.operations[key].status == OperationStatus::Running, "uninstall running");

    Effects refresh = apply(state, done(effects[0]));
    EXPECT(state.operations[key].status == OperationStatus::Succeeded, "uninstall succeeded");
    EXPECT(!refresh.empty(), "refresh triggered");

    const Request* installed = nullptr;
    for (const auto& r : refresh) {
        if (r.view == View::Installed && r.key.kind == OperationKind::Refresh) installed = &r;
    }
    EXPECT(installed != nullptr, "installed list refreshed");

    accept(state, *installed);
    apply(state, list_result(*installed, {make_package("Alpha"), make_package("Zed")}));

    for (const auto& pkg : state.list(View::Installed).packages) {
        EXPECT(pkg.id != "Foo", "Foo gone after uninstall");
    }
    EXPECT(*state.current().cursor == 1, "cursor clamped after removal");
    return 0;
}

static int test_duplicate_upgrade_rejected(void)
{
    AppState state = installed_state({make_package("Foo")});

    Effects first = apply(state, cmd(CommandType::Upgrade));
    EXPECT(first.size() == 1, "first upgrade requested");
    accept(state, first[0]);

    OperationKey key{"Foo", OperationKind::Upgrade};
    Operation before = state.operations[key];

    Effects second = apply(state, cmd(CommandType::Upgrade));
    EXPECT(second.empty(), "second upgrade rejected");
    EXPECT(state.status.find("already running") != std::string::npos, "rejection shown");

    const Operation& after = state.operations[key];
    EXPECT(after.sequence == before.sequence, "existing operation kept");
    EXPECT(after.status == OperationStatus::Running, "existing operation still running");

    // A different kind on the same package is tracked separately
    Effects details = apply(state, cmd(CommandType::ToggleDetail));
    EXPECT(details.size() == 1, "details allowed while upgrading");
    EXPECT(details[0].key.kind == OperationKind::Details, "details request");
    return 0;
}

static int test_stale_result_discarded(void)
{
    AppState base = installed_state({make_package("A")});
    base.query = "vim";
    Effects s1 = apply(base, cmd(CommandType::SubmitSearch));
    accept(base, s1[0]);
    base.query = "vim";
    Effects s2 = apply(base, cmd(CommandType::SubmitSearch));
    accept(base, s2[0]);
    EXPECT(s1[0].sequence < s2[0].sequence, "sequences increase");
    EXPECT(s1[0].key == s2[0].key, "same key");

    OperationResult r1 = list_result(s1[0], {make_package("old.one")});
    OperationResult r2 = list_result(s2[0], {make_package("new.one"), make_package("new.two")});

    AppState both = base;
    apply(both, r2);
    apply(both, r1);

    AppState only = base;
    apply(only, r2);

    const ViewState& lb = both.list(View::Search);
    const ViewState& lo = only.list(View::Search);
    EXPECT(lb.packages.size() == lo.packages.size(), "same list length");
    for (size_t i = 0; i < lb.packages.size(); ++i) {
        EXPECT(lb.packages[i].id == lo.packages[i].id, "same packages");
    }
    EXPECT(lb.cursor == lo.cursor, "same cursor");
    EXPECT(both.operations.size() == only.operations.size(), "same operations");
    EXPECT(both.operations[s2[0].key].status == only.operations[s2[0].key].status, "same status");
    EXPECT(both.status == only.status, "same status line");
    return 0;
}

static int test_later_search_wins(void)
{
    AppState state = installed_state({});

    state.query = "vim";
    Effects first = apply(state, cmd(CommandType::SubmitSearch));
    accept(state, first[0]);

    state.query = "emacs";
    Effects second = apply(state, cmd(CommandType::SubmitSearch));
    EXPECT(second.size() == 1, "second search not rejected");
    accept(state, second[0]);
    EXPECT(state.view == View::Search, "search view active");

    // emacs completes first, vim straggles in afterwards
    apply(state, list_result(second[0], {make_package("GNU.Emacs")}));
    apply(state, list_result(first[0], {make_package("vim.vim"), make_package("Neovim")}));

    const ViewState& list = state.list(View::Search);
    EXPECT(list.packages.size() == 1, "only the latest query's results");
    EXPECT(list.packages[0].id == "GNU.Emacs", "emacs results shown");
    EXPECT(list.query == "emacs", "latest query recorded");
    return 0;
}

static int test_filter_cycle_without_backend(void)
{
    AppState state = installed_state({
        make_package("A", Source::Winget),
        make_package("B", Source::MsStore),
        make_package("C", Source::Unknown),
        make_package("D", Source::Winget),
    });
    std::vector<size_t> original = state.current().visible;
    EXPECT(original.size() == 4, "all visible under ALL");

    Effects e1 = apply(state, cmd(CommandType::CycleFilter));
    EXPECT(state.filter == SourceFilter::Winget, "winget filter");
    EXPECT(state.current().visible.size() == 2, "two winget packages");

    Effects e2 = apply(state, cmd(CommandType::CycleFilter));
    EXPECT(state.filter == SourceFilter::MsStore, "msstore filter");
    EXPECT(state.current().visible.size() == 1, "one msstore package");

    Effects e3 = apply(state, cmd(CommandType::CycleFilter));
    EXPECT(state.filter == SourceFilter::All, "back to all");
    EXPECT(state.current().visible == original, "original subset restored");
    EXPECT(e1.empty() && e2.empty() && e3.empty(), "no backend calls");
    return 0;
}

static int test_filter_keeps_selected_package(void)
{
    AppState state = installed_state({
        make_package("A", Source::MsStore),
        make_package("B", Source::Winget),
        make_package("C", Source::Winget),
    });
    apply(state, cmd(CommandType::Select, 2));

    apply(state, cmd(CommandType::CycleFilter));
    EXPECT(selected_package(state)->id == "C", "selection follows the package");

    apply(state, cmd(CommandType::CycleFilter));
    EXPECT(selected_package(state)->id == "A", "only msstore package left");
    return 0;
}

static int test_failed_refresh_keeps_list(void)
{
    AppState state = installed_state({make_package("A"), make_package("B")});

    Effects effects = apply(state, cmd(CommandType::Refresh));
    EXPECT(effects.size() == 1, "refresh requested");
    accept(state, effects[0]);

    OperationResult failed = done(effects[0]);
    failed.error = {BackendErrorKind::NonZeroExit, "winget failed: boom"};
    apply(state, failed);

    EXPECT(state.current().packages.size() == 2, "previous list kept");
    const Operation& op = state.operations[effects[0].key];
    EXPECT(op.status == OperationStatus::Failed, "refresh failed");
    EXPECT(op.message == "winget failed: boom", "failure message kept");
    EXPECT(state.status.find("boom") != std::string::npos, "failure shown");
    return 0;
}

static int test_detail_overlay_uses_cache(void)
{
    AppState state = installed_state({make_package("Foo")});

    Effects effects = apply(state, cmd(CommandType::ToggleDetail));
    EXPECT(std::holds_alternative<DetailOverlay>(state.overlay), "detail overlay open");
    EXPECT(effects.size() == 1, "details requested");
    accept(state, effects[0]);

    OperationResult result = done(effects[0]);
    result.details.publisher = "Foo Corp";
    apply(state, result);
    EXPECT(state.detail_cache.count("Foo") == 1, "details cached");
    EXPECT(state.detail_cache["Foo"].name == "Foo", "gaps filled from list data");
    EXPECT(state.current().packages[0].details->publisher == "Foo Corp", "package carries details");

    apply(state, cmd(CommandType::ToggleDetail));
    EXPECT(std::holds_alternative<std::monostate>(state.overlay), "overlay closed");

    Effects again = apply(state, cmd(CommandType::ToggleDetail));
    EXPECT(again.empty(), "cached details not fetched again");
    return 0;
}

static int test_overlays_are_exclusive(void)
{
    AppState state = installed_state({make_package("Foo")});
    state.confirm_actions = true;

    apply(state, cmd(CommandType::ToggleHelp));
    EXPECT(std::holds_alternative<HelpOverlay>(state.overlay), "help open");

    Effects effects = apply(state, cmd(CommandType::Install));
    EXPECT(effects.empty(), "install waits for confirmation");
    EXPECT(std::holds_alternative<ConfirmOverlay>(state.overlay), "confirm replaced help");

    effects = apply(state, cmd(CommandType::Confirm));
    EXPECT(effects.size() == 1, "install requested after confirmation");
    EXPECT(effects[0].key.kind == OperationKind::Install, "install kind");
    EXPECT(std::holds_alternative<std::monostate>(state.overlay), "confirm closed");

    apply(state, cmd(CommandType::Uninstall));
    effects = apply(state, cmd(CommandType::Cancel));
    EXPECT(effects.empty(), "cancel dispatches nothing");
    EXPECT(state.status == "Cancelled", "cancel shown");
    return 0;
}

static int test_dispatch_rejection_drops_operation(void)
{
    AppState state = installed_state({make_package("Foo")});
    Effects effects = apply(state, cmd(CommandType::Install));

    OperationHandle handle;
    handle.key = effects[0].key;
    handle.sequence = effects[0].sequence;
    handle.rejection = "Installing Foo is already running";
    apply(state, DispatchAck{handle});

    EXPECT(state.operations.count(effects[0].key) == 0, "rejected operation removed");
    EXPECT(state.status == handle.rejection, "rejection shown");
    return 0;
}

static int test_clear_finished(void)
{
    AppState state = installed_state({make_package("Foo"), make_package("Bar")});
    Effects install = apply(state, cmd(CommandType::Install));
    accept(state, install[0]);
    apply(state, done(install[0]));

    apply(state, cmd(CommandType::MoveDown));
    Effects upgrade = apply(state, cmd(CommandType::Upgrade));
    accept(state, upgrade[0]);

    apply(state, cmd(CommandType::ClearFinished));
    EXPECT(state.operations.count(install[0].key) == 0, "finished install dismissed");
    EXPECT(state.operations.count(upgrade[0].key) == 1, "running upgrade kept");
    return 0;
}

static int test_view_switch_fetches_once(void)
{
    AppState state = installed_state({make_package("Foo")});

    Effects effects = apply(state, cmd(CommandType::NextView));
    EXPECT(state.view == View::Upgrades, "upgrades view");
    EXPECT(effects.size() == 1 && effects[0].view == View::Upgrades, "upgrades fetched");
    accept(state, effects[0]);
    apply(state, list_result(effects[0], {make_package("Foo", Source::Winget, "1.0")}));

    apply(state, cmd(CommandType::PreviousView));
    EXPECT(state.view == View::Installed, "back to installed");
    effects = apply(state, cmd(CommandType::NextView));
    EXPECT(effects.empty(), "loaded view not fetched again");

    KeyCommand to_search = cmd(CommandType::SwitchView);
    to_search.view = View::Search;
    effects = apply(state, to_search);
    EXPECT(effects.empty(), "empty search not fetched");
    EXPECT(state.view == View::Search, "search view");
    return 0;
}

static int test_search_editing(void)
{
    AppState state;
    apply(state, cmd(CommandType::FocusSearch));
    EXPECT(state.input_mode == InputMode::Search, "search mode");

    KeyCommand input = cmd(CommandType::SearchInput);
    for (const char* bytes : {"g", "i", "t", "\xc3", "\xa9"}) {
        input.text = bytes;
        apply(state, input);
    }
    EXPECT(state.query == "git\xc3\xa9", "utf-8 query");

    apply(state, cmd(CommandType::SearchBackspace));
    EXPECT(state.query == "git", "backspace removes a whole code point");

    Effects effects = apply(state, cmd(CommandType::SubmitSearch));
    EXPECT(state.input_mode == InputMode::Normal, "normal mode after submit");
    EXPECT(effects.size() == 1 && effects[0].query == "git", "search for git");

    state.query.clear();
    effects = apply(state, cmd(CommandType::SubmitSearch));
    EXPECT(effects.empty(), "empty query not submitted");
    return 0;
}

static int test_failed_action_recorded(void)
{
    AppState state = installed_state({make_package("Foo"), make_package("Bar")});

    // Cached details for Foo must not outlive an action on it
    Effects details = apply(state, cmd(CommandType::ToggleDetail));
    accept(state, details[0]);
    apply(state, done(details[0]));
    apply(state, cmd(CommandType::CloseOverlay));
    EXPECT(state.detail_cache.count("Foo") == 1, "details cached");

    Effects effects = apply(state, cmd(CommandType::Uninstall));
    EXPECT(effects.size() == 1, "uninstall requested");
    accept(state, effects[0]);

    OperationResult failed = done(effects[0]);
    failed.error = {BackendErrorKind::NonZeroExit,
                    "winget failed: No installed package found matching input criteria."};
    Effects refresh = apply(state, failed);

    const Operation& op = state.operations[effects[0].key];
    EXPECT(op.status == OperationStatus::Failed, "uninstall failed");
    EXPECT(op.message == failed.error.message, "failure message attached");
    EXPECT(state.status.find("failed") != std::string::npos, "failure shown");
    EXPECT(state.status.find("done") == std::string::npos, "not reported as done");
    EXPECT(state.detail_cache.count("Foo") == 0, "cached details dropped");

    bool installed_refresh = false;
    for (const auto& r : refresh) {
        if (r.view == View::Installed && r.key.kind == OperationKind::Refresh) installed_refresh = true;
    }
    EXPECT(installed_refresh, "installed list refreshed after failure");
    EXPECT(state.current().packages.size() == 2, "list kept until the refresh lands");
    return 0;
}

static int test_submit_search_moves_detail_overlay(void)
{
    AppState state = installed_state({make_package("Foo")});

    Effects details = apply(state, cmd(CommandType::ToggleDetail));
    accept(state, details[0]);
    apply(state, done(details[0]));
    auto* overlay = std::get_if<DetailOverlay>(&state.overlay);
    EXPECT(overlay != nullptr && overlay->package_id == "Foo", "details for Foo");

    state.query = "vim";
    Effects search = apply(state, cmd(CommandType::SubmitSearch));
    EXPECT(state.view == View::Search, "search view active");
    EXPECT(search.size() == 1 && search[0].key.kind == OperationKind::Search, "one search request");
    EXPECT(state.status.find("Searching") != std::string::npos, "search progress shown");

    overlay = std::get_if<DetailOverlay>(&state.overlay);
    EXPECT(overlay != nullptr, "detail overlay still open");
    EXPECT(overlay->package_id.empty(), "no stale package from the installed view");

    accept(state, search[0]);
    Effects follow = apply(state, list_result(search[0], {make_package("vim.vim")}));
    EXPECT(follow.size() == 1 && follow[0].key.kind == OperationKind::Details, "details follow results");
    EXPECT(follow[0].key.package_id == "vim.vim", "details for the first result");
    return 0;
}

int main(void)
{
    if (test_start_loads_installed() != 0) return 1;
    if (test_navigation_is_deterministic() != 0) return 1;
    if (test_navigation_bounds() != 0) return 1;
    if (test_cursor_clamps_on_replace() != 0) return 1;
    if (test_uninstall_refreshes_installed() != 0) return 1;
    if (test_duplicate_upgrade_rejected() != 0) return 1;
    if (test_stale_result_discarded() != 0) return 1;
    if (test_later_search_wins() != 0) return 1;
    if (test_filter_cycle_without_backend() != 0) return 1;
    if (test_filter_keeps_selected_package() != 0) return 1;
    if (test_failed_refresh_keeps_list() != 0) return 1;
    if (test_detail_overlay_uses_cache() != 0) return 1;
    if (test_overlays_are_exclusive() != 0) return 1;
    if (test_dispatch_rejection_drops_operation() != 0) return 1;
    if (test_clear_finished() != 0) return 1;
    if (test_view_switch_fetches_once() != 0) return 1;
    if (test_search_editing() != 0) return 1;
    if (test_failed_action_recorded() != 0) return 1;
    if (test_submit_search_moves_detail_overlay() != 0) return 1;
    return 0;
}
