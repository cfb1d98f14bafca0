#include "state.hpp"

namespace pkgdash {

void refilter(ViewState& list, SourceFilter filter) {
    const Package* selected = nullptr;
    if (list.cursor && *list.cursor < list.visible.size()) {
        selected = &list.packages[list.visible[*list.cursor]];
    }

    list.visible.clear();
    std::optional<size_t> kept;
    for (size_t i = 0; i < list.packages.size(); ++i) {
        if (!matches(filter, list.packages[i].source)) continue;
        if (selected != nullptr && &list.packages[i] == selected) {
            kept = list.visible.size();
        }
        list.visible.push_back(i);
    }

    if (list.visible.empty()) {
        list.cursor.reset();
    } else if (kept) {
        list.cursor = kept;
    } else if (!list.cursor) {
        list.cursor = 0;
    } else if (*list.cursor >= list.visible.size()) {
        list.cursor = list.visible.size() - 1;
    }
}

void replace_list(ViewState& list, PackageList packages, SourceFilter filter) {
    list.packages = std::move(packages);
    list.loaded = true;

    list.visible.clear();
    for (size_t i = 0; i < list.packages.size(); ++i) {
        if (matches(filter, list.packages[i].source)) {
            list.visible.push_back(i);
        }
    }

    if (list.visible.empty()) {
        list.cursor.reset();
    } else if (!list.cursor) {
        list.cursor = 0;
    } else if (*list.cursor >= list.visible.size()) {
        list.cursor = list.visible.size() - 1;
    }
}

const Package* visible_at(const ViewState& list, size_t index) {
    if (index >= list.visible.size()) {
        return nullptr;
    }
    return &list.packages[list.visible[index]];
}

const Package* selected_package(const AppState& state) {
    const ViewState& list = state.current();
    if (!list.cursor) {
        return nullptr;
    }
    return visible_at(list, *list.cursor);
}

const Operation* latest_operation(const AppState& state, const std::string& package_id) {
    const Operation* latest = nullptr;
    auto it = state.operations.lower_bound(OperationKey{package_id, OperationKind::Install});
    for (; it != state.operations.end() && it->first.package_id == package_id; ++it) {
        if (latest == nullptr || it->second.sequence > latest->sequence) {
            latest = &it->second;
        }
    }
    return latest;
}

bool has_active_operation(const AppState& state) {
    for (const auto& [key, op] : state.operations) {
        if (op.is_active()) return true;
    }
    return false;
}

} // namespace pkgdash
