#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace pkgdash {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

size_t display_width(const std::string& str) {
    size_t width = 0;
    for (unsigned char c : str) {
        if (!is_continuation_byte(c)) {
            ++width;
        }
    }
    return width;
}

std::string truncate(const std::string& str, size_t max_len) {
    if (display_width(str) <= max_len) {
        return str;
    }
    if (max_len <= 3) {
        return std::string(max_len, '.');
    }

    // Cut on a code point boundary
    std::string result;
    size_t width = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (!is_continuation_byte(c)) {
            if (width == max_len - 3) break;
            ++width;
        }
        result += str[i];
    }
    return result + "...";
}

std::string fit_width(const std::string& str, size_t width) {
    std::string result = truncate(str, width);
    size_t used = display_width(result);
    if (used < width) {
        result.append(width - used, ' ');
    }
    return result;
}

void sort_by_relevance(PackageList& packages, const std::string& query) {
    std::string query_lower = to_lower(query);

    std::stable_sort(packages.begin(), packages.end(),
        [&query_lower](const Package& a, const Package& b) {
            std::string a_lower = to_lower(a.name);
            std::string b_lower = to_lower(b.name);

            // Exact match gets highest priority
            bool a_exact = (a_lower == query_lower);
            bool b_exact = (b_lower == query_lower);
            if (a_exact != b_exact) return a_exact > b_exact;

            // Starts with query gets next priority
            bool a_starts = (a_lower.find(query_lower) == 0);
            bool b_starts = (b_lower.find(query_lower) == 0);
            if (a_starts != b_starts) return a_starts > b_starts;

            // Contains in name (shorter names preferred)
            bool a_contains = (a_lower.find(query_lower) != std::string::npos);
            bool b_contains = (b_lower.find(query_lower) != std::string::npos);
            if (a_contains != b_contains) return a_contains > b_contains;

            if (a_contains && b_contains && a.name.length() != b.name.length()) {
                return a.name.length() < b.name.length();
            }

            // Fallback to alphabetical
            return a_lower < b_lower;
        });
}

} // namespace pkgdash
