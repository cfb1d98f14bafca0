#pragma once

#include "package.hpp"
#include <string>

namespace pkgdash {

std::string to_lower(const std::string& str);
std::string trim(const std::string& str);

// Shorten to max_len display columns, ending in "..."
std::string truncate(const std::string& str, size_t max_len);

// Number of terminal columns a UTF-8 string occupies (one per code point)
size_t display_width(const std::string& str);

// Pad with spaces (or truncate) to exactly width display columns
std::string fit_width(const std::string& str, size_t width);

// Sort packages by relevance to query
// Priority: exact match > starts with > contains in name > alphabetical
void sort_by_relevance(PackageList& packages, const std::string& query);

} // namespace pkgdash
