#pragma once

#include <string>

namespace pkgdash {

// The terminal belongs to the UI, so log lines go to a file.
// Until log_open succeeds every log call is a no-op.
bool log_open(const std::string& path);
void log_close();

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace pkgdash
