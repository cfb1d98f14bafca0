#include "log.hpp"
#include <ctime>
#include <fstream>
#include <mutex>

namespace pkgdash {

namespace {

struct LogState {
    std::mutex mutex;
    std::ofstream file;
};

// Never destroyed: detached workers may still log while static objects are
// torn down at exit
LogState& log_state() {
    static LogState* state = new LogState;
    return *state;
}

std::string timestamp_now() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

void log_common(const char* level, const std::string& msg) {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.file.is_open()) return;
    state.file << "[" << timestamp_now() << "][" << level << "] " << msg << '\n';
    state.file.flush();
}

} // anonymous namespace

bool log_open(const std::string& path) {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.file.is_open()) {
        state.file.close();
    }
    state.file.open(path, std::ios::out | std::ios::app);
    return state.file.is_open();
}

void log_close() {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.file.is_open()) {
        state.file.close();
    }
}

void log_info(const std::string& msg) {
    log_common("INFO", msg);
}

void log_warn(const std::string& msg) {
    log_common("WARN", msg);
}

void log_error(const std::string& msg) {
    log_common("ERROR", msg);
}

} // namespace pkgdash
