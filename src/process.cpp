#include "process.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pkgdash {

namespace {

// Exit status the child uses when exec itself fails
constexpr int EXEC_FAILED = 127;

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

} // anonymous namespace

ExecResult exec_command(const std::vector<std::string>& argv, int timeout_seconds) {
    ExecResult result;

    if (argv.empty()) {
        result.spawn_failed = true;
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        result.spawn_failed = true;
        return result;
    }

    // Build the argument vector before forking
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        result.spawn_failed = true;
        return result;
    }

    if (pid == 0) {
        // Child process: no terminal input, output into the pipes
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        execvp(args[0], args.data());
        _exit(EXEC_FAILED);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    std::array<char, 4096> buffer;
    struct pollfd fds[2] = {
        {stdout_pipe[0], POLLIN, 0},
        {stderr_pipe[0], POLLIN, 0},
    };
    int open_fds = 2;

    // Drain both pipes together so a chatty stderr cannot stall the child
    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout_seconds > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        int ready = poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                std::string& target = (i == 0) ? result.stdout_output : result.stderr_output;
                target.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    if (result.timed_out) {
        kill(pid, SIGKILL);
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == EXEC_FAILED && result.stdout_output.empty()) {
            result.spawn_failed = true;
        }
    }

    return result;
}

bool command_exists(const std::string& cmd) {
    // Explicit paths are checked directly
    if (cmd.find('/') != std::string::npos) {
        struct stat st;
        return stat(cmd.c_str(), &st) == 0 && (st.st_mode & S_IXUSR);
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::string path = path_env;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();

        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + cmd;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace pkgdash
