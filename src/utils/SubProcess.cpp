#include "utils/SubProcess.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autopatch {

ProcessResult SubProcess::run(const std::string& cmd, const ProcessOptions& options) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill everything it spawned.
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!options.working_dir.empty() && ::chdir(options.working_dir.c_str()) != 0) {
            _exit(127);
        }
        ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::setpgid(pid, pid);
    ::close(fds[1]);

    ProcessResult result{"", -1, false};
    bool truncated = false;
    auto start = std::chrono::steady_clock::now();
    std::array<char, 4096> buffer;

    auto kill_group = [&]() {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    };

    bool open = true;
    while (open) {
        if (options.cancel && options.cancel->is_cancelled()) {
            result.cancelled = true;
            kill_group();
            break;
        }
        if (options.timeout.count() > 0 &&
            std::chrono::steady_clock::now() - start >= options.timeout) {
            result.timed_out = true;
            kill_group();
            break;
        }

        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, 50);
        if (rc < 0) {
            if (errno == EINTR) continue;
            kill_group();
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
        if (n > 0) {
            if (result.output.size() < options.max_output) {
                result.output.append(buffer.data(), static_cast<size_t>(n));
            } else {
                truncated = true;
            }
        } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
            open = false;
        }
    }
    ::close(fds[0]);

    // Output closed; the child may still be running.
    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) break;
        bool expired = options.timeout.count() > 0 &&
                       std::chrono::steady_clock::now() - start >= options.timeout;
        bool cancelled = options.cancel && options.cancel->is_cancelled();
        if (expired || cancelled) {
            result.timed_out = result.timed_out || expired;
            result.cancelled = result.cancelled || cancelled;
            kill_group();
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }
        ::usleep(20 * 1000);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (truncated || result.output.size() > options.max_output) {
        result.output.resize(std::min(result.output.size(), options.max_output));
        result.output += "\n... [Output Truncated]";
    }

    result.success = !result.timed_out && !result.cancelled && result.exit_code == 0;
    if (result.timed_out) {
        spdlog::warn("⏱️ Command timed out after {} ms: {}", options.timeout.count(), cmd);
    }
    return result;
}

}
