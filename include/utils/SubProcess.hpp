#pragma once
#include <string>
#include <chrono>
#include <filesystem>
#include "utils/CancellationToken.hpp"

namespace autopatch {

struct ProcessResult {
    std::string output;
    int exit_code;
    bool success;
    bool timed_out = false;
    bool cancelled = false;
};

struct ProcessOptions {
    std::filesystem::path working_dir;                     // empty: inherit
    std::chrono::milliseconds timeout{0};                  // 0: unbounded
    const CancellationToken* cancel = nullptr;
    size_t max_output = 64 * 1024;
};

class SubProcess {
public:
    // Runs `cmd` through /bin/sh with stderr merged into stdout. The child
    // gets its own process group; on timeout or cancellation the whole group
    // is killed. Throws std::runtime_error when the process cannot start.
    static ProcessResult run(const std::string& cmd, const ProcessOptions& options);

    static ProcessResult run(const std::string& cmd) {
        return run(cmd, ProcessOptions{});
    }
};

}
