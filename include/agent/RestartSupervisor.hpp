#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace autopatch {

// Second phase of a restart: replaces or retires the current process image.
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    virtual std::string name() const = 0;
    // Does not return on success. Throws std::runtime_error on failure.
    virtual void launch() = 0;
};

// Re-executes /proc/self/exe with the original argv.
class ExecLauncher : public IProcessLauncher {
public:
    explicit ExecLauncher(std::vector<std::string> argv) : argv_(std::move(argv)) {}
    std::string name() const override { return "exec"; }
    void launch() override;

private:
    std::vector<std::string> argv_;
};

// Exits with a fixed code so an external supervisor starts a fresh image.
class ExitLauncher : public IProcessLauncher {
public:
    explicit ExitLauncher(int exit_code) : exit_code_(exit_code) {}
    std::string name() const override { return "exit"; }
    void launch() override;

private:
    int exit_code_;
};

struct RestartOutcome {
    bool accepted;
    std::string message;
};

// Two-phase controlled restart. request_restart() only records the request;
// perform() runs the drain hooks in registration order and then hands off to
// the launcher. A request is never retried automatically.
class RestartSupervisor {
public:
    explicit RestartSupervisor(std::unique_ptr<IProcessLauncher> launcher);

    void add_drain_hook(const std::string& name, std::function<void()> hook);

    RestartOutcome request_restart(bool confirm);

    bool is_pending() const;

    // Blocks until a restart is requested, shutdown() is called or the
    // timeout passes. Returns true when a restart is pending.
    bool wait_for_request(std::chrono::milliseconds timeout);

    // Throws std::runtime_error when nothing is pending or the launcher fails.
    void perform();

    void shutdown();

    // Runs `serve_fn` on the calling thread. A restart request calls `stop`,
    // and the drain and hand-off start only once `serve_fn` has returned.
    // Returns the process exit code.
    int serve(const std::function<bool()>& serve_fn, const std::function<void()>& stop);

    // Safe from a signal handler. The next serve() return skips the hand-off.
    void interrupt() noexcept;

private:
    std::unique_ptr<IProcessLauncher> launcher_;
    std::vector<std::pair<std::string, std::function<void()>>> hooks_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool pending_ = false;
    bool performing_ = false;
    bool shutdown_ = false;
    bool served_ = false;
    std::atomic<bool> interrupted_{false};
};

}
