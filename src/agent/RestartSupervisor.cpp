#include "agent/RestartSupervisor.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace autopatch {

void ExecLauncher::launch() {
    if (argv_.empty()) throw std::runtime_error("exec restart: empty argv");

    std::vector<char*> args;
    for (auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    spdlog::critical("♻️ Re-executing /proc/self/exe");
    spdlog::default_logger()->flush();
    ::execv("/proc/self/exe", args.data());
    throw std::runtime_error(std::string("execv failed: ") + std::strerror(errno));
}

void ExitLauncher::launch() {
    spdlog::critical("♻️ Exiting with code {} for the supervisor to restart us", exit_code_);
    spdlog::default_logger()->flush();
    std::exit(exit_code_);
}

RestartSupervisor::RestartSupervisor(std::unique_ptr<IProcessLauncher> launcher)
    : launcher_(std::move(launcher)) {
    if (!launcher_) throw std::invalid_argument("RestartSupervisor needs a launcher");
}

void RestartSupervisor::add_drain_hook(const std::string& name, std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mtx_);
    hooks_.emplace_back(name, std::move(hook));
}

RestartOutcome RestartSupervisor::request_restart(bool confirm) {
    if (!confirm) {
        spdlog::info("🔒 Restart not confirmed, ignoring request");
        return {false, "Restart not confirmed; nothing done"};
    }
    std::lock_guard<std::mutex> lock(mtx_);
    if (pending_ || performing_) {
        spdlog::warn("⚠️ Restart already pending, refusing a second request");
        return {false, "A restart is already pending"};
    }
    pending_ = true;
    cv_.notify_all();
    spdlog::warn("♻️ Restart requested ({} launcher)", launcher_->name());
    return {true, "Restart scheduled"};
}

bool RestartSupervisor::is_pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_;
}

bool RestartSupervisor::wait_for_request(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout, [this] { return pending_ || shutdown_; });
    return pending_;
}

void RestartSupervisor::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    shutdown_ = true;
    cv_.notify_all();
}

void RestartSupervisor::perform() {
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!pending_) throw std::runtime_error("No restart pending");
        if (performing_) throw std::runtime_error("Restart already in progress");
        performing_ = true;
        hooks = hooks_;
    }

    // Phase 1: drain
    for (const auto& [name, hook] : hooks) {
        spdlog::info("🚰 Draining: {}", name);
        try {
            hook();
        } catch (const std::exception& e) {
            spdlog::error("💥 Drain hook '{}' failed: {}", name, e.what());
        }
    }

    // Phase 2: hand-off
    try {
        launcher_->launch();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Restart hand-off failed: {}", e.what());
        std::lock_guard<std::mutex> lock(mtx_);
        pending_ = false;
        performing_ = false;
        throw;
    }

    // Only reached with launchers that return (tests).
    std::lock_guard<std::mutex> lock(mtx_);
    pending_ = false;
    performing_ = false;
}

void RestartSupervisor::interrupt() noexcept {
    interrupted_.store(true);
}

int RestartSupervisor::serve(const std::function<bool()>& serve_fn, const std::function<void()>& stop) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        served_ = false;
    }
    // Polled so interrupt() needs no lock.
    std::thread watcher([this, &stop]() {
        std::unique_lock<std::mutex> lock(mtx_);
        while (!pending_) {
            if (served_ || shutdown_ || interrupted_.load()) return;
            cv_.wait_for(lock, std::chrono::milliseconds(200));
        }
        lock.unlock();
        spdlog::info("🚰 Restart pending, stopping the server");
        stop();
    });

    bool ok = false;
    try {
        ok = serve_fn();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Server loop failed: {}", e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        served_ = true;
        cv_.notify_all();
    }
    watcher.join();

    if (interrupted_.load()) {
        if (is_pending()) spdlog::warn("🛑 Interrupted, pending restart dropped");
        return ok ? 0 : 1;
    }
    if (!is_pending()) return ok ? 0 : 1;

    try {
        perform();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Restart failed: {}", e.what());
        return 1;
    }
    return 0;
}

}
