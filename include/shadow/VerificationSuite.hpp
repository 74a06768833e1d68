#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <filesystem>
#include "utils/CancellationToken.hpp"

namespace autopatch {

namespace fs = std::filesystem;

struct VerificationOutcome {
    bool passed = false;
    std::string report;
    bool timed_out = false;
};

// External collaborator that checks an isolated tree. It only ever sees the
// shadow root, never the real tree.
class IVerificationSuite {
public:
    virtual ~IVerificationSuite() = default;
    virtual std::string name() const = 0;
    virtual VerificationOutcome run(const fs::path& shadow_root, const CancellationToken& cancel) = 0;
};

// Runs a shell command (test runner, build, linter) inside the shadow root.
class CommandVerificationSuite : public IVerificationSuite {
public:
    CommandVerificationSuite(std::string command,
                             std::chrono::seconds timeout,
                             std::vector<std::string> fail_markers = {"ERROR:", "FAILED:", "FAILURE:"});

    std::string name() const override { return "command: " + command_; }
    VerificationOutcome run(const fs::path& shadow_root, const CancellationToken& cancel) override;

    // True when a line of `output` starts with one of the markers.
    static bool has_fail_marker(const std::string& output, const std::vector<std::string>& markers);

private:
    std::string command_;
    std::chrono::seconds timeout_;
    std::vector<std::string> fail_markers_;
};

// In-process check, for embedding callers and tests.
class FunctionVerificationSuite : public IVerificationSuite {
public:
    using Fn = std::function<VerificationOutcome(const fs::path&, const CancellationToken&)>;

    FunctionVerificationSuite(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    VerificationOutcome run(const fs::path& shadow_root, const CancellationToken& cancel) override {
        return fn_(shadow_root, cancel);
    }

private:
    std::string name_;
    Fn fn_;
};

}
