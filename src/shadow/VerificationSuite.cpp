#include "shadow/VerificationSuite.hpp"
#include "utils/SubProcess.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace autopatch {

CommandVerificationSuite::CommandVerificationSuite(std::string command,
                                                   std::chrono::seconds timeout,
                                                   std::vector<std::string> fail_markers)
    : command_(std::move(command)), timeout_(timeout), fail_markers_(std::move(fail_markers)) {}

bool CommandVerificationSuite::has_fail_marker(const std::string& output, const std::vector<std::string>& markers) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        std::string upper = line.substr(first);
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
        for (auto m : markers) {
            std::transform(m.begin(), m.end(), m.begin(), [](unsigned char c) { return std::toupper(c); });
            if (!m.empty() && upper.rfind(m, 0) == 0) return true;
        }
    }
    return false;
}

VerificationOutcome CommandVerificationSuite::run(const fs::path& shadow_root, const CancellationToken& cancel) {
    if (command_.empty()) {
        return {false, "No verification command configured", false};
    }

    ProcessOptions opts;
    opts.working_dir = shadow_root;
    opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
    opts.cancel = &cancel;

    spdlog::info("🧪 Verification: `{}` in {}", command_, shadow_root.string());
    ProcessResult res = SubProcess::run(command_, opts);

    VerificationOutcome out;
    out.timed_out = res.timed_out;
    out.report = "Exit Code: " + std::to_string(res.exit_code) + "\nOUTPUT:\n" + res.output;

    if (res.timed_out) {
        out.report = "Verification timed out after " + std::to_string(timeout_.count()) + "s\n" + out.report;
        return out;
    }
    if (res.cancelled) {
        out.report = "Verification cancelled\n" + out.report;
        return out;
    }
    if (!res.success) return out;

    if (has_fail_marker(res.output, fail_markers_)) {
        out.report = "Exit code 0 but failure markers found in output\n" + out.report;
        return out;
    }
    out.passed = true;
    return out;
}

}
