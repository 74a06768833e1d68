#include "utils/DiffSummary.hpp"
#include "utils/Scrubber.hpp"
#include <algorithm>
#include <unordered_map>

namespace autopatch {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

namespace {

constexpr size_t kPreviewLineBytes = 240;

// Preview lines end up in run JSON, so they are scrubbed like suite output.
void push_preview(DiffStats& stats, char sign, const std::string& line, size_t limit) {
    if (stats.preview.size() < limit) {
        stats.preview.push_back(std::string(1, sign) + scrub_report(line, kPreviewLineBytes));
    }
}

DiffStats approximate(const std::vector<std::string>& a, const std::vector<std::string>& b, size_t limit) {
    DiffStats stats;
    std::unordered_map<std::string, long> counts;
    for (const auto& l : a) counts[l]++;
    for (const auto& l : b) {
        auto it = counts.find(l);
        if (it != counts.end() && it->second > 0) {
            it->second--;
            stats.unchanged++;
        } else {
            stats.added++;
            push_preview(stats, '+', l, limit);
        }
    }
    stats.removed = a.size() - stats.unchanged;
    return stats;
}

}

DiffStats summarize_diff(const std::string& before, const std::string& after, size_t preview_limit) {
    auto a = split_lines(before);
    auto b = split_lines(after);
    if (a.size() > kExactDiffLimit || b.size() > kExactDiffLimit) {
        return approximate(a, b, preview_limit);
    }

    // lcs[i][j] = LCS length of a[i..] and b[j..]
    std::vector<std::vector<unsigned>> lcs(a.size() + 1, std::vector<unsigned>(b.size() + 1, 0));
    for (size_t i = a.size(); i-- > 0;) {
        for (size_t j = b.size(); j-- > 0;) {
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    DiffStats stats;
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) {
            stats.unchanged++;
            i++;
            j++;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            stats.removed++;
            push_preview(stats, '-', a[i++], preview_limit);
        } else {
            stats.added++;
            push_preview(stats, '+', b[j++], preview_limit);
        }
    }
    for (; i < a.size(); ++i) {
        stats.removed++;
        push_preview(stats, '-', a[i], preview_limit);
    }
    for (; j < b.size(); ++j) {
        stats.added++;
        push_preview(stats, '+', b[j], preview_limit);
    }
    return stats;
}

}
