#pragma once
#include <string>
#include <vector>
#include "pipeline/ChangeTypes.hpp"

namespace autopatch {

std::vector<std::string> split_lines(const std::string& text);

// Line-level summary of old -> new. Uses an LCS table for inputs up to
// kExactDiffLimit lines per side and a line multiset count above that.
// `preview_limit` caps the number of "+"/"-" lines kept in the preview.
DiffStats summarize_diff(const std::string& before, const std::string& after, size_t preview_limit = 20);

constexpr size_t kExactDiffLimit = 2000;

}
