#pragma once
#include <string>
#include <filesystem>

namespace autopatch {

namespace fs = std::filesystem;

// Reads the whole file as raw bytes. Throws std::runtime_error on failure.
std::string read_file_bytes(const fs::path& path);

// Writes `data` to a sibling temp file, fsyncs it and renames it over
// `target`, so readers observe either the old or the new content.
// Throws std::runtime_error on failure; the temp file never survives.
void write_file_atomic(const fs::path& target, const std::string& data);

std::string sha256_hex(const std::string& data);

long long now_ms();

// UTC timestamp usable in file names, e.g. 20261018T223600123Z
std::string utc_stamp();

}
