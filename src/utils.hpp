#pragma once
#include <filesystem>
#include <string>

// Modification time as POSIX seconds with the nanosecond part as fraction.
// Throws std::filesystem::filesystem_error if the path cannot be stat'ed.
double file_mtime(const std::filesystem::path& path);

// True when `candidate` is a relative path that stays inside `root` after
// lexical normalization (no absolute paths, no ".." escapes).
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);
