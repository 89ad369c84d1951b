#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sibling path used for write-then-rename: "<path>.tmp.<pid>.<n>"
std::filesystem::path temp_sibling(const std::filesystem::path& path);

// Write `content` to `path` atomically (temp file in the same directory, then rename).
// Throws std::runtime_error on failure.
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
