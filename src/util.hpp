#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace lunacore {

// Unix epoch seconds with microsecond resolution (row creation times)
double epoch_seconds_precise();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns false if the file cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace lunacore
