#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// String utilities
std::vector<std::string> split_whitespace(const std::string& str);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Lower-case, trim and collapse runs of whitespace into a single space
std::string normalize_text(const std::string& str);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

// Hex-encoded SHA-256 digest
std::string sha256_hex(const std::string& data);

// Random utilities
std::string generate_uuid();

} // namespace util
