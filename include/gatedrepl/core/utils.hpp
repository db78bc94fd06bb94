#ifndef gatedrepl_CORE_UTILS_HPP
#define gatedrepl_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace gatedrepl {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for measuring elapsed time)
int64_t monotonic_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter (keeps empty parts, "a\n" -> {"a", ""})
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Truncate and append "... [truncated, N chars omitted]" when over max_len
std::string truncate_with_marker(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Create a directory and all missing parents
bool create_directories(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Remove a directory tree. Missing paths count as success.
bool remove_directory_recursive(const std::string& path);

// Whole-file helpers
bool write_file(const std::string& path, const std::string& content);
bool read_file(const std::string& path, std::string& out);
bool file_exists(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Hex-encoded SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace gatedrepl

#endif // gatedrepl_CORE_UTILS_HPP
