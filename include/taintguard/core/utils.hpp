#ifndef taintguard_CORE_UTILS_HPP
#define taintguard_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace taintguard {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert ASCII letters to lowercase
std::string to_lower(const std::string& s);

// Convert ASCII letters to uppercase
std::string to_upper(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Random / ID utilities ============

// Generate a random UUID v4 (OpenSSL RAND_bytes)
std::string generate_uuid();

// Fill `out` with `count` cryptographically random bytes. Returns false if
// the OpenSSL generator is not seeded.
bool random_bytes(unsigned char* out, size_t count);

// `count` random bytes rendered as lowercase hex (2 * count characters)
std::string random_hex(size_t count);

// ============ Hashing utilities ============

// SHA-256 of `data`, lowercase hex
std::string sha256_hex(const std::string& data);

// Lowercase hex rendering of arbitrary bytes
std::string to_hex(const unsigned char* data, size_t len);

} // namespace taintguard

#endif // taintguard_CORE_UTILS_HPP
