#ifndef primus_CORE_UTILS_HPP
#define primus_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace primus {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on runs of whitespace, dropping empty pieces
std::vector<std::string> split_words(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Random / encoding utilities ============

// Generate a random UUID v4 (OpenSSL RAND_bytes)
std::string generate_uuid();

// Cryptographically random bytes; empty string on RNG failure
std::string random_bytes(size_t count);

std::string to_hex(const std::string& bytes);
bool from_hex(const std::string& hex, std::string& out);

std::string base64_encode(const std::string& bytes);
bool base64_decode(const std::string& text, std::string& out);

} // namespace primus

#endif // primus_CORE_UTILS_HPP
