#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace tollgate {

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// True if text is well-formed UTF-8 (no overlongs, surrogates or
// code points past U+10FFFF)
bool is_valid_utf8(const std::string& text);

// Lowercase hex SHA-256 digest of the input bytes
std::string sha256_hex(const std::string& data);

// Round-trippable decimal form of a double (17 significant digits)
std::string format_double(double value);

// Parse a double; nullopt if the text is not entirely a number
std::optional<double> parse_double(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path.tmp then rename over path. Creates parent directories.
// Returns false if the temp file cannot be written or the rename fails.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

} // namespace tollgate
