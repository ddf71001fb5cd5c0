#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase hex of a byte range.
std::string hex_encode(const uint8_t* data, size_t len);
inline std::string hex_encode(const std::vector<uint8_t>& bytes) {
    return hex_encode(bytes.data(), bytes.size());
}

// Returns false on odd length or non-hex characters.
bool hex_decode(const std::string& hex, std::vector<uint8_t>& out);

// Normalize line endings to \n and trim surrounding whitespace.
std::string normalize_newlines(const std::string& s);

// True when the text carries both PEM/OpenSSH armor lines.
bool has_pem_markers(const std::string& key);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
