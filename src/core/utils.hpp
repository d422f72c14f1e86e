#pragma once

#include <string>
#include <ctime>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Safe unsigned 64-bit parse of a decimal prefix: returns fallback on failure.
uint64_t safe_stoull(const std::string& s, uint64_t fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Strip known re-delivery suffixes from an item stem.
//   20251227_173931-174100_rere_0 -> 20251227_173931-174100
std::string normalize_archive_name(const std::string& stem);

// Quote a string for a POSIX shell: abc'd -> 'abc'\''d'
std::string shell_quote(const std::string& s);

// Cut text to max_len characters, appending "..." when shortened.
std::string truncate_text(const std::string& s, std::size_t max_len);

// 1536 -> "1.50KB", 10485760 -> "10.00MB"
std::string format_size(uint64_t bytes);

// Extract a 32-char hex MD5 hash from noisy command output. Empty if none.
std::string parse_md5_from_output(const std::string& output);

// Replace every "{key}" in tmpl with value.
std::string replace_placeholder(std::string tmpl, const std::string& key,
                                const std::string& value);
