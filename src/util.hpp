#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace mcphost {

// Local wall-clock time, "YYYY-MM-DD HH:MM:SS"
std::string local_time_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// True if s begins with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates the parent directory if needed.
bool atomic_write_file(const std::string& path, const std::string& content);

// ── URL helpers ──────────────────────────────────────────────────

// Percent-decode, treating '+' as space (query string semantics)
std::string url_decode(const std::string& s);

// Parse "a=1&b=2" into decoded key/value pairs. Keys without '=' map to "".
std::map<std::string, std::string> parse_query_string(const std::string& qs);

// base with trailing '/' removed, then path ("https://h/mcp/" + "/sse")
std::string join_url(const std::string& base, const std::string& path);

// Escape &, <, >, " and ' for embedding in an HTML page
std::string html_escape(const std::string& s);

// Keep the first few characters of a credential for display
std::string redact_token(const std::string& token);

} // namespace mcphost
