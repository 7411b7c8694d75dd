#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mcp_remote::net {

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& value);

// Decode %XX escapes; '+' becomes a space (form/query encoding)
std::string url_decode(const std::string& value);

// Build "k1=v1&k2=v2" with both sides encoded, in the given order
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

// Build form-urlencoded body
std::string build_form_body(const std::map<std::string, std::string>& params);

// Parse "a=1&b=2" (no leading '?'). Later duplicates overwrite earlier ones.
std::map<std::string, std::string> parse_query(const std::string& query);

// Append query parameters to a URL that may already carry a query string
std::string append_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params);

// Strip trailing '/' characters
std::string trim_trailing_slashes(const std::string& url);

}  // namespace mcp_remote::net
