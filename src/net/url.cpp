#include "net/url.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace mcp_remote::net {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string url_encode(const std::string& value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (char c : value) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << std::uppercase;
      escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
      escaped << std::nouppercase;
    }
  }

  return escaped.str();
}

std::string url_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());

  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if (hi < 0 || lo < 0) {
        out += c;
        continue;
      }
      out += static_cast<char>((hi << 4) | lo);
      i += 2;
    } else {
      out += c;
    }
  }

  return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::ostringstream query;
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) query << "&";
    query << url_encode(key) << "=" << url_encode(value);
    first = false;
  }
  return query.str();
}

std::string build_form_body(const std::map<std::string, std::string>& params) {
  return build_query({params.begin(), params.end()});
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> params;

  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) end = query.size();

    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[url_decode(pair)] = "";
      } else {
        params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }

  return params;
}

std::string append_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params) {
  if (params.empty()) {
    return url;
  }

  std::string base = url;
  std::string fragment;
  auto hash = base.find('#');
  if (hash != std::string::npos) {
    fragment = base.substr(hash);
    base.erase(hash);
  }

  char sep = '?';
  if (base.find('?') != std::string::npos) {
    sep = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
  }

  std::string result = base;
  if (sep != '\0') result += sep;
  result += build_query(params);
  return result + fragment;
}

std::string trim_trailing_slashes(const std::string& url) {
  auto end = url.find_last_not_of('/');
  if (end == std::string::npos) {
    return "";
  }
  return url.substr(0, end + 1);
}

}  // namespace mcp_remote::net
