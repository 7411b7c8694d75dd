#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcp_remote::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;  // Transport-level failure (status_code == 0)

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  // Case-insensitive header lookup
  std::optional<std::string> header(const std::string& name) const;
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Request/response HTTP capability consumed by the OAuth engine.
// Implementations resolve the future exactly once; transport failures are
// reported through HttpResponse::error with status_code 0.
class HttpRequester {
 public:
  virtual ~HttpRequester() = default;

  virtual std::future<HttpResponse> request(const std::string& url, const HttpOptions& options) = 0;

  // Convenience methods
  std::future<HttpResponse> get(const std::string& url, const std::map<std::string, std::string>& headers = {});

  std::future<HttpResponse> post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers = {});
};

// Async HTTP client using ASIO.
// The io_context must be run by another thread while callers wait on futures.
class HttpClient : public HttpRequester {
 public:
  explicit HttpClient(asio::io_context& io_ctx);

  ~HttpClient() override;

  // Async request with callback
  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback);

  // Async request returning future
  std::future<HttpResponse> request(const std::string& url, const HttpOptions& options) override;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// Decode a "Transfer-Encoding: chunked" body. nullopt if malformed.
std::optional<std::string> decode_chunked_body(const std::string& body);

// True once the received body satisfies its framing: Content-Length bytes
// read, or the chunked terminator seen. Close-delimited bodies never are.
bool framed_body_complete(const HttpResponse& response);

}  // namespace mcp_remote::net
