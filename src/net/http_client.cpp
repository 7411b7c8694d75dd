#include "http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace mcp_remote::net {

namespace {

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  for (const auto& [key, value] : headers) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // Simple regex-based URL parser
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s\?#]+)(?::(\d+))?(\/[^\?#\s]*)?(\?[^#\s]*)?(#\S*)?$)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::optional<std::string> decode_chunked_body(const std::string& body) {
  std::string out;
  size_t pos = 0;

  while (pos < body.size()) {
    size_t line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) return std::nullopt;

    // Chunk extensions (";name=value") are ignored
    std::string size_str = body.substr(pos, line_end - pos);
    auto semi = size_str.find(';');
    if (semi != std::string::npos) size_str.erase(semi);

    size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(size_str, nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (chunk_size == 0) {
      return out;
    }
    if (pos + chunk_size > body.size()) return std::nullopt;

    out.append(body, pos, chunk_size);
    pos += chunk_size + 2;  // skip trailing CRLF
  }

  return std::nullopt;
}

bool framed_body_complete(const HttpResponse& response) {
  auto encoding = response.header("Transfer-Encoding");
  if (encoding && encoding->find("chunked") != std::string::npos) {
    return decode_chunked_body(response.body).has_value();
  }

  auto content_length = response.header("Content-Length");
  if (!content_length) {
    return false;
  }
  try {
    return response.body.size() >= std::stoull(*content_length);
  } catch (const std::exception&) {
    // Invalid Content-Length, read until close
    return false;
  }
}

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client), resolver_(io_ctx) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL: " + url});
      return;
    }

    if (parsed->is_https()) {
      request_https(*parsed, options, std::move(callback));
    } else {
      request_http(*parsed, options, std::move(callback));
    }
  }

 private:
  // Helper: close the lowest-layer socket, ignoring errors
  template <typename Socket>
  static void close_socket(std::shared_ptr<Socket> socket) {
    asio::error_code ignored;
    socket->lowest_layer().close(ignored);
  }

  static void close_socket(std::shared_ptr<asio::ip::tcp::socket> socket) {
    asio::error_code ignored;
    socket->close(ignored);
  }

  // Start a timeout timer. When it fires, set the timed_out flag and close the socket.
  template <typename Socket>
  static std::shared_ptr<asio::steady_timer> start_timeout(asio::io_context& io_ctx, std::chrono::seconds timeout, std::shared_ptr<Socket> socket,
                                                           std::shared_ptr<bool> timed_out) {
    auto timer = std::make_shared<asio::steady_timer>(io_ctx);
    timer->expires_after(timeout);
    timer->async_wait([socket, timed_out, timer](const asio::error_code& ec) {
      if (!ec) {
        // Timer fired (not cancelled): mark as timed out and close socket
        *timed_out = true;
        close_socket(socket);
      }
    });
    return timer;
  }

  // Wrap callback to cancel timer and check timeout
  static std::function<void(HttpResponse)> guard_callback(std::shared_ptr<asio::steady_timer> timer, std::shared_ptr<bool> timed_out,
                                                          std::function<void(HttpResponse)> callback) {
    return [timer, timed_out, callback = std::move(callback)](HttpResponse resp) {
      timer->cancel();
      if (*timed_out) {
        resp.error = "Request timed out";
        resp.status_code = 0;
      }
      callback(std::move(resp));
    };
  }

  static std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
    std::ostringstream req;
    req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
    req << "Host: " << url.host;
    if (!url.port.empty()) {
      req << ":" << url.port;
    }
    req << "\r\n";
    req << "Connection: close\r\n";

    bool has_user_agent = false;
    for (const auto& [key, value] : options.headers) {
      req << key << ": " << value << "\r\n";
      if (iequals(key, "User-Agent")) has_user_agent = true;
    }
    if (!has_user_agent) {
      req << "User-Agent: mcp-remote\r\n";
    }

    if (!options.body.empty() || options.method == "POST" || options.method == "PUT") {
      req << "Content-Length: " << options.body.size() << "\r\n";
    }

    req << "\r\n";
    req << options.body;
    return req.str();
  }

  void request_https(const ParsedUrl& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto timed_out = std::make_shared<bool>(false);

    auto timer = start_timeout(io_ctx_, options.timeout, socket, timed_out);
    auto guarded_callback = guard_callback(timer, timed_out, std::move(callback));

    // Set SNI hostname
    SSL_set_tlsext_host_name(socket->native_handle(), url.host.c_str());
    socket->set_verify_callback(asio::ssl::host_name_verification(url.host));

    // Resolve and connect
    resolver_.async_resolve(
        url.host, url.port_or_default(),
        [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
          if (ec) {
            response->error = "DNS resolution failed: " + ec.message();
            guarded_callback(*response);
            return;
          }

          asio::async_connect(
              socket->lowest_layer(), results,
              [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                if (ec) {
                  response->error = "Connection failed: " + ec.message();
                  guarded_callback(*response);
                  return;
                }

                // SSL handshake
                socket->async_handshake(asio::ssl::stream_base::client,
                                        [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec) {
                                          if (ec) {
                                            response->error = "SSL handshake failed: " + ec.message();
                                            guarded_callback(*response);
                                            return;
                                          }

                                          send_request(socket, request_str, response, buffer, guarded_callback);
                                        });
              });
        });
  }

  void request_http(const ParsedUrl& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto timed_out = std::make_shared<bool>(false);

    auto timer = start_timeout(io_ctx_, options.timeout, socket, timed_out);
    auto guarded_callback = guard_callback(timer, timed_out, std::move(callback));

    resolver_.async_resolve(
        url.host, url.port_or_default(),
        [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
          if (ec) {
            response->error = "DNS resolution failed: " + ec.message();
            guarded_callback(*response);
            return;
          }

          asio::async_connect(*socket, results,
                              [this, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                                if (ec) {
                                  response->error = "Connection failed: " + ec.message();
                                  guarded_callback(*response);
                                  return;
                                }

                                send_request(socket, request_str, response, buffer, guarded_callback);
                              });
        });
  }

  template <typename Socket>
  void send_request(std::shared_ptr<Socket> socket, std::shared_ptr<std::string> request_str, std::shared_ptr<HttpResponse> response,
                    std::shared_ptr<asio::streambuf> buffer, std::function<void(HttpResponse)> callback) {
    asio::async_write(*socket, asio::buffer(*request_str), [this, socket, request_str, response, buffer, callback](const asio::error_code& ec, size_t) {
      if (ec) {
        response->error = "Write failed: " + ec.message();
        callback(*response);
        return;
      }

      read_response(socket, response, buffer, callback);
    });
  }

  template <typename Socket>
  void read_response(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                     std::function<void(HttpResponse)> callback) {
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      if (ec && ec != asio::error::eof) {
        response->error = "Read headers failed: " + ec.message();
        callback(*response);
        return;
      }

      // Parse status line and headers
      std::istream stream(buffer.get());
      std::string status_line;
      std::getline(stream, status_line);

      std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
      std::smatch match;
      if (!std::regex_search(status_line, match, status_regex)) {
        response->error = "Invalid HTTP response: " + status_line;
        callback(*response);
        return;
      }
      try {
        response->status_code = std::stoi(match[1].str());
      } catch (const std::exception&) {
        response->error = "Invalid HTTP response: cannot parse status code";
        callback(*response);
        return;
      }

      std::string header_line;
      while (std::getline(stream, header_line) && header_line != "\r") {
        auto colon = header_line.find(':');
        if (colon != std::string::npos) {
          std::string key = header_line.substr(0, colon);
          std::string value = header_line.substr(colon + 1);
          // Trim whitespace
          value.erase(0, value.find_first_not_of(" \t"));
          value.erase(value.find_last_not_of(" \t\r\n") + 1);
          response->headers[key] = value;
        }
      }

      read_body(socket, response, buffer, callback);
    });
  }

  static void finish(std::shared_ptr<HttpResponse> response, const std::function<void(HttpResponse)>& callback) {
    auto encoding = response->header("Transfer-Encoding");
    if (encoding && encoding->find("chunked") != std::string::npos) {
      auto decoded = decode_chunked_body(response->body);
      if (decoded) {
        response->body = std::move(*decoded);
      } else {
        spdlog::warn("[Http] Malformed chunked body ({} bytes)", response->body.size());
      }
    }
    callback(*response);
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                 std::function<void(HttpResponse)> callback) {
    // First, add any remaining data in buffer to body
    if (buffer->size() > 0) {
      std::istream stream(buffer.get());
      std::ostringstream body;
      body << stream.rdbuf();
      response->body += body.str();
    }

    if (framed_body_complete(*response)) {
      finish(response, callback);
      return;
    }

    // Continue reading until EOF or we have all data
    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [this, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      // TLS peers often close without close_notify
      bool truncated = ec == asio::ssl::error::stream_truncated;
      bool is_eof = ec == asio::error::eof || truncated;
      if (ec && !is_eof) {
        response->error = "Read body failed: " + ec.message();
        callback(*response);
        return;
      }

      if (is_eof) {
        if (buffer->size() > 0) {
          std::istream stream(buffer.get());
          std::ostringstream more;
          more << stream.rdbuf();
          response->body += more.str();
        }
        // Without close_notify only an explicitly framed body is known to be whole
        if (truncated && !framed_body_complete(*response)) {
          response->error = "Read body failed: " + ec.message();
          callback(*response);
          return;
        }
        finish(response, callback);
        return;
      }

      read_body(socket, response, buffer, callback);
    });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
  asio::ip::tcp::resolver resolver_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();
  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });
  return future;
}

std::future<HttpResponse> HttpRequester::get(const std::string& url, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpRequester::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

}  // namespace mcp_remote::net
