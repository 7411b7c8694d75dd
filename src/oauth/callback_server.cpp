#include "oauth/callback_server.hpp"

#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <future>
#include <istream>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

#include "net/url.hpp"

namespace mcp_remote::oauth {

namespace {

// Request line plus headers
constexpr size_t kMaxRequestSize = 16 * 1024;

const char* kSuccessRedirectPage = R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>Authorization Successful</title>
  <meta http-equiv="refresh" content="2;url=/success">
  <style>body { font-family: sans-serif; text-align: center; padding: 50px; } .success { color: #28a745; }</style>
</head>
<body>
  <h1 class="success">Authorization Successful</h1>
  <p>Completing authentication...</p>
  <p><small>Redirecting to success page...</small></p>
</body>
</html>
)";

const char* kCompletePage = R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>MCP Remote - Authorization Complete</title>
  <style>body { font-family: sans-serif; text-align: center; padding: 50px; } .success { color: #28a745; }</style>
</head>
<body>
  <h1 class="success">Authorization Complete</h1>
  <p>You can now close this browser window and return to your terminal.</p>
  <hr>
  <p><small>MCP Remote OAuth Callback Server</small></p>
</body>
</html>
)";

std::string error_page(const std::string& error, const std::string& description) {
  std::ostringstream page;
  page << R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>MCP Remote - Authorization Error</title>
  <style>body { font-family: sans-serif; text-align: center; padding: 50px; } .error { color: #dc3545; }</style>
</head>
<body>
  <h1 class="error">Authorization Failed</h1>
  <p><strong>Error:</strong> )"
       << html_escape(error) << R"(</p>
  <p><strong>Description:</strong> )"
       << html_escape(description) << R"(</p>
  <p>Please return to your terminal and try again.</p>
  <hr>
  <p><small>MCP Remote OAuth Callback Server</small></p>
</body>
</html>
)";
  return page.str();
}

std::string http_response(int status, const std::string& reason, const std::string& body) {
  std::ostringstream resp;
  resp << "HTTP/1.1 " << status << " " << reason << "\r\n";
  resp << "Content-Type: text/html; charset=utf-8\r\n";
  resp << "Content-Length: " << body.size() << "\r\n";
  resp << "Cache-Control: no-store\r\n";
  resp << "Connection: close\r\n\r\n";
  resp << body;
  return resp.str();
}

bool bind_acceptor(asio::ip::tcp::acceptor& acceptor, uint16_t port, asio::error_code& ec) {
  asio::ip::tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), port);

  acceptor.open(ep.protocol(), ec);
  if (ec) return false;
  acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (ec) return false;
  acceptor.bind(ep, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    asio::error_code ignored;
    acceptor.close(ignored);
    return false;
  }
  return true;
}

}  // namespace

std::string html_escape(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#x27;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

Result<uint16_t> find_available_port(uint16_t preferred_port) {
  asio::io_context io_ctx;
  asio::ip::tcp::acceptor acceptor(io_ctx);
  asio::error_code ec;

  if (preferred_port != 0 && bind_acceptor(acceptor, preferred_port, ec)) {
    return Result<uint16_t>::success(preferred_port);
  }

  if (!bind_acceptor(acceptor, 0, ec)) {
    return Result<uint16_t>::failure(ErrorKind::CallbackServer, "No free local port: " + ec.message());
  }
  return Result<uint16_t>::success(acceptor.local_endpoint().port());
}

// ============================================================
// CallbackServer::Impl
// ============================================================

class CallbackServer::Impl {
 public:
  explicit Impl(uint16_t preferred_port) : preferred_port_(preferred_port), acceptor_(io_ctx_), future_(promise_.get_future()) {}

  ~Impl() {
    stop();
  }

  Result<uint16_t> start() {
    if (running_) {
      return Result<uint16_t>::success(port_);
    }

    asio::error_code ec;
    bool bound = false;
    if (preferred_port_ != 0) {
      bound = bind_acceptor(acceptor_, preferred_port_, ec);
      if (!bound) {
        spdlog::warn("[Callback] Port {} unavailable ({}), using an OS-assigned port", preferred_port_, ec.message());
      }
    }
    if (!bound && !bind_acceptor(acceptor_, 0, ec)) {
      return Result<uint16_t>::failure(ErrorKind::CallbackServer, "Failed to bind callback listener: " + ec.message());
    }

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    do_accept();

    thread_ = std::thread([this]() {
      io_ctx_.run();
    });

    spdlog::info("[Callback] Listening on 127.0.0.1:{}", port_);
    return Result<uint16_t>::success(port_);
  }

  void stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!running_) {
      return;
    }
    running_ = false;

    io_ctx_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    asio::error_code ignored;
    acceptor_.close(ignored);
    spdlog::debug("[Callback] Listener on port {} stopped", port_);
  }

  Result<AuthorizationResponse> wait(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel) {
    if (!future_.valid()) {
      return Result<AuthorizationResponse>::failure(ErrorKind::CallbackServer, "Callback already consumed");
    }

    const auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::optional<Result<AuthorizationResponse>> outcome;
    while (!outcome) {
      if (future_.wait_for(slice) == std::future_status::ready) {
        outcome = future_.get();
      } else if (cancel && cancel->load()) {
        outcome = Result<AuthorizationResponse>::failure(ErrorKind::Cancelled, "Authorization cancelled");
      } else if (std::chrono::steady_clock::now() >= deadline) {
        outcome = Result<AuthorizationResponse>::failure(
            ErrorKind::AuthTimeout, "No authorization callback within " + std::to_string(timeout.count() / 1000) + " seconds");
      }
    }

    stop();
    return std::move(*outcome);
  }

  uint16_t port() const {
    return port_;
  }

  bool running() const {
    return running_;
  }

 private:
  void deliver(Result<AuthorizationResponse> result) {
    if (delivered_.exchange(true)) {
      spdlog::debug("[Callback] Ignoring callback after first delivery");
      return;
    }
    promise_.set_value(std::move(result));
  }

  void do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
      if (ec) {
        if (ec != asio::error::operation_aborted) {
          spdlog::warn("[Callback] Accept failed: {}", ec.message());
        }
        return;
      }

      handle_connection(std::make_shared<asio::ip::tcp::socket>(std::move(socket)));
      do_accept();
    });
  }

  void handle_connection(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(kMaxRequestSize);
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, buffer](const asio::error_code& ec, size_t) {
      // Request head larger than the buffer
      if (ec == asio::error::not_found) {
        spdlog::warn("[Callback] Request exceeds {} bytes, rejected", kMaxRequestSize);
        send(socket, std::make_shared<Reply>(Reply{http_response(431, "Request Header Fields Too Large", ""), std::nullopt}));
        return;
      }
      if (ec) {
        spdlog::debug("[Callback] Read failed: {}", ec.message());
        return;
      }

      std::istream stream(buffer.get());
      std::string request_line;
      std::getline(stream, request_line);
      if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
      }

      // "GET /callback?code=... HTTP/1.1"
      std::istringstream parts(request_line);
      std::string method;
      std::string target;
      parts >> method >> target;

      // Deliver only after the page is written, so the browser gets it
      // before wait_for_callback() stops the listener
      send(socket, std::make_shared<Reply>(route(method, target)));
    });
  }

  struct Reply {
    std::string response;
    std::optional<Result<AuthorizationResponse>> delivery;
  };

  void send(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<Reply> reply) {
    asio::async_write(*socket, asio::buffer(reply->response), [this, socket, reply](const asio::error_code&, size_t) {
      asio::error_code ignored;
      socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
      socket->close(ignored);
      if (reply->delivery) {
        deliver(std::move(*reply->delivery));
      }
    });
  }

  Reply route(const std::string& method, const std::string& target) {
    auto question = target.find('?');
    std::string path = target.substr(0, question);
    std::string query = question == std::string::npos ? "" : target.substr(question + 1);

    if (method != "GET") {
      return {http_response(405, "Method Not Allowed", ""), std::nullopt};
    }
    if (path == "/success") {
      return {http_response(200, "OK", kCompletePage), std::nullopt};
    }
    if (path != "/callback") {
      return {http_response(404, "Not Found", "Not Found"), std::nullopt};
    }

    auto params = net::parse_query(query);
    spdlog::info("[Callback] Received callback ({} parameters)", params.size());

    auto error = params.find("error");
    if (error != params.end()) {
      auto it = params.find("error_description");
      std::string description = it != params.end() ? it->second : "No description provided";
      spdlog::warn("[Callback] Authorization denied: {} - {}", error->second, description);
      return {http_response(400, "Bad Request", error_page(error->second, description)),
              Result<AuthorizationResponse>::failure(ErrorKind::AuthorizationDenied, error->second + ": " + description)};
    }

    auto code = params.find("code");
    auto state = params.find("state");
    if (code == params.end() || state == params.end()) {
      return {http_response(400, "Bad Request", error_page("invalid_request", "Missing code or state parameter")),
              Result<AuthorizationResponse>::failure(ErrorKind::MissingParameter, "Callback missing code or state parameter")};
    }

    return {http_response(200, "OK", kSuccessRedirectPage), Result<AuthorizationResponse>::success(AuthorizationResponse{code->second, state->second})};
  }

  uint16_t preferred_port_;
  uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<bool> delivered_{false};
  std::mutex stop_mutex_;

  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  std::thread thread_;

  std::promise<Result<AuthorizationResponse>> promise_;
  std::future<Result<AuthorizationResponse>> future_;
};

// ============================================================
// CallbackServer
// ============================================================

CallbackServer::CallbackServer(uint16_t preferred_port) : impl_(std::make_unique<Impl>(preferred_port)) {}

CallbackServer::~CallbackServer() = default;

Result<uint16_t> CallbackServer::start() {
  return impl_->start();
}

uint16_t CallbackServer::port() const {
  return impl_->port();
}

std::string CallbackServer::callback_url(const std::string& host) const {
  return "http://" + host + ":" + std::to_string(impl_->port()) + "/callback";
}

Result<AuthorizationResponse> CallbackServer::wait_for_callback(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel) {
  return impl_->wait(timeout, cancel);
}

void CallbackServer::stop() {
  impl_->stop();
}

bool CallbackServer::is_running() const {
  return impl_->running();
}

}  // namespace mcp_remote::oauth
