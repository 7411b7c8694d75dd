#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "core/types.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// One-shot local HTTP listener for the OAuth redirect.
//
// Binds 127.0.0.1 and serves on its own io_context thread:
//   GET /callback?code=..&state=..   -> delivers AuthorizationResponse
//   GET /callback?error=..           -> delivers AuthorizationDenied
//   GET /callback (no code/state)    -> delivers MissingParameter
//   GET /success                     -> completion page
// Only the first delivery counts.
class CallbackServer {
 public:
  // preferred_port 0 lets the OS choose
  explicit CallbackServer(uint16_t preferred_port = 0);

  ~CallbackServer();

  CallbackServer(const CallbackServer&) = delete;
  CallbackServer& operator=(const CallbackServer&) = delete;

  // Bind preferred port, falling back to an OS-assigned one.
  // CallbackServer error when nothing can be bound.
  Result<uint16_t> start();

  // Bound port (0 before start)
  uint16_t port() const;

  // http://{host}:{port}/callback
  std::string callback_url(const std::string& host) const;

  // Block until a callback is delivered, the timeout expires (AuthTimeout) or
  // *cancel becomes true (Cancelled). The listener is stopped afterwards in
  // every case.
  Result<AuthorizationResponse> wait_for_callback(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel = nullptr);

  void stop();

  bool is_running() const;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// Preferred port if free on 127.0.0.1, else any free port
Result<uint16_t> find_available_port(uint16_t preferred_port = 0);

std::string html_escape(const std::string& input);

}  // namespace mcp_remote::oauth
