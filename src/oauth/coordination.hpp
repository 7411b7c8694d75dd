#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "oauth/oauth_config.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// Process liveness check, injectable for tests
class ProcessProbe {
 public:
  virtual ~ProcessProbe() = default;

  virtual bool is_alive(uint32_t pid) const = 0;
};

// kill(pid, 0) on POSIX, OpenProcess on Windows
class SystemProcessProbe : public ProcessProbe {
 public:
  bool is_alive(uint32_t pid) const override;
};

uint32_t current_pid();

// First 16 hex chars of SHA-256(server_url)
std::string hash_server_url(const std::string& server_url);

// Advisory lock file shared by processes authorizing against the same server:
//   {auth_dir}/{hash}_lock.json
//
// Existence plus staleness only. Two processes may both see no lock and both
// create one; the later write wins.
class CoordinationManager {
 public:
  CoordinationManager(std::filesystem::path auth_dir, const std::string& server_url, CoordinationOptions options = {},
                      std::shared_ptr<ProcessProbe> probe = nullptr);

  // Live lock held by some process, or nullopt. Stale (too old, dead pid,
  // unparseable) lock files are deleted and reported as nullopt.
  Result<std::optional<LockfileRecord>> check_lockfile();

  // Write {pid: self, port, timestamp: now}
  Status create_lockfile(uint16_t port);

  // Poll until the lock held for `port` goes away (true), changes hands or
  // the wait times out (false). Cancelled error when *cancel becomes true.
  Result<bool> wait_for_authentication(uint16_t port, const std::atomic<bool>* cancel = nullptr);

  // Missing file is not an error
  Status delete_lockfile();

  // wait_for_authentication, then delete the lock file regardless of outcome
  Result<bool> wait_and_cleanup(uint16_t port, const std::atomic<bool>* cancel = nullptr);

  std::filesystem::path lockfile_path() const;

  const std::string& server_url_hash() const {
    return server_url_hash_;
  }

 private:
  bool is_stale(const LockfileRecord& record) const;

  std::filesystem::path auth_dir_;
  std::string server_url_hash_;
  CoordinationOptions options_;
  std::shared_ptr<ProcessProbe> probe_;
};

}  // namespace mcp_remote::oauth
