#include "oauth/coordination.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <thread>

#include "core/clock.hpp"
#include "core/json_file.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace mcp_remote::oauth {

namespace fs = std::filesystem;

bool SystemProcessProbe::is_alive(uint32_t pid) const {
  if (pid == 0) {
    return false;
  }
#ifdef _WIN32
  HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
  if (process == nullptr) {
    return false;
  }
  DWORD exit_code = 0;
  bool alive = GetExitCodeProcess(process, &exit_code) && exit_code == STILL_ACTIVE;
  CloseHandle(process);
  return alive;
#else
  if (kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // EPERM: exists but owned by someone else
  return errno == EPERM;
#endif
}

uint32_t current_pid() {
#ifdef _WIN32
  return static_cast<uint32_t>(GetCurrentProcessId());
#else
  return static_cast<uint32_t>(getpid());
#endif
}

std::string hash_server_url(const std::string& server_url) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(server_url.c_str()), server_url.size(), hash);

  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < 8; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

CoordinationManager::CoordinationManager(fs::path auth_dir, const std::string& server_url, CoordinationOptions options,
                                         std::shared_ptr<ProcessProbe> probe)
    : auth_dir_(std::move(auth_dir)), server_url_hash_(hash_server_url(server_url)), options_(options), probe_(std::move(probe)) {
  if (!probe_) {
    probe_ = std::make_shared<SystemProcessProbe>();
  }
}

fs::path CoordinationManager::lockfile_path() const {
  return auth_dir_ / (server_url_hash_ + "_lock.json");
}

bool CoordinationManager::is_stale(const LockfileRecord& record) const {
  auto age = clock::now() - record.timestamp;
  if (age >= options_.max_lock_age) {
    spdlog::debug("[Lock] Lock file is too old: {}s", std::chrono::duration_cast<std::chrono::seconds>(age).count());
    return true;
  }
  if (!probe_->is_alive(record.pid)) {
    spdlog::debug("[Lock] Process {} from lock file is not running", record.pid);
    return true;
  }
  return false;
}

Result<std::optional<LockfileRecord>> CoordinationManager::check_lockfile() {
  auto path = lockfile_path();
  auto doc = read_json_file(path);

  std::optional<LockfileRecord> record;
  if (doc.ok()) {
    if (!doc.value->has_value()) {
      return Result<std::optional<LockfileRecord>>::success(std::nullopt);
    }
    auto parsed = LockfileRecord::from_json(**doc.value);
    if (parsed.ok()) {
      record = std::move(*parsed.value);
    } else {
      spdlog::warn("[Lock] {}: {}", path.string(), parsed.error->message);
    }
  } else if (doc.error->kind == ErrorKind::Json) {
    spdlog::warn("[Lock] {}", doc.error->message);
  } else {
    return Result<std::optional<LockfileRecord>>::failure(ErrorKind::TokenStorage, doc.error->message);
  }

  if (record && !is_stale(*record)) {
    return Result<std::optional<LockfileRecord>>::success(std::move(record));
  }

  spdlog::info("[Lock] Removing stale lock file {}", path.string());
  auto removed = delete_lockfile();
  if (removed.failed()) {
    spdlog::warn("[Lock] {}", removed.error->to_string());
  }
  return Result<std::optional<LockfileRecord>>::success(std::nullopt);
}

Status CoordinationManager::create_lockfile(uint16_t port) {
  LockfileRecord record;
  record.pid = current_pid();
  record.port = port;
  record.timestamp = clock::now();
  record.server_url_hash = server_url_hash_;

  auto status = write_json_file(lockfile_path(), record.to_json());
  if (status.failed()) {
    return Status::failure(ErrorKind::TokenStorage, "Failed to write lock file: " + status.error->message);
  }

  spdlog::info("[Lock] Created lock file for pid {} on port {}", record.pid, port);
  return status;
}

Status CoordinationManager::delete_lockfile() {
  auto status = remove_file(lockfile_path());
  if (status.failed()) {
    return Status::failure(ErrorKind::TokenStorage, "Failed to delete lock file: " + status.error->message);
  }
  return status;
}

Result<bool> CoordinationManager::wait_for_authentication(uint16_t port, const std::atomic<bool>* cancel) {
  spdlog::info("[Lock] Waiting for authentication on port {} to complete", port);

  const auto slice = std::chrono::milliseconds(50);
  const auto deadline = std::chrono::steady_clock::now() + options_.max_wait;

  while (std::chrono::steady_clock::now() < deadline) {
    // Sleep one poll interval in small slices so cancel() is noticed promptly
    auto next_poll = std::chrono::steady_clock::now() + options_.poll_interval;
    while (std::chrono::steady_clock::now() < next_poll) {
      if (cancel && cancel->load()) {
        return Result<bool>::failure(ErrorKind::Cancelled, "Coordination wait cancelled");
      }
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, next_poll - std::chrono::steady_clock::now()));
    }

    auto lock = check_lockfile();
    if (lock.failed()) {
      return Result<bool>::failure(*lock.error);
    }
    if (!lock.value->has_value()) {
      spdlog::info("[Lock] Lock file released, authentication may be complete");
      return Result<bool>::success(true);
    }
    if ((*lock.value)->port != port) {
      spdlog::warn("[Lock] Lock file now held for port {}, giving up coordination", (*lock.value)->port);
      return Result<bool>::success(false);
    }
  }

  spdlog::warn("[Lock] Timed out waiting for authentication, proceeding with own flow");
  return Result<bool>::success(false);
}

Result<bool> CoordinationManager::wait_and_cleanup(uint16_t port, const std::atomic<bool>* cancel) {
  auto result = wait_for_authentication(port, cancel);

  auto removed = delete_lockfile();
  if (removed.failed()) {
    spdlog::warn("[Lock] Failed to clean up lock file: {}", removed.error->message);
  }

  return result;
}

}  // namespace mcp_remote::oauth
