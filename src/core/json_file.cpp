#include "core/json_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace mcp_remote {

namespace fs = std::filesystem;

Result<std::optional<json>> read_json_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<std::optional<json>>::success(std::nullopt);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<std::optional<json>>::failure(ErrorKind::Io, "Failed to open " + path.string());
  }

  try {
    json j = json::parse(file);
    return Result<std::optional<json>>::success(std::move(j));
  } catch (const std::exception& e) {
    return Result<std::optional<json>>::failure(ErrorKind::Json, "Failed to parse " + path.string() + ": " + e.what());
  }
}

Status write_json_file(const fs::path& path, const json& doc, bool owner_only) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::failure(ErrorKind::Io, "Failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      return Status::failure(ErrorKind::Io, "Failed to open temp file for writing: " + tmp_path.string());
    }

    file << doc.dump(2);
    file.close();

    if (file.fail()) {
      fs::remove(tmp_path, ec);
      return Status::failure(ErrorKind::Io, "Failed to write temp file: " + tmp_path.string());
    }
  }

  if (owner_only) {
    fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
      spdlog::warn("[Storage] Failed to restrict permissions of {}: {}", tmp_path.string(), ec.message());
    }
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return Status::failure(ErrorKind::Io, "Failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message());
  }

  return Status::success();
}

Status remove_file(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    return Status::failure(ErrorKind::Io, "Failed to remove " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

}  // namespace mcp_remote
