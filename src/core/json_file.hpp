#pragma once

#include <filesystem>
#include <optional>

#include "core/types.hpp"

namespace mcp_remote {

// Small JSON documents on disk (token files, lock files, config).
// Storage layout is owned by the callers; these helpers only do I/O.

// Parse a JSON file. Returns nullopt value (ok) when the file does not exist,
// an Io error when it cannot be read, a Json error when it cannot be parsed.
Result<std::optional<json>> read_json_file(const std::filesystem::path& path);

// Atomic write: write to .tmp then rename. Creates the parent directory.
// With owner_only set the file is readable by the current user only (POSIX).
Status write_json_file(const std::filesystem::path& path, const json& doc, bool owner_only = false);

// Remove a file. Missing files are not an error.
Status remove_file(const std::filesystem::path& path);

}  // namespace mcp_remote
