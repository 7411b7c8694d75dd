#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace mcp_remote {

namespace {

// 每次启动时轮转日志文件
// 策略：mcp_remote.log -> mcp_remote.0.log -> ... -> mcp_remote.9.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(current_log, ec) || max_files == 0) {
    return;
  }

  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto ext = current_log.extension().string();
  auto numbered = [&](size_t i) {
    return dir / (stem + "." + std::to_string(i) + ext);
  };

  // 删除最旧的日志文件
  fs::remove(numbered(max_files - 1), ec);

  // 从后往前依次重命名
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = numbered(static_cast<size_t>(i));
    if (fs::exists(old_name, ec)) {
      fs::rename(old_name, numbered(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, const std::string& level, size_t max_files, const std::string& stderr_level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::auth_dir() / "log" / "mcp_remote.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    fs::create_directories(actual_path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 文件 sink（每次启动都是新的干净文件）+ stderr sink
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    file_sink->set_level(spdlog::level::from_str(level));

    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_level(spdlog::level::from_str(stderr_level));
    stderr_sink->set_pattern("[%l] %v");

    auto logger = std::make_shared<spdlog::logger>("mcp_remote", spdlog::sinks_init_list{file_sink, stderr_sink});

    // logger 本身放行所有级别，由 sink 过滤
    logger->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新，避免缓存导致日志不及时
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("mcp_remote");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== mcp-remote started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace mcp_remote
