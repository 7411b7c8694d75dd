#ifndef MCP_REMOTE_LOG_H
#define MCP_REMOTE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace mcp_remote {

/**
 * 初始化日志系统
 *
 * stdout 属于 STDIO 代理的 JSON-RPC 流，日志只写入文件和 stderr。
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动时，当前的 mcp_remote.log 会被重命名为 mcp_remote.0.log
 * - 历史日志依次向后移动：mcp_remote.0.log -> ... -> mcp_remote.9.log
 * - 最旧的日志被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.mcp-auth/log/mcp_remote.log）
 * @param level 文件日志级别，默认 info
 * @param max_files 保留的历史日志文件数量
 * @param stderr_level stderr 输出级别，默认 warn
 */
void init_log(const std::string& log_path = "", const std::string& level = "info", size_t max_files = 10,
              const std::string& stderr_level = "warn");

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace mcp_remote

#endif  // MCP_REMOTE_LOG_H
