#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "fastlog/fastlog.hpp"

namespace pollagent {

constexpr char kAgentLoggerName[] = "agent_file_logger";
constexpr char kDefaultAgentLogDir[] = "/tmp/pollagent_logs/agent";

// 获取代理文件日志器；main 尚未创建时按默认路径创建一个
inline fastlog::file::FileLogger& agent_logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (fastlog::file::get_logger(kAgentLoggerName) == nullptr) {
      std::filesystem::path log_dir = kDefaultAgentLogDir;
      std::filesystem::create_directories(log_dir);
      fastlog::file::make_logger(kAgentLoggerName,
                                 (log_dir / "agent.log").string());
    }
  });
  return *fastlog::file::get_logger(kAgentLoggerName);
}

}  // namespace pollagent
