#pragma once

#include <filesystem>
#include <mutex>

#include "fastlog/fastlog.hpp"

namespace pollagent {

constexpr char kManagerLoggerName[] = "manager_file_logger";
constexpr char kDefaultManagerLogDir[] = "/tmp/pollagent_logs/manager";

// 获取管理者文件日志器；main 尚未创建时按默认路径创建一个
inline fastlog::file::FileLogger& manager_logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (fastlog::file::get_logger(kManagerLoggerName) == nullptr) {
      std::filesystem::path log_dir = kDefaultManagerLogDir;
      std::filesystem::create_directories(log_dir);
      fastlog::file::make_logger(kManagerLoggerName,
                                 (log_dir / "manager.log").string());
    }
  });
  return *fastlog::file::get_logger(kManagerLoggerName);
}

}  // namespace pollagent
