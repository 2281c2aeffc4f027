#pragma once

#include <string>
#include <vector>

namespace pollagent {

constexpr char kDefaultPipelineFile[] = "pipeline.yaml";
constexpr char kDefaultNamespace[] = "compute";
constexpr int kDefaultHeartbeat = 1;  // 秒

// 代理配置
struct AgentConfig {
  std::string pipeline_cfg_file{kDefaultPipelineFile};
  std::vector<std::string> namespaces{kDefaultNamespace};
  // 只加载名字匹配的 pollster（通配符）；不能与协调后端同时使用
  std::vector<std::string> pollster_list;
  std::string group_prefix;
  // 协调后端，如 grpc://host:50051；空表示单代理
  std::string backend_url;
  int heartbeat{kDefaultHeartbeat};
  // 首次轮询前随机等待 [0, shuffle_time_before_polling_task] 秒
  int shuffle_time_before_polling_task{0};
  // 单次插件调用的超时（秒），0 表示不限
  int poll_call_timeout{0};
  // 检查流水线文件变化的周期（秒），0 表示不检查
  int refresh_pipeline_interval{0};
  std::string agent_id;
  std::string log_dir;
};

// 解析 --key=value 形式的命令行参数；出错时返回 false 并写入 error
bool parse_agent_args(int argc, const char* const argv[], AgentConfig* config,
                      std::string* error);

std::string agent_usage(const char* program);

// hostname-pid
std::string default_agent_id();

}  // namespace pollagent
