#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "config/agent_config.hpp"
#include "config/pipeline_loader.hpp"
#include "coordination/grpc_backend.hpp"
#include "plugin/plugin_registry.hpp"
#include "polling/agent_manager.hpp"
#include "polling/timer_group.hpp"
#include "publish/publisher.hpp"
#include "util/logging.hpp"

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) { g_running = false; }

std::filesystem::file_time_type pipeline_mtime(const std::string& path) {
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path, ec);
  return ec ? std::filesystem::file_time_type::min() : mtime;
}
}  // namespace

int main(int argc, char* argv[]) {
  pollagent::AgentConfig config;
  std::string error;
  if (!pollagent::parse_agent_args(argc, argv, &config, &error)) {
    std::cerr << error << std::endl;
    return 1;
  }

  std::filesystem::path log_dir = config.log_dir;
  std::filesystem::create_directories(log_dir);
  std::string log_path = (log_dir / "agent.log").string();
  auto& log = fastlog::file::make_logger(pollagent::kAgentLoggerName, log_path);
  log.set_level(fastlog::LogLevel::Info);

  log.info("Starting polling agent {}...", config.agent_id);
  log.info("Pipeline file: {}", config.pipeline_cfg_file);

  std::shared_ptr<pollagent::CoordinationBackend> backend;
  if (!config.backend_url.empty()) {
    backend = pollagent::GrpcCoordinationBackend::from_url(config.backend_url);
    if (!backend) {
      log.error("Unsupported coordination backend url: {}", config.backend_url);
      std::cerr << "unsupported --backend-url " << config.backend_url << std::endl;
      return 1;
    }
    log.info("Coordination backend: {}", config.backend_url);
  }

  pollagent::PluginRegistry registry;
  pollagent::register_builtin_plugins(&registry);

  // pollster 列表与协调后端同时配置时抛出 PollsterListForbidden，初始化中止
  pollagent::AgentManager manager(
      config, registry, backend,
      std::make_unique<pollagent::ThreadTimerGroup>());

  std::vector<pollagent::PipelinePtr> pipelines;
  try {
    pipelines = pollagent::load_pipelines(config.pipeline_cfg_file,
                                          pollagent::make_publisher);
  } catch (const pollagent::PipelineException& e) {
    log.error("Invalid pipeline configuration: {}", e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  }
  auto last_mtime = pipeline_mtime(config.pipeline_cfg_file);

  manager.start(std::move(pipelines));

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  // 主线程定期刷新日志，并在流水线文件变化时重新加载
  auto last_check = std::chrono::steady_clock::now();
  while (g_running) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    log.flush();

    if (config.refresh_pipeline_interval <= 0) {
      continue;
    }
    auto now = std::chrono::steady_clock::now();
    if (now - last_check < std::chrono::seconds(config.refresh_pipeline_interval)) {
      continue;
    }
    last_check = now;
    auto mtime = pipeline_mtime(config.pipeline_cfg_file);
    if (mtime == last_mtime) {
      continue;
    }
    try {
      manager.reload(pollagent::load_pipelines(config.pipeline_cfg_file,
                                               pollagent::make_publisher));
      last_mtime = mtime;
    } catch (const pollagent::PipelineException& e) {
      log.error("Pipeline reload failed, keeping the current one: {}", e.what());
      last_mtime = mtime;
    }
  }

  log.info("Stopping polling agent {}", config.agent_id);
  manager.stop();
  log.flush();
  return 0;
}
