#include <grpc/grpc.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "group_manager.hpp"
#include "manager_logging.hpp"
#include "rpc/collector_service.hpp"
#include "rpc/coordination_service.hpp"

constexpr char kDefaultListenAddress[] = "0.0.0.0:50051";
constexpr int kDefaultMemberTimeout = 30;

int main(int argc, char* argv[]) {
  std::filesystem::path log_dir = pollagent::kDefaultManagerLogDir;
  std::filesystem::create_directories(log_dir);
  std::string log_path = (log_dir / "manager.log").string();
  auto& log = fastlog::file::make_logger(pollagent::kManagerLoggerName, log_path);
  log.set_level(fastlog::LogLevel::Info);

  std::string listen_address = kDefaultListenAddress;
  int member_timeout = kDefaultMemberTimeout;

  // 解析命令行参数: [listen_address] [member_timeout_seconds]
  if (argc > 1) {
    listen_address = argv[1];
  }
  if (argc > 2) {
    try {
      member_timeout = std::stoi(argv[2]);
    } catch (const std::exception& e) {
      std::cerr << "invalid member timeout " << argv[2] << ": " << e.what()
                << std::endl;
      return 1;
    }
    if (member_timeout <= 0) {
      std::cerr << "member timeout must be positive" << std::endl;
      return 1;
    }
  }

  log.info("Starting pollagent manager...");
  log.info("Listening on: {}, member timeout: {}s", listen_address, member_timeout);

  pollagent::GroupManager groups{std::chrono::seconds(member_timeout)};
  groups.start();

  pollagent::CoordinationServiceImpl coordination(&groups);
  pollagent::SampleCollectorServiceImpl collector;
  collector.set_batch_received_callback(
      [&log](const pollagent::proto::SampleBatch& batch) {
        log.info("Batch from {} source {}: {} samples", batch.agent_id(),
                 batch.source(), batch.samples_size());
      });

  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&coordination);
  builder.RegisterService(&collector);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    log.error("Failed to listen on {}", listen_address);
    std::cerr << "failed to listen on " << listen_address << std::endl;
    groups.stop();
    return 1;
  }
  log.info("Manager listening on {}", listen_address);

  // 定期手动刷新文件日志，避免缓冲区未满时日志不落盘
  std::atomic<bool> running{true};
  std::thread flush_thread([&running]() {
    while (running) {
      std::this_thread::sleep_for(std::chrono::seconds(2));
      if (!running) break;
      auto* lg = fastlog::file::get_logger(pollagent::kManagerLoggerName);
      if (lg) lg->flush();
    }
  });

  server->Wait();
  running = false;
  if (flush_thread.joinable()) flush_thread.join();
  groups.stop();

  return 0;
}
