#pragma once

#include <string>

#include "polling/pollster.hpp"

namespace pollagent {

// 本机 1 分钟平均负载，附带 5/15 分钟负载
class CpuLoadPollster : public Pollster {
 public:
  explicit CpuLoadPollster(std::string proc_path = "/proc/loadavg")
      : _proc_path(std::move(proc_path)) {}

  std::string default_discovery() const override { return "local_node"; }
  PollStatus get_samples(const PollContext& context, PollCache* cache,
                         const std::vector<Resource>& resources,
                         std::vector<Sample>* samples) override;

 private:
  std::string _proc_path;
};

}  // namespace pollagent
