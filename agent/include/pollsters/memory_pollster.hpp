#pragma once

#include <string>

#include "polling/pollster.hpp"

namespace pollagent {

// 本机已用内存（MB）
class MemoryPollster : public Pollster {
 public:
  explicit MemoryPollster(std::string proc_path = "/proc/meminfo")
      : _proc_path(std::move(proc_path)) {}

  std::string default_discovery() const override { return "local_node"; }
  PollStatus get_samples(const PollContext& context, PollCache* cache,
                         const std::vector<Resource>& resources,
                         std::vector<Sample>* samples) override;

 private:
  std::string _proc_path;
};

}  // namespace pollagent
