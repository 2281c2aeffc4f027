#include "pollsters/memory_pollster.hpp"

#include <format>
#include <unordered_map>

#include "pollsters/sample_builder.hpp"
#include "util/readfile.hpp"

namespace pollagent {

// 读取 /proc/meminfo，单位 kB
static bool read_meminfo(const std::string& path,
                         std::unordered_map<std::string, int64_t>* fields) {
  ReadFile file(path);
  if (!file.is_open()) {
    return false;
  }
  std::vector<std::string> args;
  while (file.read_line(&args)) {
    if (args.size() >= 2 && !args[0].empty() && args[0].back() == ':') {
      try {
        (*fields)[args[0].substr(0, args[0].size() - 1)] = std::stoll(args[1]);
      } catch (const std::exception&) {
        // 非数值行忽略
      }
    }
    args.clear();
  }
  return fields->count("MemTotal") > 0 && fields->count("MemAvailable") > 0;
}

PollStatus MemoryPollster::get_samples(const PollContext& context,
                                       PollCache* cache,
                                       const std::vector<Resource>& resources,
                                       std::vector<Sample>* samples) {
  std::unordered_map<std::string, int64_t> fields;
  if (!read_meminfo(_proc_path, &fields)) {
    return PollStatus::Transient("failed to read " + _proc_path);
  }
  double total_mb = fields["MemTotal"] / 1024.0;
  double avail_mb = fields["MemAvailable"] / 1024.0;

  for (const auto& resource : resources) {
    if (resource != context.hostname) {
      return PollStatus::Permanent(resource,
                                   "memory.usage only measures the local host");
    }
    samples->push_back(make_sample("memory.usage", kGauge, "MB",
                                   total_mb - avail_mb, resource,
                                   {{"total_mb", std::format("{:.1f}", total_mb)},
                                    {"avail_mb", std::format("{:.1f}", avail_mb)}}));
  }
  return PollStatus::Ok();
}

}  // namespace pollagent
