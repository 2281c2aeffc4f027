#include "pollsters/cpuload_pollster.hpp"

#include <format>

#include "pollsters/sample_builder.hpp"
#include "util/readfile.hpp"

namespace pollagent {

// 从 /proc/loadavg 读取 CPU 负载
static bool read_load_from_proc(const std::string& path, float* load_avg_1,
                                float* load_avg_5, float* load_avg_15) {
  ReadFile file(path);
  std::vector<std::string> fields;
  if (!file.read_line(&fields) || fields.size() < 3) {
    return false;
  }
  try {
    *load_avg_1 = std::stof(fields[0]);
    *load_avg_5 = std::stof(fields[1]);
    *load_avg_15 = std::stof(fields[2]);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

PollStatus CpuLoadPollster::get_samples(const PollContext& context,
                                        PollCache* cache,
                                        const std::vector<Resource>& resources,
                                        std::vector<Sample>* samples) {
  float load1 = 0, load5 = 0, load15 = 0;
  if (!read_load_from_proc(_proc_path, &load1, &load5, &load15)) {
    return PollStatus::Transient("failed to read " + _proc_path);
  }

  for (const auto& resource : resources) {
    // 只能采集本机
    if (resource != context.hostname) {
      return PollStatus::Permanent(resource, "cpu.load only measures the local host");
    }
    samples->push_back(make_sample("cpu.load", kGauge, "load", load1, resource,
                                   {{"load_avg_5", std::format("{}", load5)},
                                    {"load_avg_15", std::format("{}", load15)}}));
  }
  return PollStatus::Ok();
}

}  // namespace pollagent
