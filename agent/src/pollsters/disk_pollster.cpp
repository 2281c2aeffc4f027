#include "pollsters/disk_pollster.hpp"

#include <format>
#include <fstream>
#include <sstream>

#include "pollsters/sample_builder.hpp"

namespace pollagent {

namespace {
constexpr char kDiskStatsCacheKey[] = "disk.proc_diskstats";
constexpr double kSectorSize = 512.0;
}  // namespace

bool read_disk_stats(const std::string& path, DiskStats* stats) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return false;
  }
  std::string line;
  while (std::getline(ifs, line)) {
    std::istringstream iss(line);
    int major, minor;
    std::string name;
    DiskStat curr{};
    uint64_t reads_merged, writes_merged;
    iss >> major >> minor >> name >> curr.reads >> reads_merged >>
        curr.sectors_read >> curr.read_time_ms >> curr.writes >>
        writes_merged >> curr.sectors_written >> curr.write_time_ms >>
        curr.io_in_progress;
    if (iss.fail() || name.empty()) {
      continue;
    }
    if (name.find("loop") == 0 || name.find("ram") == 0)
      continue;  // 跳过虚拟盘
    (*stats)[name] = curr;
  }
  return true;
}

std::string DiskPollster::meter_name() const {
  return _direction == Direction::kRead ? "disk.read.bytes" : "disk.write.bytes";
}

PollStatus DiskPollster::get_samples(const PollContext& context,
                                     PollCache* cache,
                                     const std::vector<Resource>& resources,
                                     std::vector<Sample>* samples) {
  auto cached = cache->find(kDiskStatsCacheKey);
  if (cached == cache->end()) {
    DiskStats stats;
    if (!read_disk_stats(_proc_path, &stats)) {
      return PollStatus::Transient("failed to read " + _proc_path);
    }
    cached = cache->emplace(kDiskStatsCacheKey, std::move(stats)).first;
  }
  const auto* stats = std::any_cast<DiskStats>(&cached->second);
  if (stats == nullptr) {
    return PollStatus::Transient("unexpected cache entry for disk stats");
  }

  bool reading = _direction == Direction::kRead;
  for (const auto& resource : resources) {
    auto it = stats->find(resource);
    if (it == stats->end()) {
      return PollStatus::Permanent(resource,
                                   std::format("device {} not found", resource));
    }
    const DiskStat& stat = it->second;
    double bytes = (reading ? stat.sectors_read : stat.sectors_written) * kSectorSize;
    samples->push_back(make_sample(
        meter_name(), kCumulative, "B", bytes, resource,
        {{"host", context.hostname},
         {"requests", std::format("{}", reading ? stat.reads : stat.writes)},
         {"time_ms", std::format("{}", reading ? stat.read_time_ms : stat.write_time_ms)}}));
  }
  return PollStatus::Ok();
}

}  // namespace pollagent
