#include "pollsters/net_pollster.hpp"

#include <format>
#include <fstream>
#include <sstream>

#include "pollsters/sample_builder.hpp"

namespace pollagent {

namespace {
constexpr char kNetStatsCacheKey[] = "network.proc_net_dev";
}  // namespace

bool read_net_stats(const std::string& path, NetStats* stats) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  // 跳过前两行标题
  std::getline(file, line);
  std::getline(file, line);

  while (std::getline(file, line)) {
    // 接口名与计数之间可能没有空格，如 "eth0:123"
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string iface = line.substr(0, colon);
    iface.erase(0, iface.find_first_not_of(' '));
    if (iface.empty()) {
      continue;
    }

    std::istringstream iss(line.substr(colon + 1));
    NetStat stat;
    stat.name = iface;
    // 接收: bytes packets errs drop fifo frame compressed multicast
    iss >> stat.rcv_bytes >> stat.rcv_packets >> stat.err_in >> stat.drop_in;
    uint64_t dummy;
    iss >> dummy >> dummy >> dummy >> dummy;
    // 发送: bytes packets errs drop fifo colls carrier compressed
    iss >> stat.snd_bytes >> stat.snd_packets >> stat.err_out >> stat.drop_out;
    if (iss.fail()) {
      continue;
    }
    (*stats)[iface] = stat;
  }
  return true;
}

std::string NetPollster::meter_name() const {
  return _direction == Direction::kIncoming ? "network.incoming.bytes"
                                            : "network.outgoing.bytes";
}

PollStatus NetPollster::get_samples(const PollContext& context,
                                    PollCache* cache,
                                    const std::vector<Resource>& resources,
                                    std::vector<Sample>* samples) {
  auto cached = cache->find(kNetStatsCacheKey);
  if (cached == cache->end()) {
    NetStats stats;
    if (!read_net_stats(_proc_path, &stats)) {
      return PollStatus::Transient("failed to read " + _proc_path);
    }
    cached = cache->emplace(kNetStatsCacheKey, std::move(stats)).first;
  }
  const auto* stats = std::any_cast<NetStats>(&cached->second);
  if (stats == nullptr) {
    return PollStatus::Transient("unexpected cache entry for network stats");
  }

  for (const auto& resource : resources) {
    auto it = stats->find(resource);
    if (it == stats->end()) {
      // 网卡已经不存在
      return PollStatus::Permanent(resource,
                                   std::format("interface {} not found", resource));
    }
    const NetStat& stat = it->second;
    bool incoming = _direction == Direction::kIncoming;
    samples->push_back(make_sample(
        meter_name(), kCumulative, "B",
        static_cast<double>(incoming ? stat.rcv_bytes : stat.snd_bytes),
        resource,
        {{"host", context.hostname},
         {"packets", std::format("{}", incoming ? stat.rcv_packets : stat.snd_packets)},
         {"errors", std::format("{}", incoming ? stat.err_in : stat.err_out)},
         {"drops", std::format("{}", incoming ? stat.drop_in : stat.drop_out)}}));
  }
  return PollStatus::Ok();
}

}  // namespace pollagent
