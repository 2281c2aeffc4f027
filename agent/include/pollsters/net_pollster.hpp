#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "polling/pollster.hpp"

namespace pollagent {

struct NetStat {
  std::string name;
  uint64_t rcv_bytes{0};
  uint64_t rcv_packets{0};
  uint64_t snd_bytes{0};
  uint64_t snd_packets{0};
  uint64_t err_in{0};
  uint64_t err_out{0};
  uint64_t drop_in{0};
  uint64_t drop_out{0};
};

using NetStats = std::unordered_map<std::string, NetStat>;

// 解析 /proc/net/dev 格式的文件（含 lo），失败返回 false
bool read_net_stats(const std::string& path, NetStats* stats);

/**
 * 网卡累计收/发字节数
 *
 * 资源为网卡名。/proc/net/dev 的解析结果放在 PollCache 中，
 * 收、发两个 pollster 在同一周期只读一次文件。
 */
class NetPollster : public Pollster {
 public:
  enum class Direction { kIncoming, kOutgoing };

  explicit NetPollster(Direction direction,
                       std::string proc_path = "/proc/net/dev")
      : _direction(direction), _proc_path(std::move(proc_path)) {}

  std::string default_discovery() const override { return "local_interfaces"; }
  PollStatus get_samples(const PollContext& context, PollCache* cache,
                         const std::vector<Resource>& resources,
                         std::vector<Sample>* samples) override;

  std::string meter_name() const;

 private:
  Direction _direction;
  std::string _proc_path;
};

}  // namespace pollagent
