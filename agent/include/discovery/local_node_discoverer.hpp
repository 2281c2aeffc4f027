#pragma once

#include "polling/discoverer.hpp"

namespace pollagent {

// 返回本机主机名
class LocalNodeDiscoverer : public Discoverer {
 public:
  LocalNodeDiscoverer() {}
  bool discover(const PollContext& context, const std::string& param,
                std::vector<Resource>* resources) override;
};

}  // namespace pollagent
