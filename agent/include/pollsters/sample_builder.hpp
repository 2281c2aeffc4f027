#pragma once

#include <map>
#include <string>

#include "polling/resource.hpp"
#include "util/utils.hpp"

namespace pollagent {

constexpr char kGauge[] = "gauge";
constexpr char kCumulative[] = "cumulative";

inline Sample make_sample(const std::string& name, const std::string& type,
                          const std::string& unit, double volume,
                          const Resource& resource_id,
                          const std::map<std::string, std::string>& metadata = {}) {
  Sample sample;
  sample.set_name(name);
  sample.set_type(type);
  sample.set_unit(unit);
  sample.set_volume(volume);
  sample.set_resource_id(resource_id);
  sample.set_timestamp(now_millis());
  for (const auto& [key, value] : metadata) {
    (*sample.mutable_resource_metadata())[key] = value;
  }
  return sample;
}

}  // namespace pollagent
