#include "polling/pipeline.hpp"

#include <algorithm>
#include <iterator>

#include "util/logging.hpp"
#include "util/utils.hpp"

namespace pollagent {

bool Source::support_meter(const std::string& meter_name) const {
  bool only_negative = true;
  bool positive = false;
  for (const auto& pattern : meters) {
    if (!pattern.empty() && pattern[0] == '!') {
      if (match_glob(meter_name, pattern.substr(1))) {
        return false;
      }
    } else {
      only_negative = false;
      positive = positive || match_glob(meter_name, pattern);
    }
  }
  return positive || only_negative;
}

Pipeline::Pipeline(Source source, Sink sink,
                   std::vector<std::shared_ptr<Publisher>> publishers)
    : _source(std::move(source)),
      _sink(std::move(sink)),
      _publishers(std::move(publishers)) {}

void Pipeline::publish_samples(const PollContext& context,
                               const std::vector<Sample>& samples) const {
  std::vector<Sample> accepted;
  accepted.reserve(samples.size());
  std::copy_if(samples.begin(), samples.end(), std::back_inserter(accepted),
               [this](const Sample& sample) {
                 return _source.support_meter(sample.name());
               });
  if (accepted.empty()) {
    return;
  }

  for (const auto& publisher : _publishers) {
    try {
      if (!publisher->publish(context, _source.name, accepted)) {
        agent_logger().error("Pipeline {}: failed to publish {} sample(s)",
                             name(), accepted.size());
      }
    } catch (const std::exception& e) {
      agent_logger().error("Pipeline {}: publisher raised: {}", name(),
                           e.what());
    }
  }
}

}  // namespace pollagent
