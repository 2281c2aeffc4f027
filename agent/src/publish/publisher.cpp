#include "publish/publisher.hpp"

#include "rpc/sample_publisher.hpp"
#include "util/logging.hpp"

namespace pollagent {

namespace {
constexpr char kLogScheme[] = "log://";
constexpr char kGrpcScheme[] = "grpc://";
}  // namespace

bool LogPublisher::publish(const PollContext& context,
                           const std::string& source,
                           const std::vector<Sample>& samples) {
  auto& log = agent_logger();
  log.info("[{}] {} sample(s) from source {}", context.agent_id,
           samples.size(), source);
  for (const auto& sample : samples) {
    log.info("  {} {} {} {} ({})", sample.resource_id(), sample.name(),
             sample.volume(), sample.unit(), sample.type());
  }
  return true;
}

std::shared_ptr<Publisher> make_publisher(const std::string& url) {
  if (url.rfind(kLogScheme, 0) == 0) {
    return std::make_shared<LogPublisher>();
  }
  if (url.rfind(kGrpcScheme, 0) == 0) {
    std::string address = url.substr(sizeof(kGrpcScheme) - 1);
    if (address.empty()) {
      return nullptr;
    }
    return std::make_shared<SamplePublisher>(address);
  }
  return nullptr;
}

}  // namespace pollagent
