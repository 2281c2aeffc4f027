#include "publish/publish_context.hpp"

#include <algorithm>

#include "util/logging.hpp"

namespace pollagent {

PublishBatch::PublishBatch(const PublishContext* context)
    : _context(context) {}

PublishBatch::PublishBatch(PublishBatch&& other) noexcept
    : _context(other._context),
      _samples(std::move(other._samples)),
      _flushed(other._flushed) {
  // 被移走的批次不再 flush
  other._flushed = true;
}

PublishBatch::~PublishBatch() { flush(); }

void PublishBatch::add(std::vector<Sample> samples) {
  if (_flushed) {
    agent_logger().warn("Dropping {} sample(s) added after flush",
                        samples.size());
    return;
  }
  _samples.insert(_samples.end(), std::make_move_iterator(samples.begin()),
                  std::make_move_iterator(samples.end()));
}

void PublishBatch::flush() {
  if (_flushed) {
    return;
  }
  _flushed = true;
  if (_samples.empty() || _context == nullptr) {
    return;
  }
  _context->publish(_samples);
  _samples.clear();
}

PublishContext::PublishContext(PollContext context)
    : _context(std::move(context)) {}

void PublishContext::add_pipelines(const std::vector<PipelinePtr>& pipelines) {
  for (const auto& pipeline : pipelines) {
    bool known = std::any_of(_pipelines.begin(), _pipelines.end(),
                             [&pipeline](const PipelinePtr& p) {
                               return p->name() == pipeline->name();
                             });
    if (!known) {
      _pipelines.push_back(pipeline);
    }
  }
}

void PublishContext::publish(const std::vector<Sample>& samples) const {
  for (const auto& pipeline : _pipelines) {
    pipeline->publish_samples(_context, samples);
  }
}

}  // namespace pollagent
