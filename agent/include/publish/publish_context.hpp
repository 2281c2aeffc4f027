#pragma once

#include <string>
#include <vector>

#include "polling/pipeline.hpp"
#include "polling/resource.hpp"

namespace pollagent {

class PublishContext;

/**
 * 一次发布批次
 *
 * 收集一个 source 在本周期的采样，flush 恰好执行一次：
 * 显式调用 flush() 或在析构时自动执行。
 */
class PublishBatch {
 public:
  explicit PublishBatch(const PublishContext* context);
  ~PublishBatch();

  PublishBatch(PublishBatch&& other) noexcept;
  PublishBatch(const PublishBatch&) = delete;
  PublishBatch& operator=(const PublishBatch&) = delete;
  PublishBatch& operator=(PublishBatch&&) = delete;

  void add(std::vector<Sample> samples);
  void flush();

  bool flushed() const { return _flushed; }
  size_t size() const { return _samples.size(); }

 private:
  const PublishContext* _context;
  std::vector<Sample> _samples;
  bool _flushed{false};
};

// 一个 source 对应的发布上下文，持有该 source 的全部流水线
class PublishContext {
 public:
  explicit PublishContext(PollContext context);

  // 按流水线名去重
  void add_pipelines(const std::vector<PipelinePtr>& pipelines);

  PublishBatch open_batch() const { return PublishBatch(this); }

  const std::vector<PipelinePtr>& pipelines() const { return _pipelines; }

 private:
  friend class PublishBatch;
  void publish(const std::vector<Sample>& samples) const;

  PollContext _context;
  std::vector<PipelinePtr> _pipelines;
};

}  // namespace pollagent
