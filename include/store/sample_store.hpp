#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "model/metric_sample.hpp"

namespace capacity_planner::store {

// Read side of the metric history. Implementations return raw samples; validation
// belongs to the caller.
class SampleStore {
 public:
  // Sorted, unique node names.
  virtual std::vector<std::string> list_nodes() = 0;
  // Samples with start_ms <= timestamp <= end_ms, ascending. Samples without a timestamp
  // are returned too so that the caller can count them.
  virtual std::vector<model::RawSample> get_window(const std::string& node, std::int64_t start_ms,
                                                   std::int64_t end_ms) = 0;
  virtual ~SampleStore() = default;
};

class MemorySampleStore final : public SampleStore {
 public:
  void append(model::RawSample sample);

  std::vector<std::string> list_nodes() override;
  std::vector<model::RawSample> get_window(const std::string& node, std::int64_t start_ms,
                                           std::int64_t end_ms) override;

  std::size_t size() const noexcept { return size_; }

 private:
  std::map<std::string, std::vector<model::RawSample>> by_node_{};
  std::size_t size_{0};
};

}  // namespace capacity_planner::store
