#include "store/sample_store.hpp"

#include <algorithm>
#include <utility>

namespace capacity_planner::store {

void MemorySampleStore::append(model::RawSample sample) {
  const std::string node = sample.node.value_or(std::string{});
  by_node_[node].push_back(std::move(sample));
  ++size_;
}

std::vector<std::string> MemorySampleStore::list_nodes() {
  std::vector<std::string> nodes;
  nodes.reserve(by_node_.size());
  for (const auto& [node, samples] : by_node_) {
    if (!node.empty()) {
      nodes.push_back(node);
    }
  }
  return nodes;
}

std::vector<model::RawSample> MemorySampleStore::get_window(const std::string& node, const std::int64_t start_ms,
                                                            const std::int64_t end_ms) {
  std::vector<model::RawSample> window;
  const auto it = by_node_.find(node);
  if (it == by_node_.end()) {
    return window;
  }

  for (const auto& sample : it->second) {
    if (!sample.timestamp_ms.has_value() || (*sample.timestamp_ms >= start_ms && *sample.timestamp_ms <= end_ms)) {
      window.push_back(sample);
    }
  }

  // Untimed samples first; equal timestamps keep insertion order.
  std::stable_sort(window.begin(), window.end(), [](const model::RawSample& lhs, const model::RawSample& rhs) {
    return lhs.timestamp_ms < rhs.timestamp_ms;
  });
  return window;
}

}  // namespace capacity_planner::store
