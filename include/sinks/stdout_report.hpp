#pragma once

#include <cstdio>

#include "sinks/report_sink.hpp"

namespace capacity_planner::sinks {

// Human-readable report, one block per node.
class StdoutReportSink final : public ReportSink {
 public:
  explicit StdoutReportSink(std::FILE* out = stdout) : out_(out) {}

  bool publish(const core::NodeReport& report) override;
  bool publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) override;

 private:
  std::FILE* out_;
};

}  // namespace capacity_planner::sinks
