#pragma once

#include "core/node_report.hpp"

namespace capacity_planner::sinks {

class ReportSink {
 public:
  // Returns false when the report could not be delivered.
  virtual bool publish(const core::NodeReport& report) = 0;
  virtual bool publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) = 0;
  virtual ~ReportSink() = default;
};

}  // namespace capacity_planner::sinks
