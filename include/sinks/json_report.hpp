#pragma once

#include <fstream>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "sinks/report_sink.hpp"

namespace capacity_planner::sinks {

// "forecast": null plus "unavailable_reason" when a resource has no forecast; a 0% forecast
// is always a number.
nlohmann::json report_to_json(const core::NodeReport& report);
nlohmann::json summary_to_json(const core::ClusterSummary& summary, const core::PassStats& stats);

// One JSON document per line.
class JsonReportSink final : public ReportSink {
 public:
  // Appends to the file at path. Throws std::runtime_error when it cannot be opened.
  explicit JsonReportSink(const std::string& path);
  explicit JsonReportSink(std::ostream& out);

  bool publish(const core::NodeReport& report) override;
  bool publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) override;

 private:
  bool write_line(const nlohmann::json& document);

  std::ofstream file_{};
  std::ostream* out_;
};

}  // namespace capacity_planner::sinks
