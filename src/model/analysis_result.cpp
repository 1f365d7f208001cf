#include "model/analysis_result.hpp"

namespace capacity_planner::model {

const char* to_string(const ProvisioningDirection direction) noexcept {
  switch (direction) {
    case ProvisioningDirection::UNDER_PROVISIONED:
      return "under_provisioned";
    case ProvisioningDirection::BALANCED:
      return "balanced";
    case ProvisioningDirection::OVER_PROVISIONED:
      return "over_provisioned";
  }
  return "unknown";
}

}  // namespace capacity_planner::model
