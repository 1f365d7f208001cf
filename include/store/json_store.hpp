#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/metric_sample.hpp"
#include "store/sample_store.hpp"

namespace capacity_planner::store {

// Maps one collector record onto a RawSample. Fields of the wrong JSON type are left
// empty so that validation reports them as missing.
model::RawSample sample_from_json(const nlohmann::json& record);

// Throws std::runtime_error unless the document is a JSON array of objects.
std::vector<model::RawSample> parse_sample_records(std::istream& input);

std::unique_ptr<MemorySampleStore> load_json_store(const std::string& path);

}  // namespace capacity_planner::store
