#pragma once
#include "priceopt/common.hpp"
#include <nlohmann/json.hpp>

namespace priceopt {

nlohmann::json toJson(const DemandParameters &params);
nlohmann::json toJson(const OptimizationResult &result);

// Status snapshot: status, product_name, start_time, error, plus
// product_count / failure_kind / result / completion_time when present.
nlohmann::json toJson(const TaskRecord &record);

} // namespace priceopt
