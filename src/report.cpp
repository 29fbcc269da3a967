#include "priceopt/report.hpp"

using json = nlohmann::json;

namespace priceopt {

json toJson(const DemandParameters &params) {
  return json{
      {"a_d", params.a_d},
      {"b_d", params.b_d},
      {"r2", params.r2},
      {"intercept", params.intercept},
      {"slope", params.slope},
      {"used_intercept", params.used_intercept},
      {"sign_corrected", params.sign_corrected},
      {"sample_count", params.sample_count},
  };
}

json toJson(const OptimizationResult &result) {
  return json{
      {"optimum_price", result.optimum_price},
      {"maximum_profit", result.maximum_profit},
      {"estimated_demand", result.estimated_demand},
      {"iterations", result.iterations},
      {"demand_parameters", toJson(result.demand_parameters)},
      {"price_range", json::array({result.price_range.low,
                                   result.price_range.high})},
      {"cost", result.cost},
  };
}

json toJson(const TaskRecord &record) {
  json j = {
      {"task_id", record.id},
      {"status", taskStatusName(record.status)},
      {"product_name", record.product_name},
      {"start_time", record.start_time},
      {"error", record.error},
  };
  if (record.product_count)
    j["product_count"] = *record.product_count;
  if (record.failure != FailureKind::NONE)
    j["failure_kind"] = failureKindName(record.failure);
  if (!record.completion_time.empty())
    j["completion_time"] = record.completion_time;
  if (record.status == TaskStatus::COMPLETED && record.result)
    j["result"] = toJson(*record.result);
  return j;
}

} // namespace priceopt
