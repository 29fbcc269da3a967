#pragma once
#include "priceopt/common.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace priceopt {

// Appends one CSV row per finished task to <log_dir>/runs.csv and one row
// per fitted demand curve to <log_dir>/demand.csv, mirroring both to spdlog.
class RunLogger {
public:
  explicit RunLogger(const std::string &log_dir = "logs");
  ~RunLogger();

  void logRun(const TaskRecord &record);
  void logDemand(const DemandParameters &params,
                 const std::string &product_name = "");
  void logSummary(int completed, int failed, double elapsed_ms);

private:
  std::string log_dir_;
  std::ofstream runs_csv_;
  std::ofstream demand_csv_;
  std::mutex mtx_;

  void ensureHeaders();
};

} // namespace priceopt
