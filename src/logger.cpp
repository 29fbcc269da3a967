#include "priceopt/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace priceopt {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm local{};
  localtime_r(&t, &local);
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

// Quote a field if it could break the row
static std::string csvField(const std::string &s) {
  if (s.find_first_of(",\"\n") == std::string::npos)
    return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"')
      out += '"';
    out += c;
  }
  return out + "\"";
}

RunLogger::RunLogger(const std::string &log_dir) : log_dir_(log_dir) {
  std::filesystem::create_directories(log_dir_);
  runs_csv_.open(log_dir_ + "/runs.csv", std::ios::app);
  demand_csv_.open(log_dir_ + "/demand.csv", std::ios::app);
  ensureHeaders();
}

RunLogger::~RunLogger() {
  if (runs_csv_.is_open())
    runs_csv_.close();
  if (demand_csv_.is_open())
    demand_csv_.close();
}

void RunLogger::ensureHeaders() {
  // tellp() is unreliable with ios::app
  auto runs_path = std::filesystem::path(log_dir_) / "runs.csv";
  if (std::filesystem::file_size(runs_path) == 0) {
    runs_csv_ << "timestamp,task_id,product,status,optimum_price,"
                 "maximum_profit,estimated_demand,iterations,r2\n";
    runs_csv_.flush();
  }

  auto demand_path = std::filesystem::path(log_dir_) / "demand.csv";
  if (std::filesystem::file_size(demand_path) == 0) {
    demand_csv_ << "timestamp,product,a_d,b_d,r2,intercept,slope,"
                   "used_intercept,sign_corrected,sample_count\n";
    demand_csv_.flush();
  }
}

void RunLogger::logRun(const TaskRecord &record) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto ts = timestamp();

  runs_csv_ << ts << "," << csvField(record.id) << ","
            << csvField(record.product_name) << ","
            << taskStatusName(record.status);
  if (record.result) {
    const auto &r = *record.result;
    runs_csv_ << "," << std::fixed << std::setprecision(4) << r.optimum_price
              << "," << std::fixed << std::setprecision(4) << r.maximum_profit
              << "," << std::fixed << std::setprecision(4)
              << r.estimated_demand << "," << r.iterations << ","
              << std::fixed << std::setprecision(6) << r.demand_parameters.r2
              << "\n";
  } else {
    runs_csv_ << ",,,,,\n";
  }
  runs_csv_.flush();

  if (record.status == TaskStatus::COMPLETED && record.result) {
    spdlog::info("✅ {}: price={:.2f} profit={:.2f} demand={:.2f}",
                 record.product_name, record.result->optimum_price,
                 record.result->maximum_profit,
                 record.result->estimated_demand);
  } else {
    spdlog::warn("⚠️  {} {}: {}", record.product_name,
                 taskStatusName(record.status), record.error);
  }
}

void RunLogger::logDemand(const DemandParameters &params,
                          const std::string &product_name) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto ts = timestamp();

  demand_csv_ << ts << "," << csvField(product_name) << "," << std::fixed
              << std::setprecision(4) << params.a_d << "," << std::fixed
              << std::setprecision(6) << params.b_d << "," << std::fixed
              << std::setprecision(6) << params.r2 << "," << std::fixed
              << std::setprecision(6) << params.intercept << "," << std::fixed
              << std::setprecision(6) << params.slope << ","
              << (params.used_intercept ? 1 : 0) << ","
              << (params.sign_corrected ? 1 : 0) << ","
              << params.sample_count << "\n";
  demand_csv_.flush();

  spdlog::info("📈 Demand {}: D(p) = {:.2f} - {:.4f}p (R²={:.3f}, n={})",
               product_name.empty() ? "curve" : product_name, params.a_d,
               params.b_d, params.r2, params.sample_count);
  if (params.sign_corrected)
    spdlog::warn("  ├─ negative slope {:.6f}, using |slope|", params.slope);
}

void RunLogger::logSummary(int completed, int failed, double elapsed) {
  spdlog::info("── Done ── completed={}, failed={}, elapsed={:.1f}ms ──",
               completed, failed, elapsed);
}

} // namespace priceopt
