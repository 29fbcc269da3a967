#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace priceopt {

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  std::string input_path;  // JSON sample file (takes precedence over url)
  std::string source_url;  // HTTP JSON sample endpoint
  std::vector<std::string> products;
  std::optional<double> cost;       // defaults to 70% of the cheapest price
  std::optional<double> max_demand; // defaults to max(100, n / 10)
  double gs_tolerance = 1e-3;
  int gs_max_iters = 100;
  int worker_threads = 2;
  int http_timeout_s = 10;
  std::string log_dir = "logs";
  bool verbose = false;
};

// ── Failure taxonomy ─────────────────────────────────────────────────
enum class FailureKind {
  NONE,
  EMPTY_INPUT,        // prices or ratings empty
  LENGTH_MISMATCH,    // prices.size() != ratings.size()
  NO_VALID_DATA,      // nothing left after dropping missing rows
  REGRESSION_FAILURE, // least-squares fit not computable
  NON_FINITE_PROFIT,  // profit curve produced NaN/inf during the search
  INVALID_ARGUMENT,
  SHUTDOWN, // submitted after the service stopped accepting work
  INTERNAL  // unexpected exception while running a task
};

const char *failureKindName(FailureKind kind);

// Value or tagged failure, carried unchanged through every layer.
template <typename T> struct Outcome {
  std::optional<T> value;
  FailureKind failure = FailureKind::NONE;
  std::string detail;

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }
  const T &operator*() const { return *value; }
  const T *operator->() const { return &*value; }

  static Outcome success(T v) {
    Outcome o;
    o.value = std::move(v);
    return o;
  }
  static Outcome fail(FailureKind kind, std::string why) {
    Outcome o;
    o.failure = kind;
    o.detail = std::move(why);
    return o;
  }
  // Re-tag another layer's failure without losing its kind.
  template <typename U> static Outcome from(const Outcome<U> &other) {
    return fail(other.failure, other.detail);
  }
};

// ── Market samples ───────────────────────────────────────────────────
struct SampleBatch {
  std::vector<double> prices;
  std::vector<double> ratings; // 0 = missing before imputation
  size_t product_count = 0;    // listings seen, including unparseable ones
  double mean_rating = 0.0;
};

// ── Demand curve ─────────────────────────────────────────────────────
struct DemandParameters {
  double a_d = 0.0;       // theoretical max demand at price 0
  double b_d = 0.0;       // price sensitivity, always >= 0
  double r2 = 0.0;        // fit quality, informational only
  double intercept = 0.0; // 0 when the origin fit was chosen
  double slope = 0.0;     // raw fitted slope before sign correction
  bool used_intercept = false;
  bool sign_corrected = false;
  size_t sample_count = 0; // rows used in the fit
};

struct PriceBracket {
  double low = 0.0;
  double high = 1000.0;

  double width() const { return high - low; }
};

// ── Optimization ─────────────────────────────────────────────────────
struct OptimizationResult {
  double optimum_price = 0.0;
  double maximum_profit = 0.0;
  double estimated_demand = 0.0;
  int iterations = 0;
  DemandParameters demand_parameters;
  PriceBracket price_range;
  double cost = 0.0;
};

// ── Background tasks ─────────────────────────────────────────────────
enum class TaskStatus { RUNNING, SEARCHING, OPTIMIZING, COMPLETED, FAILED };

const char *taskStatusName(TaskStatus status);

inline bool isTerminal(TaskStatus status) {
  return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
}

struct TaskRecord {
  std::string id;
  std::string product_name;
  TaskStatus status = TaskStatus::RUNNING;
  std::string start_time;
  std::string completion_time;
  std::optional<size_t> product_count;
  FailureKind failure = FailureKind::NONE;
  std::string error;
  std::optional<OptimizationResult> result;
};

// ── Timing helpers ───────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

// Local wall-clock time, "%Y-%m-%d %H:%M:%S".
std::string wallClockString(std::chrono::system_clock::time_point tp);

} // namespace priceopt
