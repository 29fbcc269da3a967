#include "priceopt/common.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace priceopt {

const char *failureKindName(FailureKind kind) {
  switch (kind) {
  case FailureKind::NONE:
    return "none";
  case FailureKind::EMPTY_INPUT:
    return "empty_input";
  case FailureKind::LENGTH_MISMATCH:
    return "length_mismatch";
  case FailureKind::NO_VALID_DATA:
    return "no_valid_data";
  case FailureKind::REGRESSION_FAILURE:
    return "regression_failure";
  case FailureKind::NON_FINITE_PROFIT:
    return "non_finite_profit";
  case FailureKind::INVALID_ARGUMENT:
    return "invalid_argument";
  case FailureKind::SHUTDOWN:
    return "shutdown";
  case FailureKind::INTERNAL:
    return "internal";
  }
  return "unknown";
}

const char *taskStatusName(TaskStatus status) {
  switch (status) {
  case TaskStatus::RUNNING:
    return "running";
  case TaskStatus::SEARCHING:
    return "searching";
  case TaskStatus::OPTIMIZING:
    return "optimizing";
  case TaskStatus::COMPLETED:
    return "completed";
  case TaskStatus::FAILED:
    return "failed";
  }
  return "unknown";
}

std::string wallClockString(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local); // workers call this concurrently
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

} // namespace priceopt
