#pragma once
#include "priceopt/common.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace priceopt {

// "<YYYYmmddHHMMSS>_<product with spaces as '_'>"
std::string makeTaskId(const std::string &product_name,
                       std::chrono::system_clock::time_point now);

// Thread-safe map of task id -> status record. Readers get copies.
class TaskRegistry {
public:
  // Registers a RUNNING task. A taken id gets a "_2", "_3", ... suffix; the
  // id actually used is returned.
  std::string create(const std::string &base_id,
                     const std::string &product_name);

  // Apply fn to the record under the lock. False if the id is unknown.
  bool update(const std::string &id,
              const std::function<void(TaskRecord &)> &fn);

  std::optional<TaskRecord> get(const std::string &id) const;

  // Blocks until the task is COMPLETED or FAILED, or the timeout expires.
  // Returns the latest snapshot, nullopt for an unknown id.
  std::optional<TaskRecord>
  waitForTerminal(const std::string &id,
                  std::chrono::milliseconds timeout) const;

  std::vector<std::string> ids() const;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
  }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable changed_;
  std::unordered_map<std::string, TaskRecord> tasks_;
  std::vector<std::string> order_; // creation order
};

} // namespace priceopt
