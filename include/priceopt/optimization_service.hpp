#pragma once
#include "priceopt/common.hpp"
#include "priceopt/logger.hpp"
#include "priceopt/price_optimizer.hpp"
#include "priceopt/sample_feed.hpp"
#include "priceopt/task_registry.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace priceopt {

// Runs search -> optimize jobs on a fixed pool of worker threads and tracks
// each one in a TaskRegistry so callers can poll for completion.
class OptimizationService {
public:
  // source and logger must outlive the service; logger may be null.
  OptimizationService(const Config &config, SampleSource &source,
                      RunLogger *logger = nullptr);
  ~OptimizationService();

  OptimizationService(const OptimizationService &) = delete;
  OptimizationService &operator=(const OptimizationService &) = delete;

  // Register a task and queue it. Returns the task id.
  std::string submit(const std::string &product_name,
                     std::optional<double> cost = std::nullopt,
                     std::optional<double> max_demand = std::nullopt);

  std::optional<TaskRecord> status(const std::string &id) const {
    return registry_.get(id);
  }

  std::optional<TaskRecord> waitFor(const std::string &id,
                                    std::chrono::milliseconds timeout) const {
    return registry_.waitForTerminal(id, timeout);
  }

  const TaskRegistry &registry() const { return registry_; }

  // Finish queued jobs, then stop the workers. Idempotent.
  void shutdown();

private:
  struct Job {
    std::string task_id;
    std::string product_name;
    std::optional<double> cost;
    std::optional<double> max_demand;
  };

  SampleSource &source_;
  RunLogger *logger_;
  PriceOptimizer optimizer_;
  TaskRegistry registry_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Job> queue_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;

  void workerLoop();
  void runJob(const Job &job);
  void fail(const std::string &id, FailureKind kind, const std::string &why);
};

} // namespace priceopt
