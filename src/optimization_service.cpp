#include "priceopt/optimization_service.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace priceopt {

OptimizationService::OptimizationService(const Config &config,
                                         SampleSource &source,
                                         RunLogger *logger)
    : source_(source), logger_(logger), optimizer_(config) {
  int n = std::max(1, config.worker_threads);
  workers_.reserve(n);
  for (int i = 0; i < n; i++)
    workers_.emplace_back(&OptimizationService::workerLoop, this);
  spdlog::debug("[Service] Started {} workers", n);
}

OptimizationService::~OptimizationService() { shutdown(); }

std::string OptimizationService::submit(const std::string &product_name,
                                        std::optional<double> cost,
                                        std::optional<double> max_demand) {
  auto id = registry_.create(
      makeTaskId(product_name, std::chrono::system_clock::now()),
      product_name);
  bool rejected = false;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stopping_)
      rejected = true;
    else
      queue_.push_back({id, product_name, cost, max_demand});
  }
  if (rejected) {
    fail(id, FailureKind::SHUTDOWN, "service is shutting down");
    return id;
  }
  queue_cv_.notify_one();
  spdlog::info("[Service] Queued task {}", id);
  return id;
}

void OptimizationService::shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  workers_.clear();
}

void OptimizationService::workerLoop() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return; // stopping and drained
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    runJob(job);
  }
}

void OptimizationService::fail(const std::string &id, FailureKind kind,
                               const std::string &why) {
  registry_.update(id, [&](TaskRecord &rec) {
    rec.status = TaskStatus::FAILED;
    rec.failure = kind;
    rec.error = why;
    rec.completion_time = wallClockString(std::chrono::system_clock::now());
  });
}

void OptimizationService::runJob(const Job &job) {
  try {
    // ── Step 1: Samples ──
    registry_.update(job.task_id, [](TaskRecord &rec) {
      rec.status = TaskStatus::SEARCHING;
    });
    SampleBatch batch = source_.fetch(job.product_name);

    if (batch.prices.empty() || batch.ratings.empty()) {
      fail(job.task_id, FailureKind::EMPTY_INPUT, "No product data found");
    } else {
      // ── Step 2: Optimize ──
      registry_.update(job.task_id, [&](TaskRecord &rec) {
        rec.status = TaskStatus::OPTIMIZING;
        rec.product_count = batch.prices.size();
      });

      auto outcome = optimizer_.run(batch.prices, batch.ratings, job.cost,
                                    job.max_demand);
      if (!outcome) {
        fail(job.task_id, outcome.failure,
             std::string("Optimization failed: ") + outcome.detail);
      } else {
        registry_.update(job.task_id, [&](TaskRecord &rec) {
          rec.status = TaskStatus::COMPLETED;
          rec.result = *outcome;
          rec.completion_time =
              wallClockString(std::chrono::system_clock::now());
        });
      }
    }
  } catch (const std::exception &e) {
    spdlog::error("[Service] Error in task {}: {}", job.task_id, e.what());
    fail(job.task_id, FailureKind::INTERNAL, e.what());
  }

  if (logger_) {
    if (auto rec = registry_.get(job.task_id)) {
      if (rec->status == TaskStatus::COMPLETED && rec->result)
        logger_->logDemand(rec->result->demand_parameters, rec->product_name);
      logger_->logRun(*rec);
    }
  }
}

} // namespace priceopt
