#include "priceopt/task_registry.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace priceopt {

std::string makeTaskId(const std::string &product_name,
                       std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&t, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, "%Y%m%d%H%M%S") << '_';
  for (char c : product_name)
    ss << (c == ' ' ? '_' : c);
  return ss.str();
}

std::string TaskRegistry::create(const std::string &base_id,
                                 const std::string &product_name) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string id = base_id;
  for (int n = 2; tasks_.count(id); n++)
    id = base_id + "_" + std::to_string(n);

  TaskRecord rec;
  rec.id = id;
  rec.product_name = product_name;
  rec.status = TaskStatus::RUNNING;
  rec.start_time = wallClockString(std::chrono::system_clock::now());
  tasks_.emplace(id, std::move(rec));
  order_.push_back(id);
  return id;
}

bool TaskRegistry::update(const std::string &id,
                          const std::function<void(TaskRecord &)> &fn) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
      return false;
    fn(it->second);
  }
  changed_.notify_all();
  return true;
}

std::optional<TaskRecord> TaskRegistry::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return std::nullopt;
  return it->second;
}

std::optional<TaskRecord>
TaskRegistry::waitForTerminal(const std::string &id,
                              std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  if (!tasks_.count(id))
    return std::nullopt;
  changed_.wait_for(lock, timeout,
                    [&] { return isTerminal(tasks_.at(id).status); });
  return tasks_.at(id);
}

std::vector<std::string> TaskRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  return order_;
}

} // namespace priceopt
