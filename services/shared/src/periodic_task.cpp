#include "warden/shared/periodic_task.h"

#include <stdexcept>
#include <utility>

namespace warden::shared {

PeriodicTask::PeriodicTask(std::chrono::milliseconds interval,
                           std::function<void()> task)
    : interval_(interval), task_(std::move(task)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("periodic task interval must be positive");
  }
  if (!task_) {
    throw std::invalid_argument("periodic task callback is required");
  }
}

PeriodicTask::~PeriodicTask() { Stop(); }

void PeriodicTask::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return;
  }
  started_ = true;
  stop_requested_ = false;
  worker_ = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
      return;
    }
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = false;
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stop_requested_;
}

void PeriodicTask::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    task_();
    lock.lock();
  }
}

}  // namespace warden::shared
