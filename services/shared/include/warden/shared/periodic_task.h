#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace warden::shared {

// Runs a callback on a fixed interval from a background thread until Stop()
// or destruction. The first run happens one interval after Start(). The
// callback must not throw.
class PeriodicTask {
 public:
  PeriodicTask(std::chrono::milliseconds interval, std::function<void()> task);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();
  bool running() const;

 private:
  void Run();

  std::chrono::milliseconds interval_;
  std::function<void()> task_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool stop_requested_ = false;
  bool started_ = false;
  std::thread worker_;
};

}  // namespace warden::shared
