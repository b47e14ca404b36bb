#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace fleet::core {
class TtlReaper;
}

namespace fleet::reaper {

/*
  Background thread that runs TtlReaper::Sweep on a fixed interval.

  A failed sweep is logged and the next one runs on schedule.
  Stop() wakes the thread immediately and joins it.
*/
class ReaperWorker {
 public:
  ReaperWorker(std::shared_ptr<fleet::core::TtlReaper> reaper, std::chrono::milliseconds interval);
  ~ReaperWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<fleet::core::TtlReaper> reaper_;
  std::chrono::milliseconds               interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace fleet::reaper
