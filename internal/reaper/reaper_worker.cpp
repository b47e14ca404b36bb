#include "reaper_worker.hpp"

#include <exception>

#include "internal/core/ttl_reaper.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::reaper {

ReaperWorker::ReaperWorker(std::shared_ptr<fleet::core::TtlReaper> reaper, std::chrono::milliseconds interval)
    : reaper_(std::move(reaper)), interval_(interval) {
}

ReaperWorker::~ReaperWorker() {
  Stop();
}

void ReaperWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&ReaperWorker::Run, this);
  FLEET_LOG_INFO("reaper started", {observability::IntField("interval_ms", interval_.count())});
}

void ReaperWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ReaperWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      reaper_->Sweep();
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("reaper sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace fleet::reaper
