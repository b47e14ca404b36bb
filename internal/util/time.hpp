#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace fleet::util {

/*
  Time utilities.

  Every expiry computation reads time through an injected Clock so tests can
  drive deadlines with ManualClock. Persisted timestamps are Unix milliseconds.
*/

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() = 0;
};

// Wall clock that never steps backwards across calls.
class SystemClock final : public Clock {
 public:
  TimePoint Now() override;

 private:
  std::mutex mutex_;
  TimePoint  last_{};
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{std::chrono::seconds(1'700'000'000)});

  TimePoint Now() override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  std::mutex mutex_;
  TimePoint  now_;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);

// Zero duration means "not configured" for every config field that uses it.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace fleet::util
