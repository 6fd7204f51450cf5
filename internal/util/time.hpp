#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace workflow::util {

/*
  Time utilities. All clock reads go through a Clock.

  Components receive a Clock so lease expiry, backoff and quota reset
  estimates can be driven by a ManualClock in tests.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  uint64_t NowMillis() const;
};

class WallClock final : public Clock {
 public:
  TimePoint Now() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Set(TimePoint now);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Truncation to UTC clock boundaries (quota reset estimation).
TimePoint NextMinuteBoundary(TimePoint tp);
TimePoint NextUtcMidnight(TimePoint tp);
TimePoint HourBucket(TimePoint tp);

// 2024-01-31T12:00:00.000Z
std::string FormatIso8601(TimePoint tp);

} // namespace workflow::util
