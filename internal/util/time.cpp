#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace workflow::util {

namespace {

constexpr int64_t kMinuteMs = 60 * 1000;
constexpr int64_t kHourMs   = 60 * kMinuteMs;
constexpr int64_t kDayMs    = 24 * kHourMs;

TimePoint AlignUp(TimePoint tp, int64_t step_ms) {
  const auto ms = static_cast<int64_t>(ToUnixMillis(tp));
  return FromUnixMillis(static_cast<uint64_t>((ms / step_ms + 1) * step_ms));
}

} // namespace

uint64_t Clock::NowMillis() const {
  return ToUnixMillis(Now());
}

TimePoint WallClock::Now() const {
  return SystemClock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint now) {
  std::lock_guard lock(mutex_);
  now_ = now;
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

TimePoint Now() {
  return SystemClock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

TimePoint NextMinuteBoundary(TimePoint tp) {
  return AlignUp(tp, kMinuteMs);
}

TimePoint NextUtcMidnight(TimePoint tp) {
  return AlignUp(tp, kDayMs);
}

TimePoint HourBucket(TimePoint tp) {
  const auto ms = static_cast<int64_t>(ToUnixMillis(tp));
  return FromUnixMillis(static_cast<uint64_t>(ms / kHourMs * kHourMs));
}

std::string FormatIso8601(TimePoint tp) {
  const auto  ms      = ToUnixMillis(tp);
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm     utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return out.str();
}

} // namespace workflow::util
