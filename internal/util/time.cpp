#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace pipeline::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t ToUnixMillis(const google::protobuf::Timestamp& ts) {
  return ToUnixMillis(FromProto(ts));
}

std::string ToIso8601(const google::protobuf::Timestamp& ts) {
  return google::protobuf::util::TimeUtil::ToString(ts);
}

TimePoint SystemClockSource::Now() const {
  return Clock::now();
}

ManualClockSource::ManualClockSource(TimePoint start) : now_(start) {
}

TimePoint ManualClockSource::Now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClockSource::Advance(std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

void ManualClockSource::Set(TimePoint tp) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = tp;
}

} // namespace pipeline::util
