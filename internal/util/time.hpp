#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace pipeline::util {

/*
  Time utilities. Every store reads time through a ClockSource so tests
  can drive lease expiry and retry backoff deterministically.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t ToUnixMillis(const google::protobuf::Timestamp& ts);

// RFC 3339 rendering used in error messages and lock conflict details.
std::string ToIso8601(const google::protobuf::Timestamp& ts);

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClockSource final : public ClockSource {
 public:
  TimePoint Now() const override;
};

class ManualClockSource final : public ClockSource {
 public:
  explicit ManualClockSource(TimePoint start = util::Now());

  TimePoint Now() const override;

  void Advance(std::chrono::milliseconds delta);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace pipeline::util
