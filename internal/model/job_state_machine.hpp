#pragma once

#include "pipeline/store/v1.hpp"

namespace pipeline::model {

namespace v1 = pipeline::store::v1;

/*
  queued -> running -> completed
  running -> queued  (retry or lease expiry)
  running -> failed  (dead letter)

  complete/fail are also accepted straight from queued, so a caller can
  resolve a job it never claimed. Nothing leaves completed or failed.
*/

constexpr bool IsTerminal(v1::JobStatus status) {
  return status == v1::JOB_STATUS_COMPLETED || status == v1::JOB_STATUS_FAILED;
}

constexpr const char* StatusName(v1::JobStatus status) {
  switch (status) {
    case v1::JOB_STATUS_QUEUED:
      return "queued";
    case v1::JOB_STATUS_RUNNING:
      return "running";
    case v1::JOB_STATUS_COMPLETED:
      return "completed";
    case v1::JOB_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace pipeline::model
