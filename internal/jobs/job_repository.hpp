#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/events/event_log.hpp"
#include "internal/model/inputs.hpp"
#include "internal/model/pipeline_state.hpp"
#include "internal/project/project_repository.hpp"
#include "internal/util/time.hpp"

namespace pipeline::jobs {

namespace v1 = pipeline::store::v1;

inline constexpr int64_t     kRetryBaseBackoffMs = 250;
inline constexpr int64_t     kMaxRetryBackoffMs  = 5000;
inline constexpr const char* kJobIdPrefix        = "job-";

// min(5000, 250 * 2^max(0, attempt_count - 1))
int64_t ComputeRetryBackoffMs(int32_t attempt_count);

// Numeric part of "job-<n>"; 0 for anything else.
uint64_t ParseJobCounter(const std::string& job_id);

/*
  JobRepository

  Job lifecycle over PipelineState:

    Submit    validate kind/payload, clamp limits, enqueue
    Claim     sweep expired leases, pop the earliest due job, lease it
    Complete  store normalized result, project it onto the project
    Fail      retry with backoff or dead-letter

  Every transition either updates job, pending/lease indexes, project
  projection and event log together, or throws before touching any of
  them. Unknown job ids return nullopt.
*/
class JobRepository {
 public:
  JobRepository(model::PipelineState& state, events::EventLog& events, project::ProjectRepository& projects)
      : state_(state), events_(events), projects_(projects) {
  }

  // Throws util::ContractViolation before any mutation.
  v1::Job Submit(const model::SubmitJobInput& input, util::TimePoint now);

  std::optional<v1::Job> Claim(const std::string& worker_id, util::TimePoint now);

  // `result` may be nullptr. Throws util::ContractViolation for a
  // malformed result, util::InvalidState for a terminal job.
  std::optional<v1::Job> Complete(const std::string& job_id, const google::protobuf::Value* result, util::TimePoint now);

  std::optional<v1::Job> Fail(const std::string& job_id, const std::string& error, util::TimePoint now);

  // Oldest first.
  std::vector<v1::Job>   ListProjectJobs(const std::string& project_id) const;
  std::optional<v1::Job> Get(const std::string& job_id) const;

  // Returns running jobs whose lease expired at `now` to the queue.
  // Returns how many were recovered.
  int SweepExpiredLeases(util::TimePoint now);

 private:
  void EnsureNotTerminal(const v1::Job& job) const;
  void ApplyProjection(const v1::Job& job, v1::JobStatus active_status, bool bump_revision);

  model::PipelineState&       state_;
  events::EventLog&           events_;
  project::ProjectRepository& projects_;
};

} // namespace pipeline::jobs
