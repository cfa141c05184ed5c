#include "job_repository.hpp"

#include <algorithm>
#include <charconv>

#include "internal/contracts/job_contracts.hpp"
#include "internal/model/job_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/project/snapshot_sync.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::jobs {

using observability::IntField;
using observability::StringField;

namespace {

std::string AllocateJobId(model::PipelineState& state) {
  return kJobIdPrefix + std::to_string(state.next_job_id++);
}

void RecordOutcome(const v1::Job& job, std::string_view outcome) {
  observability::Metrics::Instance().RecordJobOutcome(contracts::KindName(job.kind()), outcome);
}

} // namespace

int64_t ComputeRetryBackoffMs(int32_t attempt_count) {
  const int32_t exponent = std::max(0, attempt_count - 1);
  // 250 * 2^5 already exceeds the cap
  if (exponent >= 5) return kMaxRetryBackoffMs;
  return std::min(kMaxRetryBackoffMs, kRetryBaseBackoffMs << exponent);
}

uint64_t ParseJobCounter(const std::string& job_id) {
  const std::string_view prefix(kJobIdPrefix);
  if (job_id.size() <= prefix.size() || job_id.compare(0, prefix.size(), prefix) != 0) return 0;

  uint64_t    value = 0;
  const char* begin = job_id.data() + prefix.size();
  const char* end   = job_id.data() + job_id.size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return 0;
  return value;
}

void JobRepository::EnsureNotTerminal(const v1::Job& job) const {
  if (model::IsTerminal(job.status())) {
    throw util::InvalidState("Job " + job.id() + " is already " + model::StatusName(job.status()) + ".");
  }
}

void JobRepository::ApplyProjection(const v1::Job& job, v1::JobStatus active_status, bool bump_revision) {
  auto* project = projects_.Find(job.project_id());
  if (!project) return;

  if (bump_revision) project->set_revision(project->revision() + 1);
  auto* active = project->mutable_active_job();
  active->set_id(job.id());
  active->set_status(active_status);
  events_.Append(*project);
}

v1::Job JobRepository::Submit(const model::SubmitJobInput& input, util::TimePoint now) {
  const auto project_id = contracts::NormalizeProjectId(input.project_id);

  v1::Job job;
  job.set_kind(contracts::NormalizeJobKind(input.kind));
  contracts::ApplyJobPayload(job.kind(), input.payload ? &*input.payload : nullptr, &job);
  job.set_max_attempts(static_cast<int32_t>(contracts::ClampInteger(input.max_attempts, contracts::kMinMaxAttempts,
                                                                    contracts::kMaxMaxAttempts, contracts::kDefaultMaxAttempts)));
  job.set_lease_ms(contracts::ClampInteger(input.lease_ms, contracts::kMinLeaseMs, contracts::kMaxLeaseMs, contracts::kDefaultLeaseMs));

  auto& project = projects_.EnsureProject(project_id);

  job.set_id(AllocateJobId(state_));
  job.set_project_id(project.project_id());
  job.set_status(v1::JOB_STATUS_QUEUED);
  job.set_attempt_count(0);
  *job.mutable_created_at() = util::ToProto(now);

  state_.jobs[job.id()] = job;
  state_.pending.EnqueueUnique(job.id(), util::ToUnixMillis(now));

  ApplyProjection(job, v1::JOB_STATUS_QUEUED, false);
  RecordOutcome(job, "submitted");
  return job;
}

int JobRepository::SweepExpiredLeases(util::TimePoint now) {
  const auto now_ms    = util::ToUnixMillis(now);
  int        recovered = 0;
  for (const auto& job_id : state_.leases.CollectExpired(now_ms)) {
    auto it = state_.jobs.find(job_id);
    if (it == state_.jobs.end() || it->second.status() != v1::JOB_STATUS_RUNNING) continue;
    auto& job = it->second;

    if (job.has_lease_expires_at() && util::ToUnixMillis(job.lease_expires_at()) > now_ms) {
      state_.leases.Insert(job_id, util::ToUnixMillis(job.lease_expires_at()));
      continue;
    }

    PIPELINE_LOG_INFO("job lease expired", {StringField("job_id", job.id()), StringField("worker_id", job.worker_id()),
                                            IntField("attempt_count", job.attempt_count())});

    job.set_status(v1::JOB_STATUS_QUEUED);
    job.clear_worker_id();
    job.clear_started_at();
    job.clear_lease_expires_at();
    state_.pending.EnqueueUnique(job.id(), now_ms);
    RecordOutcome(job, "lease_expired");
    ++recovered;
  }
  return recovered;
}

std::optional<v1::Job> JobRepository::Claim(const std::string& worker_id, util::TimePoint now) {
  SweepExpiredLeases(now);

  const auto now_ms = util::ToUnixMillis(now);
  while (auto next_id = state_.pending.PopDue(now_ms)) {
    auto it = state_.jobs.find(*next_id);
    if (it == state_.jobs.end() || it->second.status() != v1::JOB_STATUS_QUEUED) continue;
    auto& job = it->second;

    if (job.has_next_retry_at()) {
      const auto retry_ms = util::ToUnixMillis(job.next_retry_at());
      if (retry_ms > now_ms) {
        state_.pending.Schedule(job.id(), retry_ms);
        continue;
      }
      job.clear_next_retry_at();
    }

    const auto expires = now + std::chrono::milliseconds(job.lease_ms());
    job.set_status(v1::JOB_STATUS_RUNNING);
    job.set_worker_id(worker_id);
    *job.mutable_started_at() = util::ToProto(now);
    job.set_attempt_count(job.attempt_count() + 1);
    *job.mutable_lease_expires_at() = util::ToProto(expires);
    job.clear_error();
    job.clear_completed_at();
    job.set_dead_letter(false);
    state_.leases.Insert(job.id(), util::ToUnixMillis(expires));

    ApplyProjection(job, v1::JOB_STATUS_RUNNING, false);
    RecordOutcome(job, "claimed");
    return job;
  }
  return std::nullopt;
}

std::optional<v1::Job> JobRepository::Complete(const std::string& job_id, const google::protobuf::Value* result, util::TimePoint now) {
  auto it = state_.jobs.find(job_id);
  if (it == state_.jobs.end()) return std::nullopt;
  auto& job = it->second;

  EnsureNotTerminal(job);
  auto normalized = contracts::NormalizeJobResult(job.kind(), result);

  job.set_status(v1::JOB_STATUS_COMPLETED);
  if (normalized) {
    *job.mutable_result() = std::move(*normalized);
  } else {
    job.clear_result();
  }
  *job.mutable_completed_at() = util::ToProto(now);
  job.clear_next_retry_at();
  job.clear_lease_expires_at();
  job.set_dead_letter(false);
  state_.leases.Remove(job.id());
  state_.pending.Remove(job.id());

  if (auto* project = projects_.Find(job.project_id()); project && job.kind() == v1::JOB_KIND_GLTF_CONVERT) {
    if (job.has_result() && job.result().has_gltf_convert() && job.result().gltf_convert().has_hierarchy()) {
      *project->mutable_hierarchy() = job.result().gltf_convert().hierarchy().nodes();
    }
    project::SynchronizeSnapshot(*project);
  }

  ApplyProjection(job, v1::JOB_STATUS_COMPLETED, true);
  RecordOutcome(job, "completed");
  return job;
}

std::optional<v1::Job> JobRepository::Fail(const std::string& job_id, const std::string& error, util::TimePoint now) {
  auto it = state_.jobs.find(job_id);
  if (it == state_.jobs.end()) return std::nullopt;
  auto& job = it->second;

  EnsureNotTerminal(job);

  job.set_error(error);
  job.clear_lease_expires_at();
  state_.leases.Remove(job.id());

  const bool retry = job.attempt_count() < job.max_attempts();
  if (retry) {
    const auto retry_at = now + std::chrono::milliseconds(ComputeRetryBackoffMs(job.attempt_count()));
    job.set_status(v1::JOB_STATUS_QUEUED);
    *job.mutable_next_retry_at() = util::ToProto(retry_at);
    job.clear_completed_at();
    job.clear_worker_id();
    job.clear_started_at();
    state_.pending.Schedule(job.id(), util::ToUnixMillis(retry_at));
  } else {
    job.set_status(v1::JOB_STATUS_FAILED);
    job.set_dead_letter(true);
    *job.mutable_completed_at() = util::ToProto(now);
    job.clear_next_retry_at();
    state_.pending.Remove(job.id());

    PIPELINE_LOG_WARN("job dead-lettered", {StringField("job_id", job.id()), StringField("project_id", job.project_id()),
                                            IntField("attempt_count", job.attempt_count()), StringField("error", error)});
  }

  ApplyProjection(job, retry ? v1::JOB_STATUS_QUEUED : v1::JOB_STATUS_FAILED, true);
  RecordOutcome(job, retry ? "retried" : "dead_lettered");
  return job;
}

std::vector<v1::Job> JobRepository::ListProjectJobs(const std::string& project_id) const {
  std::vector<v1::Job> out;
  for (const auto& [_, job] : state_.jobs) {
    if (job.project_id() == project_id) out.push_back(job);
  }
  std::stable_sort(out.begin(), out.end(), [](const v1::Job& a, const v1::Job& b) {
    const auto a_ms = util::ToUnixMillis(a.created_at());
    const auto b_ms = util::ToUnixMillis(b.created_at());
    if (a_ms != b_ms) return a_ms < b_ms;
    return ParseJobCounter(a.id()) < ParseJobCounter(b.id());
  });
  return out;
}

std::optional<v1::Job> JobRepository::Get(const std::string& job_id) const {
  auto it = state_.jobs.find(job_id);
  if (it == state_.jobs.end()) return std::nullopt;
  return it->second;
}

} // namespace pipeline::jobs
