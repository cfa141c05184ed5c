#include "internal/jobs/job_repository.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <string>

#include "internal/events/event_log.hpp"
#include "internal/persistence/state_codec.hpp"
#include "internal/project/project_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace {

namespace v1 = pipeline::store::v1;

using pipeline::jobs::ComputeRetryBackoffMs;
using pipeline::jobs::JobRepository;
using pipeline::jobs::ParseJobCounter;
using pipeline::model::SubmitJobInput;
using std::chrono::milliseconds;

struct Fixture {
  pipeline::model::PipelineState      state = pipeline::persistence::NewState("ws_jobs");
  pipeline::events::EventLog          events{state};
  pipeline::project::ProjectRepository projects{state, events};
  JobRepository                       jobs{state, events, projects};
  pipeline::util::TimePoint           now = pipeline::util::FromUnixMillis(1700000000000);
};

SubmitJobInput Input(const std::string& project_id, const std::string& kind = "gltf.convert") {
  SubmitJobInput input;
  input.project_id = project_id;
  input.kind       = kind;
  return input;
}

google::protobuf::Value Json(const std::string& text) {
  auto value = pipeline::util::ParseJsonValue(text);
  assert(value.has_value());
  return *value;
}

void TestBackoffAndCounterHelpers() {
  assert(ComputeRetryBackoffMs(0) == 250);
  assert(ComputeRetryBackoffMs(1) == 250);
  assert(ComputeRetryBackoffMs(2) == 500);
  assert(ComputeRetryBackoffMs(3) == 1000);
  assert(ComputeRetryBackoffMs(5) == 4000);
  assert(ComputeRetryBackoffMs(6) == 5000);
  assert(ComputeRetryBackoffMs(40) == 5000);

  assert(ParseJobCounter("job-12") == 12);
  assert(ParseJobCounter("job-") == 0);
  assert(ParseJobCounter("job-1a") == 0);
  assert(ParseJobCounter("task-3") == 0);
}

void TestSubmitCreatesProjectAndQueuesJob() {
  Fixture f;
  auto    job = f.jobs.Submit(Input("prj_alpha"), f.now);

  assert(job.id() == "job-1");
  assert(job.project_id() == "prj_alpha");
  assert(job.status() == v1::JOB_STATUS_QUEUED);
  assert(job.attempt_count() == 0);
  assert(job.max_attempts() == 3);
  assert(job.lease_ms() == 30000);
  assert(f.state.pending.Contains("job-1"));

  auto project = f.projects.Get("prj_alpha");
  assert(project.has_value());
  assert(project->name() == "prj_alpha");
  assert(project->revision() == 1);
  assert(project->active_job().id() == "job-1");
  assert(project->active_job().status() == v1::JOB_STATUS_QUEUED);

  // one snapshot for the new project, one for the queued job
  assert(f.events.Since("prj_alpha", -1).size() == 2);
  assert(f.state.root_children.size() == 1);
}

void TestSubmitRejectsBadInputWithoutSideEffects() {
  Fixture f;
  auto    input = Input("prj_beta");
  input.kind    = "unknown.kind";

  bool threw = false;
  try {
    f.jobs.Submit(input, f.now);
  } catch (const pipeline::util::ContractViolation&) {
    threw = true;
  }
  assert(threw);

  auto with_payload    = Input("prj_beta");
  with_payload.payload = Json(R"({"optimize":"yes"})");
  threw                = false;
  try {
    f.jobs.Submit(with_payload, f.now);
  } catch (const pipeline::util::ContractViolation&) {
    threw = true;
  }
  assert(threw);

  assert(f.state.jobs.empty());
  assert(f.state.projects.empty());
  assert(f.state.next_job_id == 1);
  assert(f.state.project_events.empty());
}

void TestSubmitRequiresProjectId() {
  Fixture f;
  for (const char* blank : {"", "   "}) {
    bool threw = false;
    try {
      f.jobs.Submit(Input(blank), f.now);
    } catch (const pipeline::util::ContractViolation& e) {
      threw = std::string(e.what()) == "projectId is required";
    }
    assert(threw);
  }
  assert(f.state.jobs.empty());
  assert(f.state.projects.empty());
  assert(f.state.root_children.empty());
  assert(f.state.pending.Empty());

  auto job = f.jobs.Submit(Input("  prj_trim "), f.now);
  assert(job.project_id() == "prj_trim");
  assert(f.state.projects.contains("prj_trim"));
}

void TestSubmitClampsLimits() {
  Fixture f;

  auto high         = Input("prj_clamp");
  high.max_attempts = 99;
  high.lease_ms     = 1e9;
  auto job          = f.jobs.Submit(high, f.now);
  assert(job.max_attempts() == 10);
  assert(job.lease_ms() == 300000);

  auto low         = Input("prj_clamp");
  low.max_attempts = 0;
  low.lease_ms     = 1;
  job              = f.jobs.Submit(low, f.now);
  assert(job.max_attempts() == 1);
  assert(job.lease_ms() == 5000);

  auto nan         = Input("prj_clamp");
  nan.max_attempts = std::numeric_limits<double>::quiet_NaN();
  job              = f.jobs.Submit(nan, f.now);
  assert(job.max_attempts() == 3);
}

void TestClaimLeasesOldestDueJob() {
  Fixture f;
  f.jobs.Submit(Input("prj_a"), f.now);
  f.jobs.Submit(Input("prj_b", "texture.preflight"), f.now);

  auto first = f.jobs.Claim("worker-1", f.now);
  assert(first.has_value());
  assert(first->id() == "job-1");
  assert(first->status() == v1::JOB_STATUS_RUNNING);
  assert(first->worker_id() == "worker-1");
  assert(first->attempt_count() == 1);
  assert(pipeline::util::ToUnixMillis(first->lease_expires_at()) == pipeline::util::ToUnixMillis(f.now) + 30000);
  assert(f.state.leases.Has("job-1"));

  auto second = f.jobs.Claim("worker-2", f.now);
  assert(second.has_value());
  assert(second->id() == "job-2");

  assert(!f.jobs.Claim("worker-3", f.now).has_value());
  assert(f.projects.Get("prj_a")->active_job().status() == v1::JOB_STATUS_RUNNING);
}

void TestFailRetriesWithBackoffThenDeadLetters() {
  Fixture f;
  auto    input     = Input("prj_retry");
  input.max_attempts = 2;
  f.jobs.Submit(input, f.now);

  f.jobs.Claim("worker-1", f.now);
  auto retried = f.jobs.Fail("job-1", "boom", f.now);
  assert(retried.has_value());
  assert(retried->status() == v1::JOB_STATUS_QUEUED);
  assert(retried->error() == "boom");
  assert(!retried->has_worker_id());
  assert(pipeline::util::ToUnixMillis(retried->next_retry_at()) == pipeline::util::ToUnixMillis(f.now) + 250);
  assert(f.projects.Get("prj_retry")->revision() == 2);

  // not due yet
  assert(!f.jobs.Claim("worker-2", f.now + milliseconds(249)).has_value());

  auto again = f.jobs.Claim("worker-2", f.now + milliseconds(250));
  assert(again.has_value());
  assert(again->attempt_count() == 2);
  assert(!again->has_next_retry_at());
  assert(!again->has_error());

  auto dead = f.jobs.Fail("job-1", "boom again", f.now + milliseconds(300));
  assert(dead->status() == v1::JOB_STATUS_FAILED);
  assert(dead->dead_letter());
  assert(dead->has_completed_at());
  assert(!f.state.pending.Contains("job-1"));
  assert(!f.state.leases.Has("job-1"));

  auto project = f.projects.Get("prj_retry");
  assert(project->revision() == 3);
  assert(project->active_job().status() == v1::JOB_STATUS_FAILED);
}

void TestExpiredLeaseReturnsJobToQueue() {
  Fixture f;
  auto    input = Input("prj_lease");
  input.lease_ms = 5000;
  f.jobs.Submit(input, f.now);

  f.jobs.Claim("worker-1", f.now);
  assert(!f.jobs.Claim("worker-2", f.now + milliseconds(4999)).has_value());

  auto reclaimed = f.jobs.Claim("worker-2", f.now + milliseconds(5000));
  assert(reclaimed.has_value());
  assert(reclaimed->id() == "job-1");
  assert(reclaimed->worker_id() == "worker-2");
  assert(reclaimed->attempt_count() == 2);
}

void TestSweepRecoversWithoutClaiming() {
  Fixture f;
  auto    input = Input("prj_sweep");
  input.lease_ms = 5000;
  f.jobs.Submit(input, f.now);
  f.jobs.Claim("worker-1", f.now);

  assert(f.jobs.SweepExpiredLeases(f.now + milliseconds(10)) == 0);
  assert(f.jobs.SweepExpiredLeases(f.now + milliseconds(6000)) == 1);

  auto job = f.jobs.Get("job-1");
  assert(job->status() == v1::JOB_STATUS_QUEUED);
  assert(!job->has_worker_id());
  assert(!job->has_lease_expires_at());
  assert(f.state.pending.Contains("job-1"));
}

void TestCompleteAppliesHierarchyAndBumpsRevision() {
  Fixture f;
  f.jobs.Submit(Input("prj_done"), f.now);
  f.jobs.Claim("worker-1", f.now);

  const auto result = Json(R"({
    "kind": "gltf.convert",
    "status": "converted",
    "hierarchy": [
      {"id": "root", "name": "Root", "kind": "bone", "children": [
        {"id": "body", "name": "Body", "kind": "cube", "children": []},
        {"id": "head", "name": "Head", "kind": "cube", "children": []}
      ]}
    ]
  })");

  auto done = f.jobs.Complete("job-1", &result, f.now + milliseconds(10));
  assert(done.has_value());
  assert(done->status() == v1::JOB_STATUS_COMPLETED);
  assert(done->result().status() == "converted");
  assert(!f.state.leases.Has("job-1"));

  auto project = f.projects.Get("prj_done");
  assert(project->revision() == 2);
  assert(project->has_geometry());
  assert(project->stats().bones() == 1);
  assert(project->stats().cubes() == 2);
  assert(project->hierarchy_size() == 1);
  assert(project->active_job().status() == v1::JOB_STATUS_COMPLETED);
}

void TestTerminalJobsRejectFurtherResolution() {
  Fixture f;
  f.jobs.Submit(Input("prj_terminal", "texture.preflight"), f.now);
  f.jobs.Claim("worker-1", f.now);
  f.jobs.Complete("job-1", nullptr, f.now);

  bool threw = false;
  try {
    f.jobs.Fail("job-1", "late", f.now);
  } catch (const pipeline::util::InvalidState& e) {
    threw = std::string(e.what()) == "Job job-1 is already completed.";
  }
  assert(threw);

  assert(!f.jobs.Complete("job-missing", nullptr, f.now).has_value());
  assert(!f.jobs.Fail("job-missing", "x", f.now).has_value());
}

void TestMalformedResultLeavesJobRunning() {
  Fixture f;
  f.jobs.Submit(Input("prj_bad"), f.now);
  f.jobs.Claim("worker-1", f.now);
  const auto before_seq = f.state.next_seq;

  const auto result = Json(R"({"kind":"texture.preflight"})");
  bool       threw  = false;
  try {
    f.jobs.Complete("job-1", &result, f.now);
  } catch (const pipeline::util::ContractViolation&) {
    threw = true;
  }
  assert(threw);
  assert(f.jobs.Get("job-1")->status() == v1::JOB_STATUS_RUNNING);
  assert(f.state.leases.Has("job-1"));
  assert(f.state.next_seq == before_seq);
}

void TestListProjectJobsOrdersByCreationThenCounter() {
  Fixture f;
  for (int i = 0; i < 11; ++i) f.jobs.Submit(Input("prj_list"), f.now);
  f.jobs.Submit(Input("prj_other"), f.now);

  auto listed = f.jobs.ListProjectJobs("prj_list");
  assert(listed.size() == 11);
  assert(listed.front().id() == "job-1");
  assert(listed[9].id() == "job-10");
  assert(listed.back().id() == "job-11");
  assert(f.jobs.ListProjectJobs("prj_none").empty());
}

} // namespace

int main() {
  TestBackoffAndCounterHelpers();
  TestSubmitCreatesProjectAndQueuesJob();
  TestSubmitRejectsBadInputWithoutSideEffects();
  TestSubmitRequiresProjectId();
  TestSubmitClampsLimits();
  TestClaimLeasesOldestDueJob();
  TestFailRetriesWithBackoffThenDeadLetters();
  TestExpiredLeaseReturnsJobToQueue();
  TestSweepRecoversWithoutClaiming();
  TestCompleteAppliesHierarchyAndBumpsRevision();
  TestTerminalJobsRejectFurtherResolution();
  TestMalformedResultLeavesJobRunning();
  TestListProjectJobsOrdersByCreationThenCounter();

  std::cout << "job_repository_test: pass\n";
  return 0;
}
