#include "internal/persistence/state_codec.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/events/event_log.hpp"
#include "internal/jobs/job_repository.hpp"
#include "internal/project/lock_repository.hpp"
#include "internal/project/project_repository.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1          = pipeline::store::v1;
namespace persistence = pipeline::persistence;

using google::protobuf::Value;
using pipeline::model::PipelineState;
using std::chrono::milliseconds;

const pipeline::util::TimePoint kNow = pipeline::util::FromUnixMillis(1700000000000);

v1::TreeChildRef Ref(v1::TreeChildKind kind, const std::string& id) {
  v1::TreeChildRef ref;
  ref.set_kind(kind);
  ref.set_id(id);
  return ref;
}

std::vector<std::string> Ids(const google::protobuf::RepeatedPtrField<v1::TreeChildRef>& children) {
  std::vector<std::string> ids;
  for (const auto& child : children) ids.push_back(child.id());
  return ids;
}

Value& Field(Value& record, const std::string& key) {
  return (*record.mutable_struct_value()->mutable_fields())[key];
}

Value& At(Value& list, int index) {
  return *list.mutable_list_value()->mutable_values(index);
}

v1::HierarchyNode* AddNode(google::protobuf::RepeatedPtrField<v1::HierarchyNode>* nodes, const std::string& id,
                           v1::NodeKind kind) {
  auto* node = nodes->Add();
  node->set_id(id);
  node->set_name(id);
  node->set_kind(kind);
  return node;
}

// Workspace with folders, jobs in every state, a retry pending and a lock.
PipelineState PopulatedState() {
  auto                                 state = persistence::NewState(" ws_codec ");
  pipeline::events::EventLog           events(state);
  pipeline::project::ProjectRepository projects(state, events);
  pipeline::project::LockRepository    locks(state, events);
  pipeline::jobs::JobRepository        jobs(state, events, projects);

  pipeline::model::CreateFolderInput folder_input;
  folder_input.name = "Folder";
  auto folder       = projects.CreateFolder(folder_input);

  pipeline::model::CreateProjectInput project_input;
  project_input.name             = "Nested";
  project_input.parent_folder_id = folder.folder_id();
  auto nested                    = projects.CreateProject(project_input);

  pipeline::model::SubmitJobInput submit;
  submit.project_id = nested.project_id();
  submit.kind       = "gltf.convert";
  jobs.Submit(submit, kNow);                       // job-1: will fail once and wait for retry
  jobs.Submit(submit, kNow);                       // job-2: running
  jobs.Submit(submit, kNow + milliseconds(1));     // job-3: queued

  jobs.Claim("worker-1", kNow);
  jobs.Fail("job-1", "transient", kNow);
  jobs.Claim("worker-2", kNow);

  pipeline::model::AcquireLockInput lock;
  lock.project_id     = nested.project_id();
  lock.owner_agent_id = "agent-a";
  locks.Acquire(lock, kNow);
  return state;
}

void TestRoundTripPreservesState() {
  auto original = PopulatedState();
  assert(original.workspace_id == "ws_codec");

  auto decoded = persistence::DecodeJson(persistence::EncodeJson(original));
  assert(decoded.has_value());

  assert(decoded->workspace_id == "ws_codec");
  assert(decoded->next_job_id == original.next_job_id);
  assert(decoded->next_entity_nonce == original.next_entity_nonce);
  assert(decoded->projects.size() == 1);
  assert(decoded->folders.size() == 1);
  assert(decoded->jobs.size() == 3);

  assert(decoded->jobs.at("job-1").status() == v1::JOB_STATUS_QUEUED);
  assert(decoded->jobs.at("job-1").has_next_retry_at());
  assert(decoded->jobs.at("job-2").status() == v1::JOB_STATUS_RUNNING);
  assert(decoded->leases.Has("job-2"));
  assert(decoded->pending.Contains("job-1"));
  assert(decoded->pending.Contains("job-3"));
  assert(!decoded->pending.Contains("job-2"));

  const auto& project = decoded->projects.begin()->second;
  assert(decoded->project_locks.size() == 1);
  assert(project.project_lock().owner_agent_id() == "agent-a");
  assert(project.active_job().id() == "job-2");

  // history collapses to one snapshot per project, after every old seq
  auto events = pipeline::events::EventLog(*decoded).Since(project.project_id(), -1);
  assert(events.size() == 1);
  assert(events.front().seq() == original.next_seq);
  assert(decoded->next_seq == original.next_seq + 1);
}

void TestDecodedQueueHonoursRetryTime() {
  auto decoded = persistence::Decode(persistence::Encode(PopulatedState()));
  assert(decoded.has_value());

  pipeline::events::EventLog           events(*decoded);
  pipeline::project::ProjectRepository projects(*decoded, events);
  pipeline::jobs::JobRepository        jobs(*decoded, events, projects);

  // job-3 is due now, job-1 only after its 250 ms backoff
  auto next = jobs.Claim("worker-3", kNow + milliseconds(10));
  assert(next.has_value());
  assert(next->id() == "job-3");
  assert(!jobs.Claim("worker-3", kNow + milliseconds(10)).has_value());

  auto retried = jobs.Claim("worker-3", kNow + milliseconds(250));
  assert(retried.has_value());
  assert(retried->id() == "job-1");
  assert(retried->attempt_count() == 2);
}

void TestDecodedQueueKeepsClaimOrder() {
  auto state = PopulatedState();
  {
    pipeline::events::EventLog           events(state);
    pipeline::project::ProjectRepository projects(state, events);
    pipeline::jobs::JobRepository        jobs(state, events, projects);

    pipeline::model::SubmitJobInput submit;
    submit.project_id = state.projects.begin()->first;
    submit.kind       = "gltf.convert";
    jobs.Submit(submit, kNow + milliseconds(400)); // job-4, due after job-1's retry
  }

  auto decoded = persistence::DecodeJson(persistence::EncodeJson(state));
  assert(decoded.has_value());

  pipeline::events::EventLog           events(*decoded);
  pipeline::project::ProjectRepository projects(*decoded, events);
  pipeline::jobs::JobRepository        jobs(*decoded, events, projects);

  std::vector<std::string> order;
  while (auto job = jobs.Claim("worker-3", kNow + milliseconds(500))) order.push_back(job->id());
  assert((order == std::vector<std::string>{"job-3", "job-1", "job-4"}));
}

void TestSalvagesMalformedEntries() {
  v1::PersistedPipelineState document;
  document.set_version(persistence::kPersistedStateVersion);
  document.set_workspace_id("ws_salvage");

  auto* good = document.add_projects();
  good->set_project_id("prj_good");
  good->set_name("Good");
  auto* root = AddNode(good->mutable_hierarchy(), "root", v1::NODE_KIND_BONE);
  AddNode(root->mutable_children(), "body", v1::NODE_KIND_CUBE);
  AddNode(good->mutable_hierarchy(), "tail", v1::NODE_KIND_BONE);
  AddNode(good->mutable_hierarchy(), "mesh", v1::NODE_KIND_CUBE);

  auto* bad = document.add_projects();
  bad->set_project_id("prj_bad");
  bad->set_name("Bad");

  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_PROJECT, "prj_good");
  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_PROJECT, "prj_bad");

  auto* job = document.add_jobs();
  job->set_id("job-1");
  job->set_project_id("prj_good");
  job->set_kind(v1::JOB_KIND_GLTF_CONVERT);
  job->set_status(v1::JOB_STATUS_QUEUED);
  *job->mutable_created_at() = pipeline::util::ToProto(kNow);
  document.add_queued_job_ids("job-1");

  auto text = pipeline::util::ParseJsonValue(pipeline::util::ToJson(document));
  assert(text.has_value());

  auto& project_list = Field(*text, "projects");
  Field(At(project_list, 1), "name").set_number_value(42);
  auto& nodes = Field(At(project_list, 0), "hierarchy");
  Field(At(nodes, 1), "children").set_number_value(7);
  Field(At(nodes, 2), "kind").set_string_value("mesh");
  Field(*text, "folders").mutable_list_value()->add_values()->set_string_value("junk");
  Field(*text, "queuedJobIds").mutable_list_value()->add_values()->set_number_value(5);
  Field(*text, "projectLocks").set_string_value("none");

  auto state = persistence::DecodeJson(pipeline::util::ToJson(*text));
  assert(state.has_value());
  assert(state->workspace_id == "ws_salvage");

  assert(state->projects.size() == 1);
  const auto& project = state->projects.at("prj_good");
  assert(project.hierarchy_size() == 2);
  assert(project.hierarchy(0).children_size() == 1);
  assert(project.hierarchy(1).id() == "tail");
  assert(project.hierarchy(1).children_size() == 0);
  assert(project.stats().bones() == 2);
  assert(project.stats().cubes() == 1);

  assert(state->folders.empty());
  assert((Ids(state->root_children) == std::vector<std::string>{"prj_good"}));
  assert(state->pending.Contains("job-1"));
  assert(state->project_locks.empty());
}

void TestRejectsMalformedDocumentShape() {
  v1::PersistedPipelineState document;
  document.set_version(persistence::kPersistedStateVersion);
  auto text = pipeline::util::ParseJsonValue(pipeline::util::ToJson(document));
  assert(text.has_value());
  assert(persistence::DecodeJson(pipeline::util::ToJson(*text)).has_value());

  auto missing_list = *text;
  missing_list.mutable_struct_value()->mutable_fields()->erase("jobs");
  assert(!persistence::DecodeJson(pipeline::util::ToJson(missing_list)).has_value());

  auto scalar_list = *text;
  Field(scalar_list, "projects").set_string_value("[]");
  assert(!persistence::DecodeJson(pipeline::util::ToJson(scalar_list)).has_value());

  auto string_version = *text;
  Field(string_version, "version").set_string_value("3");
  assert(!persistence::DecodeJson(pipeline::util::ToJson(string_version)).has_value());

  assert(!persistence::DecodeJson("[]").has_value());
}

void TestRejectsForeignDocuments() {
  assert(!persistence::DecodeJson("not json").has_value());

  v1::PersistedPipelineState old_version;
  old_version.set_version(2);
  assert(!persistence::Decode(old_version).has_value());

  v1::PersistedPipelineState empty;
  empty.set_version(persistence::kPersistedStateVersion);
  auto state = persistence::Decode(empty);
  assert(state.has_value());
  assert(state->workspace_id == "ws_default");
  assert(state->next_job_id == 1);
  assert(state->next_seq == 1);
}

void TestRepairsForest() {
  v1::PersistedPipelineState document;
  document.set_version(persistence::kPersistedStateVersion);
  document.set_workspace_id("ws_repair");

  // fld_a is referenced twice and lists a dangling child; fld_orphan is
  // unreachable but names fld_a as parent; prj_lost is referenced nowhere
  auto* folder_a = document.add_folders();
  folder_a->set_folder_id("fld_a");
  folder_a->set_name("A");
  *folder_a->add_children() = Ref(v1::TREE_CHILD_KIND_PROJECT, "prj_in_a");
  *folder_a->add_children() = Ref(v1::TREE_CHILD_KIND_PROJECT, "prj_dangling");
  *folder_a->add_children() = Ref(v1::TREE_CHILD_KIND_FOLDER, "fld_a");

  auto* orphan = document.add_folders();
  orphan->set_folder_id("fld_orphan");
  orphan->set_parent_folder_id("fld_a");

  auto* in_a = document.add_projects();
  in_a->set_project_id("prj_in_a");
  in_a->set_name("In A");
  in_a->set_revision(3);

  auto* lost = document.add_projects();
  lost->set_project_id("prj_lost");
  lost->set_name("Lost");
  lost->set_parent_folder_id("fld_missing");

  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_FOLDER, "fld_a");
  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_FOLDER, "fld_a");
  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_UNSPECIFIED, "junk");

  auto state = persistence::Decode(document);
  assert(state.has_value());

  assert((Ids(state->root_children) == std::vector<std::string>{"fld_a", "prj_lost"}));
  const auto& a = state->folders.at("fld_a");
  assert((Ids(a.children()) == std::vector<std::string>{"prj_in_a", "fld_orphan"}));
  assert(state->folders.at("fld_orphan").parent_folder_id() == "fld_a");
  assert(state->folders.at("fld_orphan").name() == "New Folder");
  assert(state->projects.at("prj_in_a").parent_folder_id() == "fld_a");
  assert(!state->projects.at("prj_lost").has_parent_folder_id());
  assert(state->projects.at("prj_lost").workspace_id() == "ws_repair");
}

void TestReconcilesJobsAndCounters() {
  v1::PersistedPipelineState document;
  document.set_version(persistence::kPersistedStateVersion);
  document.set_next_job_id(2);
  document.set_next_seq(1);

  auto* project = document.add_projects();
  project->set_project_id("prj_x");
  *document.add_root_children() = Ref(v1::TREE_CHILD_KIND_PROJECT, "prj_x");

  auto add_job = [&](const std::string& id, v1::JobStatus status) {
    auto* job = document.add_jobs();
    job->set_id(id);
    job->set_project_id("prj_x");
    job->set_kind(v1::JOB_KIND_GLTF_CONVERT);
    job->set_status(status);
    *job->mutable_created_at() = pipeline::util::ToProto(kNow);
    return job;
  };
  add_job("job-9", v1::JOB_STATUS_QUEUED);
  add_job("job-4", v1::JOB_STATUS_QUEUED);
  add_job("job-7", v1::JOB_STATUS_RUNNING);
  add_job("job-5", v1::JOB_STATUS_COMPLETED);
  auto* mismatched = add_job("job-6", v1::JOB_STATUS_QUEUED);
  mismatched->mutable_texture_preflight_payload();

  document.add_queued_job_ids("job-9");
  document.add_queued_job_ids("job-5");
  document.add_queued_job_ids("job-missing");

  auto* stale_lock = document.add_project_locks();
  stale_lock->set_project_id("prj_gone");
  stale_lock->mutable_lock()->set_owner_agent_id("agent");
  stale_lock->mutable_lock()->set_token("t");
  *stale_lock->mutable_lock()->mutable_expires_at() = pipeline::util::ToProto(kNow);

  auto* bucket = document.add_project_events();
  bucket->set_project_id("prj_x");
  bucket->add_events()->set_seq(41);

  auto state = persistence::Decode(document);
  assert(state.has_value());

  assert(!state->jobs.contains("job-6"));
  assert(state->next_job_id == 10);
  assert(state->next_seq == 43);
  assert(state->project_locks.empty());
  assert((state->pending.OrderedIds() == std::vector<std::string>{"job-9", "job-4"}));
  assert(state->leases.Has("job-7"));

  // a running job without a recorded lease is recovered by the next claim
  pipeline::events::EventLog           events(*state);
  pipeline::project::ProjectRepository projects(*state, events);
  pipeline::jobs::JobRepository        jobs(*state, events, projects);
  assert(jobs.SweepExpiredLeases(kNow) == 1);
  assert(state->jobs.at("job-7").status() == v1::JOB_STATUS_QUEUED);
}

} // namespace

int main() {
  TestRoundTripPreservesState();
  TestDecodedQueueHonoursRetryTime();
  TestDecodedQueueKeepsClaimOrder();
  TestSalvagesMalformedEntries();
  TestRejectsMalformedDocumentShape();
  TestRejectsForeignDocuments();
  TestRepairsForest();
  TestReconcilesJobsAndCounters();

  std::cout << "state_codec_test: pass\n";
  return 0;
}
