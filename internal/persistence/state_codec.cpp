#include "state_codec.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "internal/events/event_log.hpp"
#include "internal/jobs/job_repository.hpp"
#include "internal/project/snapshot_sync.hpp"
#include "internal/util/proto_json.hpp"

namespace pipeline::persistence {

namespace {

constexpr const char* kFallbackWorkspaceId = "ws_default";

using ChildList = google::protobuf::RepeatedPtrField<v1::TreeChildRef>;

std::string TrimmedOr(const std::string& value, const char* fallback) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return fallback;
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool IsValidRef(const v1::TreeChildRef& ref) {
  return !ref.id().empty() && (ref.kind() == v1::TREE_CHILD_KIND_FOLDER || ref.kind() == v1::TREE_CHILD_KIND_PROJECT);
}

bool IsValidLock(const v1::ProjectLock& lock) {
  return !lock.owner_agent_id().empty() && !lock.token().empty() && lock.has_expires_at();
}

bool IsValidJob(const v1::Job& job) {
  if (job.id().empty() || job.project_id().empty()) return false;
  if (job.kind() != v1::JOB_KIND_GLTF_CONVERT && job.kind() != v1::JOB_KIND_TEXTURE_PREFLIGHT) return false;
  if (job.status() == v1::JOB_STATUS_UNSPECIFIED) return false;
  if (!job.has_created_at()) return false;

  switch (job.payload_case()) {
    case v1::Job::kGltfConvertPayload:
      if (job.kind() != v1::JOB_KIND_GLTF_CONVERT) return false;
      break;
    case v1::Job::kTexturePreflightPayload:
      if (job.kind() != v1::JOB_KIND_TEXTURE_PREFLIGHT) return false;
      break;
    default:
      break;
  }
  if (job.has_result() && job.result().kind() != v1::JOB_KIND_UNSPECIFIED && job.result().kind() != job.kind()) return false;
  return true;
}

// Drops nodes without an id or a bone/cube kind, with their subtrees.
void PruneHierarchy(google::protobuf::RepeatedPtrField<v1::HierarchyNode>* nodes) {
  for (int i = 0; i < nodes->size();) {
    auto* node = nodes->Mutable(i);
    if (node->id().empty() || (node->kind() != v1::NODE_KIND_BONE && node->kind() != v1::NODE_KIND_CUBE)) {
      nodes->erase(nodes->begin() + i);
      continue;
    }
    PruneHierarchy(node->mutable_children());
    ++i;
  }
}

uint64_t CounterOr(uint64_t value, uint64_t fallback) {
  return value < 1 ? fallback : value;
}

int64_t CounterOr(int64_t value, int64_t fallback) {
  return value < 1 ? fallback : value;
}

/*
  Rebuilds the forest so every live folder/project is referenced exactly
  once. Walks from root first (first reference wins, later duplicates and
  cycles are cut), then reattaches whatever was not reached: under its
  recorded parent when that parent is reachable, otherwise at root.
*/
class ForestRepair {
 public:
  explicit ForestRepair(model::PipelineState& state) : state_(state) {
  }

  void Run() {
    Walk(state_.root_children, std::nullopt);
    AttachOrphanFolders();
    AttachOrphanProjects();
  }

 private:
  void Walk(ChildList& children, const std::optional<std::string>& parent) {
    for (int i = 0; i < children.size();) {
      const auto ref = children.Get(i);
      if (!Claim(ref)) {
        children.erase(children.begin() + i);
        continue;
      }
      ++i;

      if (ref.kind() == v1::TREE_CHILD_KIND_PROJECT) {
        SetParent(state_.projects.at(ref.id()), parent);
        continue;
      }
      auto& folder = state_.folders.at(ref.id());
      SetParent(folder, parent);
      Walk(*folder.mutable_children(), folder.folder_id());
    }
  }

  bool Claim(const v1::TreeChildRef& ref) {
    if (ref.kind() == v1::TREE_CHILD_KIND_FOLDER) {
      return state_.folders.contains(ref.id()) && seen_folders_.insert(ref.id()).second;
    }
    return state_.projects.contains(ref.id()) && seen_projects_.insert(ref.id()).second;
  }

  void AttachOrphanFolders() {
    for (;;) {
      bool attached = false;
      for (auto& [id, folder] : state_.folders) {
        if (seen_folders_.contains(id) || !folder.has_parent_folder_id()) continue;
        if (!seen_folders_.contains(folder.parent_folder_id())) continue;
        AttachFolder(folder, folder.parent_folder_id());
        attached = true;
      }
      if (attached) continue;

      auto orphan = std::find_if(state_.folders.begin(), state_.folders.end(),
                                 [this](const auto& entry) { return !seen_folders_.contains(entry.first); });
      if (orphan == state_.folders.end()) return;
      AttachFolder(orphan->second, std::nullopt);
    }
  }

  void AttachFolder(v1::Folder& folder, const std::optional<std::string>& parent) {
    v1::TreeChildRef ref;
    ref.set_kind(v1::TREE_CHILD_KIND_FOLDER);
    ref.set_id(folder.folder_id());

    auto& container = parent ? *state_.folders.at(*parent).mutable_children() : state_.root_children;
    *container.Add() = ref;
    seen_folders_.insert(folder.folder_id());
    SetParent(folder, parent);
    Walk(*folder.mutable_children(), folder.folder_id());
  }

  void AttachOrphanProjects() {
    for (auto& [id, project] : state_.projects) {
      if (seen_projects_.contains(id)) continue;

      std::optional<std::string> parent;
      if (project.has_parent_folder_id() && state_.folders.contains(project.parent_folder_id())) parent = project.parent_folder_id();

      v1::TreeChildRef ref;
      ref.set_kind(v1::TREE_CHILD_KIND_PROJECT);
      ref.set_id(id);
      auto& container = parent ? *state_.folders.at(*parent).mutable_children() : state_.root_children;
      *container.Add() = ref;
      seen_projects_.insert(id);
      SetParent(project, parent);
    }
  }

  template <typename Node>
  static void SetParent(Node& node, const std::optional<std::string>& parent) {
    if (parent) {
      node.set_parent_folder_id(*parent);
    } else {
      node.clear_parent_folder_id();
    }
  }

  model::PipelineState& state_;
  std::set<std::string> seen_folders_;
  std::set<std::string> seen_projects_;
};

using google::protobuf::Value;
using JsonFields = google::protobuf::Map<std::string, Value>;

constexpr const char* kRequiredLists[] = {"projects", "folders", "rootChildren", "jobs", "queuedJobIds", "projectEvents"};

const google::protobuf::FieldDescriptor* FindJsonField(const google::protobuf::Descriptor* type, const std::string& key) {
  for (int i = 0; i < type->field_count(); ++i) {
    if (type->field(i)->json_name() == key) return type->field(i);
  }
  return type->FindFieldByName(key);
}

// Nested messages of our own schema; well-known types have their own JSON
// forms and are left to the parser.
bool IsNestedRecord(const google::protobuf::FieldDescriptor* field) {
  return field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE && !field->is_map() &&
         field->message_type()->file()->package() != "google.protobuf";
}

/*
  Prunes `value` until it parses as `type`. List elements that cannot be
  salvaged are removed, a list-typed field holding a non-list is dropped,
  and so is a nested record that cannot be salvaged. Returns false when
  `value` itself still does not parse and the caller must drop it.
*/
bool Salvage(Value& value, const google::protobuf::Descriptor* type) {
  if (value.kind_case() != Value::kStructValue) return false;

  auto*                    fields = value.mutable_struct_value()->mutable_fields();
  std::vector<std::string> dropped;
  for (auto& [key, child] : *fields) {
    const auto* field = FindJsonField(type, key);
    if (field == nullptr || !IsNestedRecord(field) || child.kind_case() == Value::kNullValue) continue;

    if (!field->is_repeated()) {
      if (!Salvage(child, field->message_type())) dropped.push_back(key);
      continue;
    }
    if (child.kind_case() != Value::kListValue) {
      dropped.push_back(key);
      continue;
    }
    auto* items = child.mutable_list_value()->mutable_values();
    for (int i = 0; i < items->size();) {
      if (Salvage(*items->Mutable(i), field->message_type())) {
        ++i;
      } else {
        items->erase(items->begin() + i);
      }
    }
  }
  for (const auto& key : dropped) fields->erase(key);

  std::unique_ptr<google::protobuf::Message> parsed(
      google::protobuf::MessageFactory::generated_factory()->GetPrototype(type)->New());
  return util::ValueToMessage(value, parsed.get());
}

template <typename T>
void SalvageList(const JsonFields& fields, const char* key, google::protobuf::RepeatedPtrField<T>* out) {
  auto it = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kListValue) return;

  for (auto item : it->second.list_value().values()) {
    T entry;
    if (Salvage(item, T::descriptor()) && util::ValueToMessage(item, &entry)) *out->Add() = std::move(entry);
  }
}

// Copies one top-level scalar; a value of the wrong type keeps the default.
void MergeScalar(const JsonFields& fields, const char* key, v1::PersistedPipelineState* document) {
  auto it = fields.find(key);
  if (it == fields.end()) return;

  Value single;
  (*single.mutable_struct_value()->mutable_fields())[key] = it->second;
  v1::PersistedPipelineState scalar;
  if (util::ValueToMessage(single, &scalar)) document->MergeFrom(scalar);
}

int64_t PendingDueMs(const v1::Job& job) {
  return job.has_next_retry_at() ? util::ToUnixMillis(job.next_retry_at()) : 0;
}

} // namespace

std::string NormalizeWorkspaceId(const std::string& workspace_id) {
  return TrimmedOr(workspace_id, kFallbackWorkspaceId);
}

model::PipelineState NewState(const std::string& workspace_id) {
  model::PipelineState state;
  state.workspace_id = NormalizeWorkspaceId(workspace_id);
  return state;
}

v1::PersistedPipelineState Encode(const model::PipelineState& state) {
  v1::PersistedPipelineState document;
  document.set_version(kPersistedStateVersion);
  document.set_workspace_id(state.workspace_id);
  document.set_next_job_id(state.next_job_id);
  document.set_next_entity_nonce(state.next_entity_nonce);
  document.set_next_seq(state.next_seq);

  for (const auto& [_, project] : state.projects) *document.add_projects() = project;
  for (const auto& [_, folder] : state.folders) *document.add_folders() = folder;
  *document.mutable_root_children() = state.root_children;
  for (const auto& [_, job] : state.jobs) *document.add_jobs() = job;
  for (const auto& entry : state.pending.OrderedEntries()) {
    document.add_queued_job_ids(entry.job_id);
    auto* queued = document.add_queued_jobs();
    queued->set_job_id(entry.job_id);
    queued->set_due_ms(entry.due_ms);
  }

  for (const auto& [project_id, lock] : state.project_locks) {
    auto* entry = document.add_project_locks();
    entry->set_project_id(project_id);
    *entry->mutable_lock() = lock;
  }
  for (const auto& [project_id, events] : state.project_events) {
    auto* bucket = document.add_project_events();
    bucket->set_project_id(project_id);
    for (const auto& event : events) *bucket->add_events() = event;
  }
  return document;
}

std::string EncodeJson(const model::PipelineState& state) {
  return util::ToJson(Encode(state));
}

std::optional<model::PipelineState> Decode(const v1::PersistedPipelineState& document) {
  if (document.version() != kPersistedStateVersion) return std::nullopt;

  auto state = NewState(document.workspace_id());

  for (const auto& folder : document.folders()) {
    if (folder.folder_id().empty()) continue;
    auto [it, inserted] = state.folders.emplace(folder.folder_id(), folder);
    if (!inserted) continue;

    auto* children = it->second.mutable_children();
    for (int i = 0; i < children->size();) {
      if (IsValidRef(children->Get(i))) {
        ++i;
      } else {
        children->erase(children->begin() + i);
      }
    }
    if (it->second.name().empty()) it->second.set_name("New Folder");
  }

  for (const auto& ref : document.root_children()) {
    if (IsValidRef(ref)) *state.root_children.Add() = ref;
  }

  for (const auto& source : document.projects()) {
    if (source.project_id().empty()) continue;
    auto [it, inserted] = state.projects.emplace(source.project_id(), source);
    if (!inserted) continue;

    auto& project = it->second;
    if (project.workspace_id().empty()) project.set_workspace_id(state.workspace_id);
    if (project.has_parent_folder_id() && !state.folders.contains(project.parent_folder_id())) project.clear_parent_folder_id();
    project.clear_project_lock();
    PruneHierarchy(project.mutable_hierarchy());
    project::SynchronizeSnapshot(project);
  }

  ForestRepair(state).Run();

  uint64_t max_job_counter = 0;
  for (const auto& job : document.jobs()) {
    if (!IsValidJob(job)) continue;
    if (!state.jobs.emplace(job.id(), job).second) continue;
    max_job_counter = std::max(max_job_counter, jobs::ParseJobCounter(job.id()));
  }

  const auto enqueue_queued = [&state](const std::string& job_id, std::optional<int64_t> due_ms) {
    auto it = state.jobs.find(job_id);
    if (it == state.jobs.end() || it->second.status() != v1::JOB_STATUS_QUEUED) return;
    state.pending.EnqueueUnique(job_id, due_ms.value_or(PendingDueMs(it->second)));
  };
  if (document.queued_jobs_size() > 0) {
    for (const auto& entry : document.queued_jobs()) enqueue_queued(entry.job_id(), entry.due_ms());
  } else {
    for (const auto& job_id : document.queued_job_ids()) enqueue_queued(job_id, std::nullopt);
  }

  std::vector<const v1::Job*> missing;
  for (const auto& [id, job] : state.jobs) {
    if (job.status() == v1::JOB_STATUS_QUEUED && !state.pending.Contains(id)) missing.push_back(&job);
    if (job.status() == v1::JOB_STATUS_RUNNING) {
      // no recorded lease: expire on the next claim sweep
      state.leases.Insert(id, job.has_lease_expires_at() ? util::ToUnixMillis(job.lease_expires_at()) : 0);
    }
  }
  std::sort(missing.begin(), missing.end(),
            [](const v1::Job* a, const v1::Job* b) { return jobs::ParseJobCounter(a->id()) < jobs::ParseJobCounter(b->id()); });
  for (const auto* job : missing) state.pending.EnqueueUnique(job->id(), PendingDueMs(*job));

  for (const auto& entry : document.project_locks()) {
    if (!state.projects.contains(entry.project_id()) || !entry.has_lock() || !IsValidLock(entry.lock())) continue;
    state.project_locks.emplace(entry.project_id(), entry.lock());
  }
  for (auto& [project_id, project] : state.projects) {
    auto lock = state.project_locks.find(project_id);
    if (lock != state.project_locks.end()) *project.mutable_project_lock() = lock->second;
  }

  int64_t max_seq = 0;
  for (const auto& bucket : document.project_events()) {
    for (const auto& event : bucket.events()) max_seq = std::max(max_seq, event.seq());
  }

  state.next_job_id       = std::max(CounterOr(document.next_job_id(), uint64_t{1}), max_job_counter + 1);
  state.next_entity_nonce = CounterOr(document.next_entity_nonce(), uint64_t{1});
  state.next_seq          = std::max(CounterOr(document.next_seq(), int64_t{1}), max_seq + 1);

  events::EventLog(state).RebuildSnapshots();
  return state;
}

std::optional<model::PipelineState> DecodeJson(const std::string& json) {
  const auto root = util::ParseJsonValue(json);
  if (!root || root->kind_case() != Value::kStructValue) return std::nullopt;

  const auto& fields  = root->struct_value().fields();
  const auto  version = fields.find("version");
  if (version == fields.end() || version->second.kind_case() != Value::kNumberValue ||
      version->second.number_value() != kPersistedStateVersion) {
    return std::nullopt;
  }
  for (const char* key : kRequiredLists) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.kind_case() != Value::kListValue) return std::nullopt;
  }

  v1::PersistedPipelineState document;
  document.set_version(kPersistedStateVersion);
  for (const char* key : {"workspaceId", "nextJobId", "nextEntityNonce", "nextSeq"}) MergeScalar(fields, key, &document);

  SalvageList(fields, "projects", document.mutable_projects());
  SalvageList(fields, "folders", document.mutable_folders());
  SalvageList(fields, "rootChildren", document.mutable_root_children());
  SalvageList(fields, "jobs", document.mutable_jobs());
  SalvageList(fields, "projectLocks", document.mutable_project_locks());
  SalvageList(fields, "projectEvents", document.mutable_project_events());
  SalvageList(fields, "queuedJobs", document.mutable_queued_jobs());
  for (const auto& id : fields.at("queuedJobIds").list_value().values()) {
    if (id.kind_case() == Value::kStringValue) document.add_queued_job_ids(id.string_value());
  }
  return Decode(document);
}

} // namespace pipeline::persistence
