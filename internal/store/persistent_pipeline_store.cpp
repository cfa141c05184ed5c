#include "persistent_pipeline_store.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/persistence/state_codec.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::store {

using observability::IntField;
using observability::StringField;
using observability::UintField;

PersistentPipelineStore::PersistentPipelineStore(std::shared_ptr<db::DocumentRepository> repository, std::string backend,
                                                 std::string workspace_id, PersistenceOptions options,
                                                 std::shared_ptr<util::ClockSource> clock)
    : StateStore(persistence::NormalizeWorkspaceId(workspace_id), std::move(clock)),
      repository_(std::move(repository)),
      backend_(std::move(backend)),
      options_(options) {
  if (!repository_) throw std::invalid_argument("PersistentPipelineStore requires a document repository");
}

void PersistentPipelineStore::DropCache() {
  cached_revision_.reset();
  cached_state_.reset();
}

model::PipelineState PersistentPipelineStore::Load(const db::model::StateDocumentRecord& row) const {
  auto decoded = persistence::DecodeJson(row.document);
  if (decoded) return std::move(*decoded);

  PIPELINE_LOG_WARN("persisted pipeline state rejected; starting from a fresh state",
                    {StringField("backend", backend_), StringField("workspace_id", WorkspaceId()),
                     UintField("revision", row.revision)});
  return persistence::NewState(WorkspaceId());
}

void PersistentPipelineStore::ExecuteOnce(AccessMode mode, const Operation& fn) {
  auto       tx       = repository_->Begin();
  const auto row      = repository_->FindDocument(*tx, WorkspaceId());
  const auto revision = row ? row->revision : 0;

  if (!cached_revision_ || *cached_revision_ != revision) {
    cached_state_    = row ? Load(*row) : persistence::NewState(WorkspaceId());
    cached_revision_ = revision;
  }

  if (mode == AccessMode::kRead) {
    StoreContext ctx(*cached_state_, Now());
    fn(ctx);
    tx->Rollback();
    return;
  }

  auto         working = *cached_state_;
  StoreContext ctx(working, Now());
  fn(ctx);

  db::model::StateDocumentRecord record;
  record.workspace_id  = WorkspaceId();
  record.document      = persistence::EncodeJson(working);
  record.revision      = revision + 1;
  record.updated_at_ms = static_cast<uint64_t>(util::ToUnixMillis(ctx.now));

  if (auto res = repository_->SaveDocumentIfRevision(*tx, record, revision); !res) {
    if (res.LostRace()) throw util::Conflict(res.message);
    throw std::runtime_error("save pipeline state: " + res.Describe());
  }
  tx->Commit();

  cached_state_    = std::move(working);
  cached_revision_ = record.revision;
}

void PersistentPipelineStore::Execute(std::string_view op, AccessMode mode, const Operation& fn) {
  std::lock_guard lock(mutex_);

  for (uint32_t attempt = 0;; ++attempt) {
    try {
      ExecuteOnce(mode, fn);
      return;
    } catch (const util::Conflict& e) {
      DropCache();
      observability::Metrics::Instance().RecordPersistenceConflict(backend_);

      if (attempt >= options_.conflict_retries) {
        PIPELINE_LOG_ERROR("persistence conflict retries exhausted",
                           {StringField("backend", backend_), StringField("op", op), IntField("attempts", attempt + 1),
                            StringField("error", e.what())});
        throw;
      }
      PIPELINE_LOG_WARN("persistence conflict; retrying",
                        {StringField("backend", backend_), StringField("op", op), IntField("attempt", attempt + 1),
                         StringField("error", e.what())});
      std::this_thread::sleep_for(std::chrono::milliseconds(options_.conflict_backoff_ms * (attempt + 1)));
    }
  }
}

} // namespace pipeline::store
