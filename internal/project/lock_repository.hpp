#pragma once

#include <optional>
#include <string>

#include "internal/events/event_log.hpp"
#include "internal/model/inputs.hpp"
#include "internal/model/pipeline_state.hpp"
#include "internal/util/time.hpp"

namespace pipeline::project {

namespace v1 = pipeline::store::v1;

inline constexpr int64_t     kDefaultLockTtlMs  = 30000;
inline constexpr int64_t     kMinLockTtlMs      = 5000;
inline constexpr int64_t     kMaxLockTtlMs      = 300000;
inline constexpr std::size_t kMaxLockOwnerLength = 128;

/*
  LockRepository

  Exclusive, time-bounded edit locks, one per project. The lock table
  is authoritative; project.project_lock is a projection refreshed on
  every change that a stream consumer could observe (owner, session,
  mode, token). Heartbeat-only renewals stay silent.

  Every mutating call validates its input, then releases locks that
  expired at `now`.
*/
class LockRepository {
 public:
  LockRepository(model::PipelineState& state, events::EventLog& events) : state_(state), events_(events) {
  }

  // Creates the lock, or renews it for the same owner keeping token and
  // acquired_at. Throws util::LockConflict when held by someone else,
  // util::NotFound for an unknown project.
  v1::ProjectLock Acquire(const model::AcquireLockInput& input, util::TimePoint now);

  // nullopt when there is no lock or it belongs to someone else.
  std::optional<v1::ProjectLock> Renew(const model::RenewLockInput& input, util::TimePoint now);

  bool Release(const model::ReleaseLockInput& input, util::TimePoint now);

  // Without a session every lock of the agent goes. A given session,
  // blank included, must match exactly.
  int ReleaseByOwner(const std::string& owner_agent_id, const std::optional<std::string>& owner_session_id,
                     util::TimePoint now);

  int ReleaseExpired(util::TimePoint now);

  // Pure read; an expired lock reads as absent.
  std::optional<v1::ProjectLock> Get(const std::string& project_id, util::TimePoint now) const;

 private:
  void SyncProjection(const std::string& project_id, const v1::ProjectLock* lock);

  model::PipelineState& state_;
  events::EventLog&     events_;
};

} // namespace pipeline::project
