#include "lock_repository.hpp"

#include <cctype>
#include <vector>

#include "internal/contracts/job_contracts.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/token.hpp"

namespace pipeline::project {

namespace {

std::string Trim(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return value.substr(begin, end - begin);
}

std::string NormalizeOwnerAgentId(const std::string& value) {
  auto trimmed = Trim(value);
  if (trimmed.empty()) throw util::InvalidState("ownerAgentId is required.");
  return trimmed.substr(0, kMaxLockOwnerLength);
}

std::optional<std::string> NormalizeOwnerSessionId(const std::optional<std::string>& value) {
  if (!value) return std::nullopt;
  auto trimmed = Trim(*value);
  if (trimmed.empty()) return std::nullopt;
  return trimmed.substr(0, kMaxLockOwnerLength);
}

std::optional<std::string> SessionOf(const v1::ProjectLock& lock) {
  if (!lock.has_owner_session_id()) return std::nullopt;
  return lock.owner_session_id();
}

bool IsExpired(const v1::ProjectLock& lock, util::TimePoint now) {
  return util::ToUnixMillis(lock.expires_at()) <= util::ToUnixMillis(now);
}

bool IsSameOwner(const v1::ProjectLock& lock, const std::string& agent, const std::optional<std::string>& session) {
  return lock.owner_agent_id() == agent && SessionOf(lock) == session;
}

bool HasVisibleDiff(const v1::ProjectLock* previous, const v1::ProjectLock* next) {
  if (!previous && !next) return false;
  if (!previous || !next) return true;
  return previous->owner_agent_id() != next->owner_agent_id() || SessionOf(*previous) != SessionOf(*next) ||
         previous->mode() != next->mode() || previous->token() != next->token();
}

v1::ProjectLock BuildLock(const std::string& agent, const std::optional<std::string>& session, int64_t ttl_ms, util::TimePoint now,
                          const v1::ProjectLock* existing) {
  v1::ProjectLock lock;
  lock.set_owner_agent_id(agent);
  if (session) lock.set_owner_session_id(*session);
  if (existing) {
    lock.set_token(existing->token());
    *lock.mutable_acquired_at() = existing->acquired_at();
  } else {
    lock.set_token(util::GenerateLockToken());
    *lock.mutable_acquired_at() = util::ToProto(now);
  }
  *lock.mutable_heartbeat_at() = util::ToProto(now);
  *lock.mutable_expires_at()   = util::ToProto(now + std::chrono::milliseconds(ttl_ms));
  lock.set_mode(v1::LOCK_MODE_MCP);
  return lock;
}

} // namespace

void LockRepository::SyncProjection(const std::string& project_id, const v1::ProjectLock* lock) {
  auto it = state_.projects.find(project_id);
  if (it == state_.projects.end()) return;
  auto& project = it->second;

  const v1::ProjectLock* previous = project.has_project_lock() ? &project.project_lock() : nullptr;
  if (!HasVisibleDiff(previous, lock)) return;

  if (lock) {
    *project.mutable_project_lock() = *lock;
  } else {
    project.clear_project_lock();
  }
  events_.Append(project);
}

int LockRepository::ReleaseExpired(util::TimePoint now) {
  std::vector<std::string> expired;
  for (const auto& [project_id, lock] : state_.project_locks) {
    if (IsExpired(lock, now)) expired.push_back(project_id);
  }
  for (const auto& project_id : expired) {
    state_.project_locks.erase(project_id);
    SyncProjection(project_id, nullptr);
  }
  return static_cast<int>(expired.size());
}

std::optional<v1::ProjectLock> LockRepository::Get(const std::string& project_id, util::TimePoint now) const {
  auto it = state_.project_locks.find(project_id);
  if (it == state_.project_locks.end() || IsExpired(it->second, now)) return std::nullopt;
  return it->second;
}

v1::ProjectLock LockRepository::Acquire(const model::AcquireLockInput& input, util::TimePoint now) {
  const auto agent   = NormalizeOwnerAgentId(input.owner_agent_id);
  const auto session = NormalizeOwnerSessionId(input.owner_session_id);
  const auto ttl_ms  = contracts::ClampInteger(input.ttl_ms, kMinLockTtlMs, kMaxLockTtlMs, kDefaultLockTtlMs);
  if (!state_.projects.contains(input.project_id)) throw util::NotFound("Project not found: " + input.project_id);

  if (auto held = Get(input.project_id, now); held && !IsSameOwner(*held, agent, session)) {
    throw util::LockConflict(input.project_id, held->owner_agent_id(), SessionOf(*held), util::ToIso8601(held->expires_at()));
  }

  ReleaseExpired(now);

  const v1::ProjectLock* existing = nullptr;
  if (auto it = state_.project_locks.find(input.project_id); it != state_.project_locks.end()) existing = &it->second;

  auto lock                              = BuildLock(agent, session, ttl_ms, now, existing);
  state_.project_locks[input.project_id] = lock;
  SyncProjection(input.project_id, &lock);
  return lock;
}

std::optional<v1::ProjectLock> LockRepository::Renew(const model::RenewLockInput& input, util::TimePoint now) {
  const auto agent   = NormalizeOwnerAgentId(input.owner_agent_id);
  const auto session = NormalizeOwnerSessionId(input.owner_session_id);
  ReleaseExpired(now);
  const auto ttl_ms  = contracts::ClampInteger(input.ttl_ms, kMinLockTtlMs, kMaxLockTtlMs, kDefaultLockTtlMs);

  auto it = state_.project_locks.find(input.project_id);
  if (it == state_.project_locks.end() || !IsSameOwner(it->second, agent, session)) return std::nullopt;

  auto lock  = BuildLock(agent, session, ttl_ms, now, &it->second);
  it->second = lock;
  SyncProjection(input.project_id, &lock);
  return lock;
}

bool LockRepository::Release(const model::ReleaseLockInput& input, util::TimePoint now) {
  const auto agent   = NormalizeOwnerAgentId(input.owner_agent_id);
  const auto session = NormalizeOwnerSessionId(input.owner_session_id);
  ReleaseExpired(now);

  auto it = state_.project_locks.find(input.project_id);
  if (it == state_.project_locks.end() || !IsSameOwner(it->second, agent, session)) return false;

  state_.project_locks.erase(it);
  SyncProjection(input.project_id, nullptr);
  return true;
}

int LockRepository::ReleaseByOwner(const std::string& owner_agent_id, const std::optional<std::string>& owner_session_id,
                                   util::TimePoint now) {
  const auto agent   = NormalizeOwnerAgentId(owner_agent_id);
  const auto session = NormalizeOwnerSessionId(owner_session_id);
  ReleaseExpired(now);

  std::vector<std::string> released;
  for (const auto& [project_id, lock] : state_.project_locks) {
    if (lock.owner_agent_id() != agent) continue;
    if (owner_session_id && SessionOf(lock) != session) continue;
    released.push_back(project_id);
  }
  for (const auto& project_id : released) {
    state_.project_locks.erase(project_id);
    SyncProjection(project_id, nullptr);
  }
  return static_cast<int>(released.size());
}

} // namespace pipeline::project
