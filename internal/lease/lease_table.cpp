#include "lease_table.hpp"

namespace pipeline::lease {

void LeaseTable::Insert(const std::string& job_id, int64_t expires_at_ms) {
  Remove(job_id);
  by_expiry_.emplace(expires_at_ms, job_id);
  by_job_[job_id] = expires_at_ms;
}

void LeaseTable::Remove(const std::string& job_id) {
  auto it = by_job_.find(job_id);
  if (it == by_job_.end()) return;

  auto range = by_expiry_.equal_range(it->second);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == job_id) {
      by_expiry_.erase(i);
      break;
    }
  }

  by_job_.erase(it);
}

std::vector<std::string> LeaseTable::CollectExpired(int64_t now_ms) {
  std::vector<std::string> expired;
  auto                     end = by_expiry_.upper_bound(now_ms);
  for (auto it = by_expiry_.begin(); it != end; ++it) {
    by_job_.erase(it->second);
    expired.push_back(it->second);
  }
  by_expiry_.erase(by_expiry_.begin(), end);
  return expired;
}

void LeaseTable::Clear() {
  by_expiry_.clear();
  by_job_.clear();
}

} // namespace pipeline::lease
