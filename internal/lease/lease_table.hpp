#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeline::lease {

/*
  LeaseTable

  Expiry index over running jobs. The job record holds the
  authoritative leaseExpiresAt; this table only lets the claim-time
  sweep visit expired leases without scanning every job.

  Not thread-safe: it lives inside PipelineState, which stores guard.
*/
class LeaseTable {
 public:
  // Adds or replaces the lease for `job_id`.
  void Insert(const std::string& job_id, int64_t expires_at_ms);

  void Remove(const std::string& job_id);

  bool Has(const std::string& job_id) const {
    return by_job_.contains(job_id);
  }

  // Removes and returns every lease with expiry <= now_ms, earliest first.
  std::vector<std::string> CollectExpired(int64_t now_ms);

  std::size_t Size() const {
    return by_job_.size();
  }

  void Clear();

 private:
  std::multimap<int64_t, std::string>      by_expiry_;
  std::unordered_map<std::string, int64_t> by_job_;
};

} // namespace pipeline::lease
