#pragma once

#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeline::queue {

/*
  PendingQueue

  Index of job ids awaiting a claim attempt, ordered by (due time,
  enqueue order). Membership is advisory: the job record stays the
  source of truth and claimers must re-check status after popping.

  Rescheduling or removing an id leaves its old heap entry behind; such
  entries are skipped lazily and compacted once they dominate the heap.
*/
class PendingQueue {
 public:
  struct Entry {
    int64_t     due_ms = 0;
    uint64_t    order  = 0;
    std::string job_id;
  };

  // Inserts `job_id`, or moves it to `due_ms` behind everything already
  // scheduled for that time.
  void Schedule(const std::string& job_id, int64_t due_ms);

  // Inserts only if absent; returns false when already queued.
  bool EnqueueUnique(const std::string& job_id, int64_t due_ms);

  // Earliest live entry, if any.
  std::optional<Entry> Peek();

  // Pops the earliest live entry if it is due at `now_ms`.
  std::optional<std::string> PopDue(int64_t now_ms);

  bool Contains(const std::string& job_id) const;
  bool Remove(const std::string& job_id);

  std::size_t Size() const {
    return live_.size();
  }
  bool Empty() const {
    return live_.empty();
  }

  // Live entries in claim order; `order` is the relative rank.
  std::vector<Entry>       OrderedEntries() const;
  std::vector<std::string> OrderedIds() const;

  void Clear();

 private:
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due_ms != b.due_ms) return a.due_ms > b.due_ms;
      return a.order > b.order;
    }
  };

  struct Slot {
    int64_t  due_ms;
    uint64_t order;
  };

  bool IsLive(const Entry& e) const;
  void DropStale();
  void CompactIfNeeded();

  std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
  std::unordered_map<std::string, Slot>                 live_;
  uint64_t                                              next_order_ = 0;
};

} // namespace pipeline::queue
