#include "pending_queue.hpp"

#include <algorithm>

namespace pipeline::queue {

bool PendingQueue::IsLive(const Entry& e) const {
  auto it = live_.find(e.job_id);
  return it != live_.end() && it->second.order == e.order;
}

void PendingQueue::DropStale() {
  while (!heap_.empty() && !IsLive(heap_.top())) {
    heap_.pop();
  }
}

void PendingQueue::CompactIfNeeded() {
  if (heap_.size() <= 2 * live_.size() + 64) return;

  std::vector<Entry> entries;
  entries.reserve(live_.size());
  for (const auto& [id, slot] : live_) {
    entries.push_back(Entry{slot.due_ms, slot.order, id});
  }
  heap_ = std::priority_queue<Entry, std::vector<Entry>, Later>(Later{}, std::move(entries));
}

void PendingQueue::Schedule(const std::string& job_id, int64_t due_ms) {
  const auto order = next_order_++;
  live_[job_id]    = Slot{due_ms, order};
  heap_.push(Entry{due_ms, order, job_id});
  CompactIfNeeded();
}

bool PendingQueue::EnqueueUnique(const std::string& job_id, int64_t due_ms) {
  if (live_.contains(job_id)) return false;
  Schedule(job_id, due_ms);
  return true;
}

std::optional<PendingQueue::Entry> PendingQueue::Peek() {
  DropStale();
  if (heap_.empty()) return std::nullopt;
  return heap_.top();
}

std::optional<std::string> PendingQueue::PopDue(int64_t now_ms) {
  DropStale();
  if (heap_.empty() || heap_.top().due_ms > now_ms) return std::nullopt;

  auto id = heap_.top().job_id;
  heap_.pop();
  live_.erase(id);
  return id;
}

bool PendingQueue::Contains(const std::string& job_id) const {
  return live_.contains(job_id);
}

bool PendingQueue::Remove(const std::string& job_id) {
  if (live_.erase(job_id) == 0) return false;
  CompactIfNeeded();
  return true;
}

std::vector<PendingQueue::Entry> PendingQueue::OrderedEntries() const {
  std::vector<Entry> entries;
  entries.reserve(live_.size());
  for (const auto& [id, slot] : live_) {
    entries.push_back(Entry{slot.due_ms, slot.order, id});
  }
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return Later{}(b, a); });
  return entries;
}

std::vector<std::string> PendingQueue::OrderedIds() const {
  auto entries = OrderedEntries();

  std::vector<std::string> ids;
  ids.reserve(entries.size());
  for (auto& e : entries) ids.push_back(std::move(e.job_id));
  return ids;
}

void PendingQueue::Clear() {
  heap_ = {};
  live_.clear();
}

} // namespace pipeline::queue
