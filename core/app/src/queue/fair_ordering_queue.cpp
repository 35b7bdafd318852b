#include "settle/queue/fair_ordering_queue.hpp"

#include "settle/domain/errors.hpp"

#include <string>

namespace settle {

using domain::SettlementId;

std::uint64_t FairOrderingQueue::enqueue(SettlementId id) {
  if (contains(id)) {
    throw InvalidStateError("Settlement " + std::to_string(id) +
                            " is already queued");
  }
  std::uint64_t position = positions_.next_id();
  by_position_.emplace(position, id);
  position_of_.emplace(id, position);
  return position;
}

std::optional<SettlementId> FairOrderingQueue::head() const {
  if (by_position_.empty()) {
    return std::nullopt;
  }
  return by_position_.begin()->second;
}

bool FairOrderingQueue::isHead(SettlementId id) const {
  auto h = head();
  return h.has_value() && *h == id;
}

void FairOrderingQueue::advance(SettlementId id) {
  auto it = position_of_.find(id);
  if (it == position_of_.end()) {
    return;
  }
  by_position_.erase(it->second);
  position_of_.erase(it);
}

void FairOrderingQueue::reinstate(SettlementId id, std::uint64_t position) {
  if (contains(id)) {
    throw InvalidStateError("Settlement " + std::to_string(id) +
                            " is already queued");
  }
  if (position >= positions_.peek()) {
    throw InvalidStateError("Queue position " + std::to_string(position) +
                            " was never issued");
  }
  if (by_position_.count(position) != 0) {
    throw InvalidStateError("Queue position " + std::to_string(position) +
                            " is taken");
  }
  by_position_.emplace(position, id);
  position_of_.emplace(id, position);
}

bool FairOrderingQueue::contains(SettlementId id) const {
  return position_of_.count(id) != 0;
}

std::optional<std::uint64_t> FairOrderingQueue::positionOf(
    SettlementId id) const {
  auto it = position_of_.find(id);
  if (it == position_of_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<FairOrderingQueue::Entry> FairOrderingQueue::entries() const {
  return std::vector<Entry>(by_position_.begin(), by_position_.end());
}

void FairOrderingQueue::restore(const std::vector<Entry>& entries,
                                std::uint64_t next_position) {
  by_position_.clear();
  position_of_.clear();
  for (const auto& [position, id] : entries) {
    by_position_.emplace(position, id);
    position_of_.emplace(id, position);
  }
  positions_.restore(next_position);
}

}  // namespace settle
