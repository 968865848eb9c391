#include "paycore/ledger/history_index.hpp"

#include <stdexcept>
#include <string>

namespace paycore {
namespace ledger {

bool HistoryIndex::insert(const HistoryEntry& entry) {
  std::scoped_lock lock(mutex_);
  return entries_.try_emplace(entry.tx, entry).second;
}

bool HistoryIndex::contains(common::TxId tx) const {
  std::scoped_lock lock(mutex_);
  return entries_.find(tx) != entries_.end();
}

std::optional<HistoryEntry> HistoryIndex::find(common::TxId tx) const {
  std::scoped_lock lock(mutex_);
  if (auto it = entries_.find(tx); it != entries_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void HistoryIndex::set_state(common::TxId tx, DisputeState state) {
  std::scoped_lock lock(mutex_);
  auto it = entries_.find(tx);
  if (it == entries_.end()) {
    throw std::out_of_range("no history entry for tx " + std::to_string(tx));
  }
  it->second.state = state;
}

std::size_t HistoryIndex::size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

}  // namespace ledger
}  // namespace paycore
