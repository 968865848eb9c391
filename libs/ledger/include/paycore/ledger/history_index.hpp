#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

enum class DisputeState : std::uint8_t {
  kClean,
  kDisputed,
  kChargedBack,
};

struct HistoryEntry {
  common::TxId tx{0};
  common::ClientId client{0};
  common::Amount amount{};
  TransactionKind kind{TransactionKind::kDeposit};
  DisputeState state{DisputeState::kClean};
};

// Accepted deposits and withdrawals keyed by tx id. Entries are never removed.
// Shared between dispatcher shards, so every access takes the index mutex and
// lookups hand out copies. An entry's dispute state is only ever changed by
// the shard owning its client.
class HistoryIndex {
 public:
  // Returns false, leaving the existing entry untouched, if the tx id is taken.
  bool insert(const HistoryEntry& entry);

  [[nodiscard]] bool contains(common::TxId tx) const;
  [[nodiscard]] std::optional<HistoryEntry> find(common::TxId tx) const;

  // Throws std::out_of_range if the tx id is unknown.
  void set_state(common::TxId tx, DisputeState state);

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::TxId, HistoryEntry> entries_{};
};

}  // namespace ledger
}  // namespace paycore
