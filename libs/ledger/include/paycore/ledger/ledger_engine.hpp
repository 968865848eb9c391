#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "paycore/ledger/account_store.hpp"
#include "paycore/ledger/history_index.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

enum class ApplyError : std::uint8_t {
  kNone,
  kDuplicateTransaction,
  kAccountLocked,
  kInsufficientFunds,
  kUnknownTransaction,
  kInvalidState,
};

std::string_view to_string(ApplyError error) noexcept;

struct ApplyResult {
  ApplyError error{ApplyError::kNone};
  std::uint16_t reject_code{0};

  [[nodiscard]] bool accepted() const noexcept { return error == ApplyError::kNone; }
};

// Applies transaction records to an account store and a history index, both
// owned by the caller. Rejected records leave no trace in either. Arithmetic
// overflow throws std::overflow_error before anything is mutated.
//
// Not thread-safe: one engine per writer. Several engines may share one
// HistoryIndex as long as each client is only ever routed to one of them.
class LedgerEngine {
 public:
  struct Stats {
    std::uint64_t applied{0};
    std::uint64_t rejected_duplicate{0};
    std::uint64_t rejected_locked{0};
    std::uint64_t rejected_insufficient_funds{0};
    std::uint64_t rejected_unknown{0};
    std::uint64_t rejected_invalid_state{0};
  };

  using RejectionHandler = std::function<void(const TransactionRecord&, const ApplyResult&)>;

  LedgerEngine(AccountStore& accounts, HistoryIndex& history);

  void set_rejection_handler(RejectionHandler handler);

  ApplyResult apply(const TransactionRecord& record);

  // Every account seen so far, ascending by client id.
  [[nodiscard]] std::vector<AccountSnapshot> finalize() const;

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  AccountStore& accounts_;
  HistoryIndex& history_;
  RejectionHandler rejection_handler_{};
  Stats stats_{};

  ApplyResult apply_deposit(const TransactionRecord& record);
  ApplyResult apply_withdrawal(const TransactionRecord& record);
  ApplyResult apply_dispute(const TransactionRecord& record);
  ApplyResult apply_resolve(const TransactionRecord& record);
  ApplyResult apply_chargeback(const TransactionRecord& record);

  // Shared lookup for the dispute family: the entry must exist under the
  // record's client, be in `expected` state, and its account must be unlocked.
  ApplyResult resolve_reference(const TransactionRecord& record, DisputeState expected,
                                HistoryEntry& entry, Account*& account);

  void record_outcome(const TransactionRecord& record, const ApplyResult& result);
  static ApplyResult reject(ApplyError error);
};

}  // namespace ledger
}  // namespace paycore
