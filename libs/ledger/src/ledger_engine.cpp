#include "paycore/ledger/ledger_engine.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace paycore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeDuplicateTransaction = 3001;
constexpr std::uint16_t kRejectCodeAccountLocked = 3002;
constexpr std::uint16_t kRejectCodeInsufficientFunds = 3003;
constexpr std::uint16_t kRejectCodeUnknownTransaction = 3004;
constexpr std::uint16_t kRejectCodeInvalidState = 3005;

std::uint16_t reject_code_for(ApplyError error) noexcept {
  switch (error) {
    case ApplyError::kNone:
      return 0;
    case ApplyError::kDuplicateTransaction:
      return kRejectCodeDuplicateTransaction;
    case ApplyError::kAccountLocked:
      return kRejectCodeAccountLocked;
    case ApplyError::kInsufficientFunds:
      return kRejectCodeInsufficientFunds;
    case ApplyError::kUnknownTransaction:
      return kRejectCodeUnknownTransaction;
    case ApplyError::kInvalidState:
      return kRejectCodeInvalidState;
  }
  return 0;
}

common::Amount required_amount(const TransactionRecord& record) {
  if (!record.amount.has_value()) {
    throw std::invalid_argument(std::string(to_string(record.kind)) + " tx " + std::to_string(record.tx) +
                                " has no amount");
  }
  if (record.amount->is_negative()) {
    throw std::invalid_argument(std::string(to_string(record.kind)) + " tx " + std::to_string(record.tx) +
                                " has a negative amount");
  }
  return *record.amount;
}
}  // namespace

std::string_view to_string(ApplyError error) noexcept {
  switch (error) {
    case ApplyError::kNone:
      return "none";
    case ApplyError::kDuplicateTransaction:
      return "duplicate transaction";
    case ApplyError::kAccountLocked:
      return "account locked";
    case ApplyError::kInsufficientFunds:
      return "insufficient funds";
    case ApplyError::kUnknownTransaction:
      return "unknown transaction";
    case ApplyError::kInvalidState:
      return "invalid dispute state";
  }
  return "unknown error";
}

LedgerEngine::LedgerEngine(AccountStore& accounts, HistoryIndex& history)
    : accounts_(accounts), history_(history) {}

void LedgerEngine::set_rejection_handler(RejectionHandler handler) {
  rejection_handler_ = std::move(handler);
}

ApplyResult LedgerEngine::apply(const TransactionRecord& record) {
  ApplyResult result;
  switch (record.kind) {
    case TransactionKind::kDeposit:
      result = apply_deposit(record);
      break;
    case TransactionKind::kWithdrawal:
      result = apply_withdrawal(record);
      break;
    case TransactionKind::kDispute:
      result = apply_dispute(record);
      break;
    case TransactionKind::kResolve:
      result = apply_resolve(record);
      break;
    case TransactionKind::kChargeback:
      result = apply_chargeback(record);
      break;
  }
  record_outcome(record, result);
  return result;
}

std::vector<AccountSnapshot> LedgerEngine::finalize() const {
  return accounts_.snapshot();
}

ApplyResult LedgerEngine::apply_deposit(const TransactionRecord& record) {
  const common::Amount amount = required_amount(record);

  if (history_.contains(record.tx)) {
    return reject(ApplyError::kDuplicateTransaction);
  }

  const Account* existing = accounts_.find(record.client);
  if (existing && existing->locked) {
    return reject(ApplyError::kAccountLocked);
  }

  const common::Amount available = existing ? existing->available : common::Amount{};
  const common::Amount total = existing ? existing->total : common::Amount{};
  const common::Amount new_available = available + amount;
  const common::Amount new_total = total + amount;

  // The index is shared across shards; a concurrent insert of the same id wins.
  if (!history_.insert(HistoryEntry{.tx = record.tx,
                                    .client = record.client,
                                    .amount = amount,
                                    .kind = TransactionKind::kDeposit,
                                    .state = DisputeState::kClean})) {
    return reject(ApplyError::kDuplicateTransaction);
  }

  auto& account = accounts_.ensure(record.client);
  account.available = new_available;
  account.total = new_total;
  return {};
}

ApplyResult LedgerEngine::apply_withdrawal(const TransactionRecord& record) {
  const common::Amount amount = required_amount(record);

  if (history_.contains(record.tx)) {
    return reject(ApplyError::kDuplicateTransaction);
  }

  const Account* existing = accounts_.find(record.client);
  if (existing && existing->locked) {
    return reject(ApplyError::kAccountLocked);
  }

  const common::Amount available = existing ? existing->available : common::Amount{};
  const common::Amount total = existing ? existing->total : common::Amount{};
  if (amount > available) {
    return reject(ApplyError::kInsufficientFunds);
  }

  const common::Amount new_available = available - amount;
  const common::Amount new_total = total - amount;

  if (!history_.insert(HistoryEntry{.tx = record.tx,
                                    .client = record.client,
                                    .amount = amount,
                                    .kind = TransactionKind::kWithdrawal,
                                    .state = DisputeState::kClean})) {
    return reject(ApplyError::kDuplicateTransaction);
  }

  auto& account = accounts_.ensure(record.client);
  account.available = new_available;
  account.total = new_total;
  return {};
}

ApplyResult LedgerEngine::apply_dispute(const TransactionRecord& record) {
  HistoryEntry entry;
  Account* account = nullptr;
  if (auto result = resolve_reference(record, DisputeState::kClean, entry, account); !result.accepted()) {
    return result;
  }

  // Holding more than is available would push `available` below zero.
  if (entry.amount > account->available) {
    return reject(ApplyError::kInsufficientFunds);
  }

  const common::Amount new_available = account->available - entry.amount;
  const common::Amount new_held = account->held + entry.amount;

  history_.set_state(entry.tx, DisputeState::kDisputed);
  account->available = new_available;
  account->held = new_held;
  return {};
}

ApplyResult LedgerEngine::apply_resolve(const TransactionRecord& record) {
  HistoryEntry entry;
  Account* account = nullptr;
  if (auto result = resolve_reference(record, DisputeState::kDisputed, entry, account); !result.accepted()) {
    return result;
  }

  const common::Amount new_held = account->held - entry.amount;
  const common::Amount new_available = account->available + entry.amount;

  history_.set_state(entry.tx, DisputeState::kClean);
  account->held = new_held;
  account->available = new_available;
  return {};
}

ApplyResult LedgerEngine::apply_chargeback(const TransactionRecord& record) {
  HistoryEntry entry;
  Account* account = nullptr;
  if (auto result = resolve_reference(record, DisputeState::kDisputed, entry, account); !result.accepted()) {
    return result;
  }

  const common::Amount new_held = account->held - entry.amount;
  const common::Amount new_total = account->total - entry.amount;

  history_.set_state(entry.tx, DisputeState::kChargedBack);
  account->held = new_held;
  account->total = new_total;
  account->locked = true;
  return {};
}

ApplyResult LedgerEngine::resolve_reference(const TransactionRecord& record, DisputeState expected,
                                            HistoryEntry& entry, Account*& account) {
  auto found = history_.find(record.tx);
  if (!found || found->client != record.client) {
    return reject(ApplyError::kUnknownTransaction);
  }

  account = accounts_.find(record.client);
  if (!account) {
    return reject(ApplyError::kUnknownTransaction);
  }

  if (found->state != expected) {
    return reject(ApplyError::kInvalidState);
  }

  if (account->locked) {
    return reject(ApplyError::kAccountLocked);
  }

  entry = *found;
  return {};
}

void LedgerEngine::record_outcome(const TransactionRecord& record, const ApplyResult& result) {
  switch (result.error) {
    case ApplyError::kNone:
      ++stats_.applied;
      return;
    case ApplyError::kDuplicateTransaction:
      ++stats_.rejected_duplicate;
      break;
    case ApplyError::kAccountLocked:
      ++stats_.rejected_locked;
      break;
    case ApplyError::kInsufficientFunds:
      ++stats_.rejected_insufficient_funds;
      break;
    case ApplyError::kUnknownTransaction:
      ++stats_.rejected_unknown;
      break;
    case ApplyError::kInvalidState:
      ++stats_.rejected_invalid_state;
      break;
  }

  if (rejection_handler_) {
    rejection_handler_(record, result);
  }
}

ApplyResult LedgerEngine::reject(ApplyError error) {
  return ApplyResult{.error = error, .reject_code = reject_code_for(error)};
}

}  // namespace ledger
}  // namespace paycore
