#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

std::string_view to_string(TransactionKind kind) noexcept;

// Deposits and withdrawals carry an amount and create history entries; the
// remaining kinds reference an existing entry by tx id.
inline constexpr bool carries_amount(TransactionKind kind) noexcept {
  return kind == TransactionKind::kDeposit || kind == TransactionKind::kWithdrawal;
}

struct TransactionRecord {
  TransactionKind kind{TransactionKind::kDeposit};
  common::ClientId client{0};
  common::TxId tx{0};
  std::optional<common::Amount> amount{};

  static TransactionRecord deposit(common::ClientId client, common::TxId tx, common::Amount amount) {
    return {.kind = TransactionKind::kDeposit, .client = client, .tx = tx, .amount = amount};
  }
  static TransactionRecord withdrawal(common::ClientId client, common::TxId tx, common::Amount amount) {
    return {.kind = TransactionKind::kWithdrawal, .client = client, .tx = tx, .amount = amount};
  }
  static TransactionRecord dispute(common::ClientId client, common::TxId tx) {
    return {.kind = TransactionKind::kDispute, .client = client, .tx = tx};
  }
  static TransactionRecord resolve(common::ClientId client, common::TxId tx) {
    return {.kind = TransactionKind::kResolve, .client = client, .tx = tx};
  }
  static TransactionRecord chargeback(common::ClientId client, common::TxId tx) {
    return {.kind = TransactionKind::kChargeback, .client = client, .tx = tx};
  }
};

}  // namespace ledger
}  // namespace paycore
