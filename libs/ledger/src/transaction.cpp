#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace paycore
