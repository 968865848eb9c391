#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

struct Account {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

// Finalized, read-only view of one account as handed to the report writer.
struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};

  friend bool operator==(const AccountSnapshot&, const AccountSnapshot&) = default;
};

class AccountStore {
 public:
  // Returns the account for `client`, creating a zeroed one on first use.
  Account& ensure(common::ClientId client);
  [[nodiscard]] Account* find(common::ClientId client);
  [[nodiscard]] const Account* find(common::ClientId client) const;

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }

  // All accounts ordered by ascending client id.
  [[nodiscard]] std::vector<AccountSnapshot> snapshot() const;

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
};

}  // namespace ledger
}  // namespace paycore
