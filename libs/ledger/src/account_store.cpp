#include "paycore/ledger/account_store.hpp"

#include <algorithm>

namespace paycore {
namespace ledger {

Account& AccountStore::ensure(common::ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, Account{.client = client});
  return it->second;
}

Account* AccountStore::find(common::ClientId client) {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

const Account* AccountStore::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<AccountSnapshot> AccountStore::snapshot() const {
  std::vector<AccountSnapshot> rows;
  rows.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    rows.push_back(AccountSnapshot{
        .client = client,
        .available = account.available,
        .held = account.held,
        .total = account.total,
        .locked = account.locked,
    });
  }
  std::sort(rows.begin(), rows.end(), [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
    return lhs.client < rhs.client;
  });
  return rows;
}

}  // namespace ledger
}  // namespace paycore
