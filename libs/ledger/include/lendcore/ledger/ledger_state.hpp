#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

struct AccountState {
  common::Amount collateral{};
  common::Amount debt{};

  friend bool operator==(const AccountState&, const AccountState&) = default;
};

// Sparse identity -> account map. Unknown identities read as an empty account.
// Accounts are never erased once opened, except when an uncommitted unit of
// work that opened them is rolled back.
class LedgerState {
 public:
  [[nodiscard]] AccountState get(common::Identity identity) const;
  [[nodiscard]] const AccountState* find(common::Identity identity) const;
  [[nodiscard]] bool contains(common::Identity identity) const;

  AccountState& open(common::Identity identity);
  void restore(common::Identity identity, const std::optional<AccountState>& previous);
  void clear();

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::vector<std::pair<common::Identity, AccountState>> ordered() const;

 private:
  std::unordered_map<common::Identity, AccountState> accounts_{};
};

}  // namespace ledger
}  // namespace lendcore
