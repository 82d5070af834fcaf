#include "lendcore/ledger/ledger_state.hpp"

#include <algorithm>

namespace lendcore {
namespace ledger {

AccountState LedgerState::get(common::Identity identity) const {
  if (const auto* account = find(identity)) {
    return *account;
  }
  return {};
}

const AccountState* LedgerState::find(common::Identity identity) const {
  if (auto it = accounts_.find(identity); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

bool LedgerState::contains(common::Identity identity) const {
  return accounts_.find(identity) != accounts_.end();
}

AccountState& LedgerState::open(common::Identity identity) {
  return accounts_.try_emplace(identity).first->second;
}

void LedgerState::restore(common::Identity identity, const std::optional<AccountState>& previous) {
  if (!previous.has_value()) {
    accounts_.erase(identity);
    return;
  }
  accounts_.insert_or_assign(identity, *previous);
}

void LedgerState::clear() {
  accounts_.clear();
}

std::vector<std::pair<common::Identity, AccountState>> LedgerState::ordered() const {
  std::vector<std::pair<common::Identity, AccountState>> out(accounts_.begin(), accounts_.end());
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  return out;
}

}  // namespace ledger
}  // namespace lendcore
