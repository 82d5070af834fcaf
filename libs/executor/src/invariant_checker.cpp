#include "lendcore/executor/invariant_checker.hpp"

#include <string>

namespace lendcore {
namespace executor {

namespace {

std::string describe(common::Identity identity) {
  return "account " + std::to_string(identity);
}

}  // namespace

void InvariantChecker::visit(common::TransitionKind kind,
                             const common::Amount& amount,
                             common::Identity identity,
                             const std::optional<ledger::AccountState>& before,
                             const ledger::AccountState& after) {
  check_collateralized(identity, after);
  check_delta(kind, amount, identity, before.value_or(ledger::AccountState{}), after);
}

void InvariantChecker::check_collateralized(common::Identity identity, const ledger::AccountState& after) {
  if (!policy_.within_limit(after.collateral, after.debt)) {
    violations_.push_back(describe(identity) + ": debt " + after.debt.str() + " exceeds limit " +
                          policy_.max_borrow(after.collateral).str());
  }
}

// Each transition moves exactly one balance by exactly its amount.
void InvariantChecker::check_delta(common::TransitionKind kind,
                                   const common::Amount& amount,
                                   common::Identity identity,
                                   const ledger::AccountState& before,
                                   const ledger::AccountState& after) {
  const common::WideAmount before_collateral{before.collateral};
  const common::WideAmount before_debt{before.debt};
  common::WideAmount expected_collateral = before_collateral;
  common::WideAmount expected_debt = before_debt;

  switch (kind) {
    case common::TransitionKind::kDeposit:
      expected_collateral += common::WideAmount{amount};
      break;
    case common::TransitionKind::kBorrow:
      expected_debt += common::WideAmount{amount};
      break;
    case common::TransitionKind::kRepay:
      if (before_debt < common::WideAmount{amount}) {
        violations_.push_back(describe(identity) + ": repaid more than owed");
        return;
      }
      expected_debt -= common::WideAmount{amount};
      break;
    case common::TransitionKind::kWithdraw:
      if (before_collateral < common::WideAmount{amount}) {
        violations_.push_back(describe(identity) + ": withdrew more than deposited");
        return;
      }
      expected_collateral -= common::WideAmount{amount};
      break;
    case common::TransitionKind::kClaim:
      break;
  }

  if (common::WideAmount{after.collateral} != expected_collateral ||
      common::WideAmount{after.debt} != expected_debt) {
    violations_.push_back(describe(identity) + ": " + std::string(common::to_string(kind)) +
                          " of " + amount.str() + " applied an unexpected balance change");
  }
}

}  // namespace executor
}  // namespace lendcore
