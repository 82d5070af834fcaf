#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/policy/collateral_policy.hpp"

namespace lendcore {
namespace executor {

// Checks run on an account after a transition applied its bookkeeping and
// before any value leaves custody. visit() each modified account, then
// finalize(); a false result means the effects must be discarded.
class InvariantChecker {
 public:
  explicit InvariantChecker(const policy::CollateralPolicy& policy) : policy_(policy) {}

  void visit(common::TransitionKind kind,
             const common::Amount& amount,
             common::Identity identity,
             const std::optional<ledger::AccountState>& before,
             const ledger::AccountState& after);

  [[nodiscard]] bool finalize() const noexcept { return violations_.empty(); }
  [[nodiscard]] const std::vector<std::string>& violations() const noexcept { return violations_; }

 private:
  const policy::CollateralPolicy& policy_;
  std::vector<std::string> violations_{};

  void check_collateralized(common::Identity identity, const ledger::AccountState& after);
  void check_delta(common::TransitionKind kind,
                   const common::Amount& amount,
                   common::Identity identity,
                   const ledger::AccountState& before,
                   const ledger::AccountState& after);
};

}  // namespace executor
}  // namespace lendcore
