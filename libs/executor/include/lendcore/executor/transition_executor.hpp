#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_log.hpp"
#include "lendcore/executor/journal.hpp"
#include "lendcore/executor/transition.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/ledger/state_root.hpp"
#include "lendcore/policy/collateral_policy.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/transfer/custody.hpp"
#include "lendcore/transfer/transfer_gate.hpp"

namespace lendcore {
namespace executor {

struct ExecutorOptions {
  std::uint32_t collateral_ratio_percent{policy::kDefaultCollateralRatioPercent};
  transfer::TransferMode transfer_mode{transfer::TransferMode::kPush};
  CostSchedule costs{};
};

// Sole owner and mutator of the ledger.
//
// Every transition validates completely, applies its bookkeeping, checks the
// collateral invariant, and only then lets value leave custody. A rejected
// transition leaves the ledger and the event log untouched. Transitions
// reached reentrantly from inside a transfer see the effects already applied
// and commit or roll back together with the transition that made the call.
//
// Committed events are stored in the event log before its sink sees them. If
// the sink throws, the exception leaves the outermost transition and the
// executor halts: every later transition throws std::logic_error.
class TransitionExecutor {
 public:
  using Options = ExecutorOptions;

  explicit TransitionExecutor(transfer::CustodyLayer& custody,
                              Options options = Options{},
                              telemetry::TelemetrySink* telemetry = nullptr);
  TransitionExecutor(const TransitionExecutor&) = delete;
  TransitionExecutor& operator=(const TransitionExecutor&) = delete;

  // Runs `transition` on behalf of `caller`; callers may only act on their own account.
  TransitionResult apply(common::Identity caller, const Transition& transition);

  TransitionResult deposit(common::Identity identity, const common::Amount& amount);
  TransitionResult borrow(common::Identity identity, const common::Amount& amount);
  TransitionResult repay(common::Identity identity, const common::Amount& amount);
  TransitionResult withdraw(common::Identity identity, const common::Amount& amount);
  TransitionResult claim(common::Identity identity);

  [[nodiscard]] common::Amount available_to_borrow(common::Identity identity) const;
  [[nodiscard]] ledger::AccountState account(common::Identity identity) const;
  [[nodiscard]] common::Amount pending(common::Identity identity) const;
  [[nodiscard]] ledger::StateRoot state_root() const;

  [[nodiscard]] const ledger::LedgerState& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const policy::CollateralPolicy& policy() const noexcept { return policy_; }
  [[nodiscard]] const transfer::TransferGate& gate() const noexcept { return gate_; }
  [[nodiscard]] const CostSchedule& costs() const noexcept { return costs_; }
  [[nodiscard]] events::EventLog& event_log() noexcept { return log_; }
  [[nodiscard]] const events::EventLog& event_log() const noexcept { return log_; }
  [[nodiscard]] bool in_transition() const noexcept { return depth_ > 0; }
  [[nodiscard]] bool halted() const noexcept { return halted_; }

  // Snapshot payload of the ledger and pending credits, tagged with the policy ratio.
  [[nodiscard]] std::vector<std::byte> serialize_state() const;
  // Replaces the ledger with a snapshot taken after event `sequence`. Throws
  // std::runtime_error on a malformed payload or one that violates the policy.
  void restore_state(common::SequenceId sequence, std::span<const std::byte> payload);
  // Re-applies a committed event without contacting custody.
  void replay(const events::Event& event);

 private:
  using Body = std::function<Status()>;

  policy::CollateralPolicy policy_;
  transfer::TransferGate gate_;
  CostSchedule costs_;
  telemetry::TelemetrySink* telemetry_;

  ledger::LedgerState ledger_{};
  events::EventLog log_{};
  Journal journal_{};
  std::size_t depth_{0};
  bool halted_{false};

  TransitionResult run(common::TransitionKind kind, const Body& body);
  TransitionResult reject(common::TransitionKind kind, Status status);
  void record_metrics(common::TransitionKind kind, Status status, std::chrono::nanoseconds latency);

  ledger::AccountState& touch(common::Identity identity);
  void credit_pending(common::Identity identity, const common::Amount& amount);
  Status check_effects(common::TransitionKind kind,
                       common::Identity identity,
                       const common::Amount& amount,
                       const std::optional<ledger::AccountState>& before);
  Status release_value(common::Identity identity, const common::Amount& amount);
};

}  // namespace executor
}  // namespace lendcore
