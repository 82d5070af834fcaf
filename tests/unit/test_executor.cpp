#include "test_executor.hpp"

#include <cassert>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>

#include "lendcore/executor/invariant_checker.hpp"
#include "lendcore/executor/journal.hpp"
#include "lendcore/executor/transition_executor.hpp"
#include "lendcore/transfer/in_memory_custody.hpp"

namespace lendcore::tests {

namespace {

constexpr common::Identity kAlice = 1;
constexpr common::Identity kBob = 2;

executor::TransitionExecutor::Options pull_options() {
  return executor::TransitionExecutor::Options{.transfer_mode = transfer::TransferMode::kPull};
}

}  // namespace

void test_deposit_and_available() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  auto result = ledger.deposit(kAlice, 1);
  assert(result.committed());
  assert(result.reject_code == 0);
  assert(result.cost == ledger.costs().deposit);
  assert(ledger.available_to_borrow(kAlice) == 0);

  assert(ledger.deposit(kAlice, 149).committed());
  assert(ledger.account(kAlice).collateral == 150);
  assert(ledger.available_to_borrow(kAlice) == 100);
  assert(ledger.available_to_borrow(kBob) == 0);

  const auto& events = ledger.event_log().events();
  assert(events.size() == 2);
  assert(events[0].kind == events::EventKind::kDeposited);
  assert(events[0].amount == 1);
  assert(events[1].sequence == 2);
  assert(custody.delivery_count() == 0);
}

void test_borrow_limit() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  assert(ledger.deposit(kAlice, 150).committed());
  auto result = ledger.borrow(kAlice, 100);
  assert(result.committed());
  assert(ledger.account(kAlice).debt == 100);
  assert(custody.delivered_to(kAlice) == 100);

  result = ledger.borrow(kAlice, 1);
  assert(result.status == executor::Status::kInsufficientCollateral);
  assert(result.reject_code == 3002);
  assert(result.cost == ledger.costs().borrow);
  assert(ledger.account(kAlice).debt == 100);
  assert(ledger.event_log().size() == 2);

  // No collateral, no account.
  result = ledger.borrow(kBob, 1);
  assert(result.status == executor::Status::kInsufficientCollateral);
  assert(!ledger.ledger().contains(kBob));
}

void test_withdraw_requires_zero_debt() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  assert(ledger.deposit(kAlice, 300).committed());
  assert(ledger.borrow(kAlice, 100).committed());
  // Even though 300 collateral covers far more than 100 debt.
  assert(ledger.withdraw(kAlice, 1).status == executor::Status::kDebtOutstanding);
  assert(ledger.withdraw(kAlice, 0).status == executor::Status::kDebtOutstanding);

  assert(ledger.repay(kAlice, 100).committed());
  assert(ledger.withdraw(kAlice, 301).status == executor::Status::kInsufficientBalance);
  assert(ledger.withdraw(kAlice, 200).committed());
  assert(ledger.account(kAlice).collateral == 100);
  assert(custody.delivered_to(kAlice) == 300);
}

void test_repay_partial_and_over() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  assert(ledger.repay(kAlice, 10).status == executor::Status::kNoOutstandingDebt);

  assert(ledger.deposit(kAlice, 150).committed());
  assert(ledger.borrow(kAlice, 100).committed());
  assert(ledger.repay(kAlice, 60).committed());
  assert(ledger.account(kAlice).debt == 40);

  const auto over = ledger.repay(kAlice, 41);
  assert(over.status == executor::Status::kOverRepayment);
  assert(over.reject_code == 3004);
  assert(ledger.account(kAlice).debt == 40);

  assert(ledger.repay(kAlice, 40).committed());
  assert(ledger.account(kAlice).debt == 0);
  assert(ledger.repay(kAlice, 1).status == executor::Status::kNoOutstandingDebt);
  assert(ledger.available_to_borrow(kAlice) == 100);
}

void test_zero_amounts() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  assert(ledger.deposit(kAlice, 0).status == executor::Status::kZeroAmount);
  assert(!ledger.ledger().contains(kAlice));

  assert(ledger.deposit(kAlice, 150).committed());
  assert(ledger.withdraw(kAlice, 0).status == executor::Status::kZeroAmount);
  assert(ledger.borrow(kAlice, 0).status == executor::Status::kZeroAmount);
  assert(ledger.repay(kAlice, 0).status == executor::Status::kNoOutstandingDebt);

  assert(ledger.borrow(kAlice, 10).committed());
  assert(ledger.repay(kAlice, 0).status == executor::Status::kZeroAmount);
  assert(ledger.event_log().size() == 2);
}

void test_round_trip() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  const auto empty_root = ledger.state_root();

  assert(ledger.deposit(kAlice, 1'500).committed());
  assert(ledger.borrow(kAlice, 1'000).committed());
  assert(ledger.repay(kAlice, 1'000).committed());
  assert(ledger.withdraw(kAlice, 1'500).committed());

  assert(ledger.account(kAlice) == ledger::AccountState{});
  // The account record persists at zero, so the root differs from a ledger that never saw it.
  assert(ledger.state_root() != empty_root);

  const auto& events = ledger.event_log().events();
  assert(events.size() == 4);
  assert(events[0].kind == events::EventKind::kDeposited);
  assert(events[1].kind == events::EventKind::kBorrowed);
  assert(events[2].kind == events::EventKind::kRepaid);
  assert(events[3].kind == events::EventKind::kWithdrawn);
  assert(events[3].sequence == 4);
  assert(custody.delivered_to(kAlice) == 2'500);
}

void test_unauthorized_caller() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};

  const auto denied = ledger.apply(kBob, executor::Deposit{.account = kAlice, .amount = 10});
  assert(denied.status == executor::Status::kUnauthorized);
  assert(denied.reject_code == 3010);
  assert(denied.cost == ledger.costs().deposit);
  assert(!ledger.ledger().contains(kAlice));

  assert(ledger.apply(kAlice, executor::Deposit{.account = kAlice, .amount = 150}).committed());
  assert(ledger.apply(kBob, executor::Borrow{.account = kAlice, .amount = 1}).status ==
         executor::Status::kUnauthorized);
  assert(ledger.apply(kAlice, executor::Borrow{.account = kAlice, .amount = 100}).committed());
  assert(ledger.apply(kAlice, executor::Repay{.account = kAlice, .amount = 100}).committed());
  assert(ledger.apply(kAlice, executor::Withdraw{.account = kAlice, .amount = 150}).committed());
  assert(ledger.apply(kAlice, executor::Claim{.account = kAlice}).status == executor::Status::kNothingToClaim);
}

void test_reentrant_borrow_sees_debt() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  assert(ledger.deposit(kAlice, 150).committed());

  bool entered = false;
  bool nested = false;
  common::Amount debt_seen = 0;
  std::optional<executor::TransitionResult> inner;
  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) {
    if (entered) {
      return true;
    }
    entered = true;
    nested = ledger.in_transition();
    debt_seen = ledger.account(kAlice).debt;
    inner = ledger.borrow(kAlice, 1);
    return true;
  });

  assert(ledger.borrow(kAlice, 100).committed());
  assert(nested);
  assert(debt_seen == 100);
  assert(inner.has_value());
  assert(inner->status == executor::Status::kInsufficientCollateral);

  assert(ledger.account(kAlice).debt == 100);
  assert(custody.delivered_to(kAlice) == 100);
  assert(ledger.event_log().size() == 2);
  assert(!ledger.in_transition());
}

void test_reentrant_borrow_within_limit() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  assert(ledger.deposit(kAlice, 150).committed());

  bool entered = false;
  std::optional<executor::TransitionResult> inner;
  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) {
    if (!entered) {
      entered = true;
      inner = ledger.borrow(kAlice, 40);
    }
    return true;
  });

  assert(ledger.borrow(kAlice, 60).committed());
  assert(inner && inner->committed());
  assert(ledger.account(kAlice).debt == 100);
  assert(custody.delivered_to(kAlice) == 100);

  // Logged in the order the debt was booked: the outer borrow, then the one
  // made from inside its transfer.
  const auto& events = ledger.event_log().events();
  assert(events.size() == 3);
  assert(events[1].amount == 60);
  assert(events[2].amount == 40);

  custody.clear_recipient_hook(kAlice);
  assert(ledger.borrow(kAlice, 1).status == executor::Status::kInsufficientCollateral);
}

void test_transfer_failure_rolls_back() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  assert(ledger.deposit(kAlice, 150).committed());

  const auto account_before = ledger.account(kAlice);
  const auto root_before = ledger.state_root();
  custody.set_rejecting(kAlice, true);

  const auto failed = ledger.borrow(kAlice, 100);
  assert(failed.status == executor::Status::kTransferFailed);
  assert(failed.reject_code == 3007);
  assert(ledger.account(kAlice) == account_before);
  assert(ledger.state_root() == root_before);
  assert(ledger.event_log().size() == 1);
  assert(ledger.gate().stats().failed == 1);

  assert(ledger.withdraw(kAlice, 150).status == executor::Status::kTransferFailed);
  assert(ledger.account(kAlice).collateral == 150);

  // Custody without enough reserve fails the same way.
  transfer::InMemoryCustody shallow{50};
  executor::TransitionExecutor small{shallow};
  assert(small.deposit(kBob, 150).committed());
  assert(small.borrow(kBob, 100).status == executor::Status::kTransferFailed);
  assert(small.account(kBob).debt == 0);
  assert(small.borrow(kBob, 50).committed());
  assert(shallow.reserve() == 0);
}

void test_reentrant_effects_roll_back_with_outer() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  assert(ledger.deposit(kAlice, 150).committed());
  assert(ledger.deposit(kBob, 150).committed());
  const auto root_before = ledger.state_root();

  bool entered = false;
  std::optional<executor::TransitionResult> inner_borrow;
  std::optional<executor::TransitionResult> inner_deposit;
  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) {
    if (entered) {
      return true;
    }
    entered = true;
    inner_borrow = ledger.borrow(kAlice, 10);
    inner_deposit = ledger.deposit(kBob, 5);
    return false;
  });

  const auto outer = ledger.borrow(kAlice, 50);
  assert(outer.status == executor::Status::kTransferFailed);
  assert(inner_borrow && inner_borrow->committed());
  assert(inner_deposit && inner_deposit->committed());

  // Everything reached from inside the failed transfer is undone with it.
  assert(ledger.account(kAlice).debt == 0);
  assert(ledger.account(kBob).collateral == 150);
  assert(ledger.state_root() == root_before);
  assert(ledger.event_log().size() == 2);
  assert(custody.delivered_to(kAlice) == 0);
  assert(custody.reserve() == 1'000'000);
}

void test_foreign_exception_rolls_back() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody};
  assert(ledger.deposit(kAlice, 150).committed());
  const auto root_before = ledger.state_root();

  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) -> bool {
    assert(ledger.deposit(kBob, 5).committed());
    throw 42;
  });

  bool thrown = false;
  try {
    ledger.borrow(kAlice, 50);
  } catch (int code) {
    thrown = code == 42;
  }
  assert(thrown);
  assert(!ledger.in_transition());
  assert(ledger.state_root() == root_before);
  assert(ledger.event_log().size() == 1);
  assert(custody.reserve() == 1'000'000);

  custody.clear_recipient_hook(kAlice);
  assert(ledger.borrow(kAlice, 50).committed());
  assert(custody.delivered_to(kAlice) == 50);
}

void test_journal_failure_halts() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody, executor::ExecutorOptions{}};
  assert(ledger.deposit(kAlice, 150).committed());

  std::size_t journaled = 0;
  ledger.event_log().set_sink([&](const events::Event&) {
    if (journaled == 1) {
      throw std::runtime_error("disk full");
    }
    ++journaled;
  });
  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) {
    return ledger.deposit(kBob, 20).committed();
  });

  bool failed = false;
  try {
    ledger.borrow(kAlice, 100);
  } catch (const std::runtime_error&) {
    failed = true;
  }
  assert(failed);
  assert(ledger.halted());
  assert(!ledger.in_transition());

  // The unit committed and its whole batch is in the log, outer event first.
  assert(ledger.account(kAlice).debt == 100);
  assert(ledger.account(kBob).collateral == 20);
  const auto& events = ledger.event_log().events();
  assert(events.size() == 3);
  assert(events[1].kind == events::EventKind::kBorrowed);
  assert(events[2].kind == events::EventKind::kDeposited);
  assert(ledger.event_log().last_sequence() == 3);

  bool refused = false;
  try {
    ledger.repay(kAlice, 100);
  } catch (const std::logic_error&) {
    refused = true;
  }
  assert(refused);
  assert(ledger.account(kAlice).debt == 100);
  assert(ledger.event_log().size() == 3);
}

void test_pull_mode_claim() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor ledger{custody, pull_options()};
  assert(ledger.gate().mode() == transfer::TransferMode::kPull);

  bool contacted = false;
  custody.set_recipient_hook(kAlice, [&](common::Identity, const common::Amount&) {
    contacted = true;
    return true;
  });

  assert(ledger.claim(kAlice).status == executor::Status::kNothingToClaim);
  assert(ledger.deposit(kAlice, 150).committed());
  assert(ledger.borrow(kAlice, 100).committed());
  assert(!contacted);
  assert(custody.delivered_to(kAlice) == 0);
  assert(ledger.pending(kAlice) == 100);

  const auto claimed = ledger.claim(kAlice);
  assert(claimed.committed());
  assert(claimed.cost == ledger.costs().claim);
  assert(contacted);
  assert(custody.delivered_to(kAlice) == 100);
  assert(ledger.pending(kAlice) == 0);
  assert(ledger.claim(kAlice).reject_code == 3011);

  assert(ledger.repay(kAlice, 100).committed());
  assert(ledger.withdraw(kAlice, 150).committed());
  assert(ledger.pending(kAlice) == 150);

  custody.set_rejecting(kAlice, true);
  const auto root_before = ledger.state_root();
  assert(ledger.claim(kAlice).status == executor::Status::kTransferFailed);
  assert(ledger.pending(kAlice) == 150);
  assert(ledger.state_root() == root_before);

  custody.set_rejecting(kAlice, false);
  assert(ledger.claim(kAlice).committed());
  assert(custody.delivered_to(kAlice) == 250);

  const auto& events = ledger.event_log().events();
  assert(events.size() == 6);
  assert(events[2].kind == events::EventKind::kClaimed);
  assert(events[2].amount == 100);
  assert(events[5].kind == events::EventKind::kClaimed);
  assert(events[5].amount == 150);
}

void test_amount_overflow() {
  const common::Amount max = std::numeric_limits<common::Amount>::max();
  transfer::InMemoryCustody custody{max};
  executor::TransitionExecutor ledger{custody};

  assert(ledger.deposit(kAlice, max).committed());
  const auto overflow = ledger.deposit(kAlice, 1);
  assert(overflow.status == executor::Status::kOverflow);
  assert(overflow.reject_code == 3009);
  assert(ledger.account(kAlice).collateral == max);
  assert(ledger.event_log().size() == 1);

  const common::Amount cap = ledger.policy().max_borrow(max);
  assert(ledger.available_to_borrow(kAlice) == cap);
  assert(ledger.borrow(kAlice, cap).committed());
  // debt + amount exceeds 2^256 but is compared in wider arithmetic.
  assert(ledger.borrow(kAlice, max).status == executor::Status::kInsufficientCollateral);
  assert(ledger.account(kAlice).debt == cap);
}

void test_journal_savepoints() {
  executor::Journal journal;
  int value = 0;

  const auto outer = journal.savepoint();
  journal.record([&]() { value = 0; });
  value = 1;
  journal.stage(events::EventKind::kDeposited, kAlice, 10);

  const auto inner = journal.savepoint();
  journal.record([&]() { value = 1; });
  value = 2;
  journal.stage(events::EventKind::kBorrowed, kAlice, 5);

  journal.rollback_to(inner);
  assert(value == 1);
  assert(!journal.empty());

  const auto staged = journal.release();
  assert(staged.size() == 1);
  assert(staged[0].kind == events::EventKind::kDeposited);
  assert(journal.empty());

  journal.record([&]() { value = 7; });
  journal.stage(events::EventKind::kRepaid, kAlice, 1);
  journal.rollback_to(outer);
  assert(value == 7);
  assert(journal.empty());
}

void test_invariant_checker() {
  const policy::CollateralPolicy policy;

  executor::InvariantChecker fresh{policy};
  fresh.visit(common::TransitionKind::kDeposit, 10, kAlice, std::nullopt,
              ledger::AccountState{.collateral = 10, .debt = 0});
  assert(fresh.finalize());

  executor::InvariantChecker overdrawn{policy};
  overdrawn.visit(common::TransitionKind::kBorrow, 101, kAlice,
                  ledger::AccountState{.collateral = 150, .debt = 0},
                  ledger::AccountState{.collateral = 150, .debt = 101});
  assert(!overdrawn.finalize());
  assert(!overdrawn.violations().empty());

  executor::InvariantChecker skewed{policy};
  skewed.visit(common::TransitionKind::kDeposit, 10, kAlice, std::nullopt,
               ledger::AccountState{.collateral = 11, .debt = 0});
  assert(!skewed.finalize());

  executor::InvariantChecker unchanged{policy};
  unchanged.visit(common::TransitionKind::kRepay, 40, kAlice,
                  ledger::AccountState{.collateral = 150, .debt = 100},
                  ledger::AccountState{.collateral = 150, .debt = 100});
  assert(!unchanged.finalize());
}

}  // namespace lendcore::tests
