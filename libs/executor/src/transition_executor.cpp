#include "lendcore/executor/transition_executor.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "lendcore/common/amount.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/executor/invariant_checker.hpp"

namespace lendcore {
namespace executor {

namespace {

constexpr std::uint32_t kStateMagic = 0x4c435354;  // 'LCST'
constexpr std::uint16_t kStateVersion = 1;

template <typename T>
void put_be(std::vector<std::byte>& out, T value) {
  for (int shift = static_cast<int>(sizeof(T) * 8) - 8; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

class StateReader {
 public:
  explicit StateReader(std::span<const std::byte> payload) : payload_(payload) {}

  template <typename T>
  T get_be() {
    require(sizeof(T));
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      value = static_cast<T>((value << 8) | static_cast<std::uint8_t>(payload_[offset_ + i]));
    }
    offset_ += sizeof(T);
    return value;
  }

  common::Amount get_amount() {
    require(common::kAmountBytes);
    const auto bytes = payload_.subspan(offset_).first<common::kAmountBytes>();
    offset_ += common::kAmountBytes;
    return common::decode_amount(bytes);
  }

  [[nodiscard]] bool exhausted() const noexcept { return offset_ == payload_.size(); }

 private:
  std::span<const std::byte> payload_;
  std::size_t offset_{0};

  void require(std::size_t bytes) const {
    if (payload_.size() - offset_ < bytes) {
      throw std::runtime_error("truncated ledger snapshot");
    }
  }
};

}  // namespace

TransitionExecutor::TransitionExecutor(transfer::CustodyLayer& custody,
                                       Options options,
                                       telemetry::TelemetrySink* telemetry)
    : policy_(options.collateral_ratio_percent),
      gate_(custody, options.transfer_mode),
      costs_(options.costs),
      telemetry_(telemetry) {}

TransitionResult TransitionExecutor::apply(common::Identity caller, const Transition& transition) {
  const common::TransitionKind kind = kind_of(transition);
  const common::Identity owner = std::visit([](const auto& t) { return t.account; }, transition);
  if (caller != owner) {
    return reject(kind, Status::kUnauthorized);
  }

  return std::visit(
      [this](const auto& t) -> TransitionResult {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Deposit>) {
          return deposit(t.account, t.amount);
        } else if constexpr (std::is_same_v<T, Borrow>) {
          return borrow(t.account, t.amount);
        } else if constexpr (std::is_same_v<T, Repay>) {
          return repay(t.account, t.amount);
        } else if constexpr (std::is_same_v<T, Withdraw>) {
          return withdraw(t.account, t.amount);
        } else {
          return claim(t.account);
        }
      },
      transition);
}

TransitionResult TransitionExecutor::deposit(common::Identity identity, const common::Amount& amount) {
  return run(common::TransitionKind::kDeposit, [&]() -> Status {
    if (amount == 0) {
      return Status::kZeroAmount;
    }

    const auto* existing = ledger_.find(identity);
    const std::optional<ledger::AccountState> before =
        existing ? std::optional<ledger::AccountState>{*existing} : std::nullopt;

    touch(identity).collateral += amount;
    if (const Status status = check_effects(common::TransitionKind::kDeposit, identity, amount, before);
        status != Status::kCommitted) {
      return status;
    }

    journal_.stage(events::EventKind::kDeposited, identity, amount);
    return Status::kCommitted;
  });
}

TransitionResult TransitionExecutor::borrow(common::Identity identity, const common::Amount& amount) {
  return run(common::TransitionKind::kBorrow, [&]() -> Status {
    if (amount == 0) {
      return Status::kZeroAmount;
    }

    const ledger::AccountState before = ledger_.get(identity);
    const common::WideAmount requested = common::WideAmount{before.debt} + common::WideAmount{amount};
    if (requested > common::WideAmount{policy_.max_borrow(before.collateral)}) {
      return Status::kInsufficientCollateral;
    }

    // Debt is on the books before any value leaves: a reentrant borrow sees it.
    touch(identity).debt += amount;
    if (const Status status = check_effects(common::TransitionKind::kBorrow, identity, amount, before);
        status != Status::kCommitted) {
      return status;
    }

    // Staged ahead of the transfer so that transitions nested inside it log after this one.
    journal_.stage(events::EventKind::kBorrowed, identity, amount);
    return release_value(identity, amount);
  });
}

TransitionResult TransitionExecutor::repay(common::Identity identity, const common::Amount& amount) {
  return run(common::TransitionKind::kRepay, [&]() -> Status {
    const ledger::AccountState before = ledger_.get(identity);
    if (before.debt == 0) {
      return Status::kNoOutstandingDebt;
    }
    if (amount == 0) {
      return Status::kZeroAmount;
    }
    if (amount > before.debt) {
      return Status::kOverRepayment;
    }

    touch(identity).debt -= amount;
    if (const Status status = check_effects(common::TransitionKind::kRepay, identity, amount, before);
        status != Status::kCommitted) {
      return status;
    }

    journal_.stage(events::EventKind::kRepaid, identity, amount);
    return Status::kCommitted;
  });
}

TransitionResult TransitionExecutor::withdraw(common::Identity identity, const common::Amount& amount) {
  return run(common::TransitionKind::kWithdraw, [&]() -> Status {
    const ledger::AccountState before = ledger_.get(identity);
    if (before.debt != 0) {
      return Status::kDebtOutstanding;
    }
    if (amount == 0) {
      return Status::kZeroAmount;
    }
    if (amount > before.collateral) {
      return Status::kInsufficientBalance;
    }

    touch(identity).collateral -= amount;
    if (const Status status = check_effects(common::TransitionKind::kWithdraw, identity, amount, before);
        status != Status::kCommitted) {
      return status;
    }

    journal_.stage(events::EventKind::kWithdrawn, identity, amount);
    return release_value(identity, amount);
  });
}

TransitionResult TransitionExecutor::claim(common::Identity identity) {
  return run(common::TransitionKind::kClaim, [&]() -> Status {
    if (gate_.pending(identity) == 0) {
      return Status::kNothingToClaim;
    }

    common::Amount owed = gate_.take_pending(identity);
    journal_.record([this, identity, owed]() { gate_.restore_pending(identity, owed); });
    journal_.stage(events::EventKind::kClaimed, identity, owed);

    if (gate_.send(identity, owed) != transfer::TransferStatus::kDelivered) {
      if (telemetry_) {
        telemetry_->increment(telemetry::metric::kTransferFailures);
      }
      return Status::kTransferFailed;
    }
    return Status::kCommitted;
  });
}

common::Amount TransitionExecutor::available_to_borrow(common::Identity identity) const {
  if (telemetry_) {
    telemetry_->increment(telemetry::metric::kQueries);
  }
  const ledger::AccountState state = ledger_.get(identity);
  return policy_.available_to_borrow(state.collateral, state.debt);
}

ledger::AccountState TransitionExecutor::account(common::Identity identity) const {
  return ledger_.get(identity);
}

common::Amount TransitionExecutor::pending(common::Identity identity) const {
  return gate_.pending(identity);
}

ledger::StateRoot TransitionExecutor::state_root() const {
  return ledger::compute_state_root(ledger_, gate_.ordered_pending());
}

std::vector<std::byte> TransitionExecutor::serialize_state() const {
  const auto accounts = ledger_.ordered();
  const auto credits = gate_.ordered_pending();

  std::vector<std::byte> out;
  out.reserve(18 + accounts.size() * (8 + 2 * common::kAmountBytes) + 8 +
              credits.size() * (8 + common::kAmountBytes));
  put_be<std::uint32_t>(out, kStateMagic);
  put_be<std::uint16_t>(out, kStateVersion);
  put_be<std::uint32_t>(out, policy_.ratio_percent());

  put_be<std::uint64_t>(out, accounts.size());
  for (const auto& [identity, state] : accounts) {
    put_be<std::uint64_t>(out, identity);
    common::append_amount(out, state.collateral);
    common::append_amount(out, state.debt);
  }

  put_be<std::uint64_t>(out, credits.size());
  for (const auto& [identity, amount] : credits) {
    put_be<std::uint64_t>(out, identity);
    common::append_amount(out, amount);
  }
  return out;
}

void TransitionExecutor::restore_state(common::SequenceId sequence, std::span<const std::byte> payload) {
  if (in_transition()) {
    throw std::logic_error("cannot restore ledger state inside a transition");
  }

  StateReader reader(payload);
  if (reader.get_be<std::uint32_t>() != kStateMagic) {
    throw std::runtime_error("invalid ledger snapshot magic");
  }
  if (const auto version = reader.get_be<std::uint16_t>(); version != kStateVersion) {
    throw std::runtime_error("unsupported ledger snapshot version " + std::to_string(version));
  }
  if (const auto ratio = reader.get_be<std::uint32_t>(); ratio != policy_.ratio_percent()) {
    throw std::runtime_error("snapshot uses collateral ratio " + std::to_string(ratio) + "%, configured " +
                             std::to_string(policy_.ratio_percent()) + "%");
  }

  ledger::LedgerState restored;
  const auto account_count = reader.get_be<std::uint64_t>();
  for (std::uint64_t i = 0; i < account_count; ++i) {
    const auto identity = reader.get_be<std::uint64_t>();
    ledger::AccountState state;
    state.collateral = reader.get_amount();
    state.debt = reader.get_amount();
    if (!policy_.within_limit(state.collateral, state.debt)) {
      throw std::runtime_error("snapshot account " + std::to_string(identity) + " is undercollateralized");
    }
    restored.open(identity) = std::move(state);
  }

  std::vector<std::pair<common::Identity, common::Amount>> credits;
  const auto credit_count = reader.get_be<std::uint64_t>();
  for (std::uint64_t i = 0; i < credit_count; ++i) {
    const auto identity = reader.get_be<std::uint64_t>();
    credits.emplace_back(identity, reader.get_amount());
  }
  if (!reader.exhausted()) {
    throw std::runtime_error("trailing bytes in ledger snapshot");
  }

  ledger_ = std::move(restored);
  gate_.clear_pending();
  for (const auto& [identity, amount] : credits) {
    gate_.restore_pending(identity, amount);
  }
  log_.reset(sequence);
}

void TransitionExecutor::replay(const events::Event& event) {
  if (in_transition()) {
    throw std::logic_error("cannot replay events inside a transition");
  }
  if (event.sequence != log_.last_sequence() + 1) {
    throw std::runtime_error("event " + std::to_string(event.sequence) + " does not follow " +
                             std::to_string(log_.last_sequence()));
  }

  const bool pull = gate_.mode() == transfer::TransferMode::kPull;
  ledger::AccountState next = ledger_.get(event.identity);
  common::Amount credit = gate_.pending(event.identity);

  try {
    switch (event.kind) {
      case events::EventKind::kDeposited:
        next.collateral += event.amount;
        break;
      case events::EventKind::kBorrowed:
        next.debt += event.amount;
        if (pull) {
          credit += event.amount;
        }
        break;
      case events::EventKind::kRepaid:
        next.debt -= event.amount;
        break;
      case events::EventKind::kWithdrawn:
        next.collateral -= event.amount;
        if (pull) {
          credit += event.amount;
        }
        break;
      case events::EventKind::kClaimed:
        if (!pull || credit != event.amount) {
          throw std::runtime_error("claim does not match pending credit");
        }
        credit = 0;
        break;
    }
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("cannot replay event " + std::to_string(event.sequence) + ": " + e.what());
  }

  if (!policy_.within_limit(next.collateral, next.debt)) {
    throw std::runtime_error("replayed event " + std::to_string(event.sequence) +
                             " leaves account " + std::to_string(event.identity) + " undercollateralized");
  }

  if (event.kind != events::EventKind::kClaimed) {
    ledger_.open(event.identity) = std::move(next);
  }
  gate_.restore_pending(event.identity, credit);
  log_.restore(event);
}

TransitionResult TransitionExecutor::run(common::TransitionKind kind, const Body& body) {
  if (halted_) {
    throw std::logic_error("transition executor halted after an event journal failure");
  }

  const common::Stopwatch stopwatch;
  const Journal::Savepoint savepoint = journal_.savepoint();
  if (depth_ > 0 && telemetry_) {
    telemetry_->increment(telemetry::metric::kReentrantCalls);
  }

  ++depth_;
  Status status = Status::kCommitted;
  try {
    status = body();
  } catch (const std::overflow_error&) {
    status = Status::kOverflow;
  } catch (const std::underflow_error&) {
    status = Status::kUnderflow;
  } catch (const std::range_error&) {
    status = Status::kUnderflow;
  } catch (...) {
    --depth_;
    journal_.rollback_to(savepoint);
    throw;
  }
  --depth_;

  if (status != Status::kCommitted) {
    journal_.rollback_to(savepoint);
  } else if (depth_ == 0) {
    try {
      log_.append_all(journal_.release());
    } catch (...) {
      halted_ = true;
      throw;
    }
  }

  record_metrics(kind, status, stopwatch.elapsed());
  return TransitionResult{
      .status = status,
      .reject_code = reject_code(status),
      .cost = costs_.cost_of(kind),
  };
}

TransitionResult TransitionExecutor::reject(common::TransitionKind kind, Status status) {
  record_metrics(kind, status, std::chrono::nanoseconds{0});
  return TransitionResult{
      .status = status,
      .reject_code = reject_code(status),
      .cost = costs_.cost_of(kind),
  };
}

void TransitionExecutor::record_metrics(common::TransitionKind kind,
                                        Status status,
                                        std::chrono::nanoseconds latency) {
  if (!telemetry_) {
    return;
  }
  const auto kind_offset = static_cast<std::uint64_t>(kind);
  const auto base = status == Status::kCommitted ? telemetry::metric::kCommitted : telemetry::metric::kRejected;
  telemetry_->increment(base + kind_offset);
  telemetry_->increment(telemetry::metric::kStatus + static_cast<std::uint64_t>(status));
  telemetry_->record_latency(telemetry::metric::kLatencyBase + kind_offset, latency);
}

ledger::AccountState& TransitionExecutor::touch(common::Identity identity) {
  std::optional<ledger::AccountState> previous;
  if (const auto* existing = ledger_.find(identity)) {
    previous = *existing;
  }
  journal_.record([this, identity, previous]() { ledger_.restore(identity, previous); });
  return ledger_.open(identity);
}

void TransitionExecutor::credit_pending(common::Identity identity, const common::Amount& amount) {
  common::Amount previous = gate_.pending(identity);
  gate_.credit(identity, amount);
  journal_.record([this, identity, previous]() { gate_.restore_pending(identity, previous); });
}

Status TransitionExecutor::check_effects(common::TransitionKind kind,
                                         common::Identity identity,
                                         const common::Amount& amount,
                                         const std::optional<ledger::AccountState>& before) {
  InvariantChecker checker{policy_};
  checker.visit(kind, amount, identity, before, ledger_.get(identity));
  return checker.finalize() ? Status::kCommitted : Status::kInvariantViolated;
}

Status TransitionExecutor::release_value(common::Identity identity, const common::Amount& amount) {
  if (gate_.mode() == transfer::TransferMode::kPull) {
    credit_pending(identity, amount);
    return Status::kCommitted;
  }

  if (gate_.send(identity, amount) != transfer::TransferStatus::kDelivered) {
    if (telemetry_) {
      telemetry_->increment(telemetry::metric::kTransferFailures);
    }
    return Status::kTransferFailed;
  }
  return Status::kCommitted;
}

}  // namespace executor
}  // namespace lendcore
