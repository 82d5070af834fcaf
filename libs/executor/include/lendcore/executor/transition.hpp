#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace executor {

struct Deposit {
  common::Identity account{0};
  common::Amount amount{};
};

struct Borrow {
  common::Identity account{0};
  common::Amount amount{};
};

struct Repay {
  common::Identity account{0};
  common::Amount amount{};
};

struct Withdraw {
  common::Identity account{0};
  common::Amount amount{};
};

// Pull-credit mode only: moves the account's whole pending balance out of custody.
struct Claim {
  common::Identity account{0};
};

using Transition = std::variant<Deposit, Borrow, Repay, Withdraw, Claim>;

common::TransitionKind kind_of(const Transition& transition) noexcept;

enum class Status : std::uint8_t {
  kCommitted,
  kZeroAmount,
  kInsufficientCollateral,
  kNoOutstandingDebt,
  kOverRepayment,
  kDebtOutstanding,
  kInsufficientBalance,
  kTransferFailed,
  kUnderflow,
  kOverflow,
  kUnauthorized,
  kNothingToClaim,
  kInvariantViolated,
};

std::string_view to_string(Status status) noexcept;
std::uint16_t reject_code(Status status) noexcept;

struct TransitionResult {
  Status status{Status::kCommitted};
  std::uint16_t reject_code{0};
  std::uint64_t cost{0};

  [[nodiscard]] bool committed() const noexcept { return status == Status::kCommitted; }
};

// Fixed metered cost per operation, charged whether or not the operation commits.
struct CostSchedule {
  std::uint64_t deposit{21'000};
  std::uint64_t borrow{45'000};
  std::uint64_t repay{26'000};
  std::uint64_t withdraw{45'000};
  std::uint64_t claim{40'000};
  std::uint64_t query{2'100};

  [[nodiscard]] std::uint64_t cost_of(common::TransitionKind kind) const noexcept;
};

}  // namespace executor
}  // namespace lendcore
