#include "lendcore/executor/transition.hpp"

namespace lendcore {
namespace executor {

namespace {
constexpr std::uint16_t kRejectCodeBase = 3000;
}  // namespace

common::TransitionKind kind_of(const Transition& transition) noexcept {
  switch (transition.index()) {
    case 0:
      return common::TransitionKind::kDeposit;
    case 1:
      return common::TransitionKind::kBorrow;
    case 2:
      return common::TransitionKind::kRepay;
    case 3:
      return common::TransitionKind::kWithdraw;
    default:
      return common::TransitionKind::kClaim;
  }
}

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kCommitted:
      return "Committed";
    case Status::kZeroAmount:
      return "ZeroAmount";
    case Status::kInsufficientCollateral:
      return "InsufficientCollateral";
    case Status::kNoOutstandingDebt:
      return "NoOutstandingDebt";
    case Status::kOverRepayment:
      return "OverRepayment";
    case Status::kDebtOutstanding:
      return "DebtOutstanding";
    case Status::kInsufficientBalance:
      return "InsufficientBalance";
    case Status::kTransferFailed:
      return "TransferFailed";
    case Status::kUnderflow:
      return "Underflow";
    case Status::kOverflow:
      return "Overflow";
    case Status::kUnauthorized:
      return "Unauthorized";
    case Status::kNothingToClaim:
      return "NothingToClaim";
    case Status::kInvariantViolated:
      return "InvariantViolated";
  }
  return "Unknown";
}

std::uint16_t reject_code(Status status) noexcept {
  if (status == Status::kCommitted) {
    return 0;
  }
  return static_cast<std::uint16_t>(kRejectCodeBase + static_cast<std::uint16_t>(status));
}

std::uint64_t CostSchedule::cost_of(common::TransitionKind kind) const noexcept {
  switch (kind) {
    case common::TransitionKind::kDeposit:
      return deposit;
    case common::TransitionKind::kBorrow:
      return borrow;
    case common::TransitionKind::kRepay:
      return repay;
    case common::TransitionKind::kWithdraw:
      return withdraw;
    case common::TransitionKind::kClaim:
      return claim;
  }
  return 0;
}

}  // namespace executor
}  // namespace lendcore
