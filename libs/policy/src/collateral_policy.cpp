#include "lendcore/policy/collateral_policy.hpp"

#include <stdexcept>
#include <string>

namespace lendcore {
namespace policy {

namespace {
constexpr std::uint32_t kPercentDenominator = 100;
}  // namespace

CollateralPolicy::CollateralPolicy(std::uint32_t ratio_percent)
    : ratio_percent_(ratio_percent) {
  if (ratio_percent_ < kMinimumCollateralRatioPercent) {
    throw std::invalid_argument("collateral ratio must be at least " +
                                std::to_string(kMinimumCollateralRatioPercent) + " percent");
  }
}

common::Amount CollateralPolicy::max_borrow(const common::Amount& collateral) const {
  const common::WideAmount scaled = common::WideAmount{collateral} * kPercentDenominator;
  const common::WideAmount quotient = scaled / ratio_percent_;
  // ratio >= 100 keeps the quotient <= collateral, so the narrowing cannot overflow.
  return static_cast<common::Amount>(quotient);
}

common::Amount CollateralPolicy::available_to_borrow(const common::Amount& collateral,
                                                     const common::Amount& debt) const {
  const common::Amount limit = max_borrow(collateral);
  if (debt > limit) {
    throw std::underflow_error("debt " + debt.str() + " exceeds borrow limit " + limit.str());
  }
  return limit - debt;
}

bool CollateralPolicy::within_limit(const common::Amount& collateral, const common::Amount& debt) const {
  return debt <= max_borrow(collateral);
}

}  // namespace policy
}  // namespace lendcore
