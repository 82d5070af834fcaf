#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace policy {

constexpr std::uint32_t kDefaultCollateralRatioPercent = 150;
constexpr std::uint32_t kMinimumCollateralRatioPercent = 100;

// Maximum debt an amount of collateral supports at a fixed over-collateralization ratio.
class CollateralPolicy {
 public:
  explicit CollateralPolicy(std::uint32_t ratio_percent = kDefaultCollateralRatioPercent);

  // floor(collateral * 100 / ratio), evaluated in 512 bits.
  [[nodiscard]] common::Amount max_borrow(const common::Amount& collateral) const;

  // Throws std::underflow_error when debt already exceeds max_borrow(collateral).
  [[nodiscard]] common::Amount available_to_borrow(const common::Amount& collateral,
                                                   const common::Amount& debt) const;

  [[nodiscard]] bool within_limit(const common::Amount& collateral, const common::Amount& debt) const;
  [[nodiscard]] std::uint32_t ratio_percent() const noexcept { return ratio_percent_; }

 private:
  std::uint32_t ratio_percent_;
};

}  // namespace policy
}  // namespace lendcore
