#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace lendcore {
namespace common {

using Identity = std::uint64_t;
using SequenceId = std::uint64_t;
using TimestampNs = std::int64_t;

// Checked 256-bit amounts: overflow and negative results raise instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;
// Intermediate for products of two amounts-scale values (collateral * 100).
using WideAmount = boost::multiprecision::checked_uint512_t;

inline constexpr std::size_t kAmountBytes = 32;

enum class TransitionKind : std::uint8_t {
  kDeposit = 1,
  kBorrow = 2,
  kRepay = 3,
  kWithdraw = 4,
  kClaim = 5,
};

inline constexpr std::string_view to_string(TransitionKind kind) noexcept {
  switch (kind) {
    case TransitionKind::kDeposit:
      return "deposit";
    case TransitionKind::kBorrow:
      return "borrow";
    case TransitionKind::kRepay:
      return "repay";
    case TransitionKind::kWithdraw:
      return "withdraw";
    case TransitionKind::kClaim:
      return "claim";
  }
  return "unknown";
}

}  // namespace common
}  // namespace lendcore
