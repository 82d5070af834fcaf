#pragma once

#include <cstdint>
#include <string_view>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace transfer {

enum class TransferStatus : std::uint8_t {
  kDelivered,
  kRejected,
  kInsufficientCustody,
};

inline constexpr std::string_view to_string(TransferStatus status) noexcept {
  switch (status) {
    case TransferStatus::kDelivered:
      return "delivered";
    case TransferStatus::kRejected:
      return "rejected";
    case TransferStatus::kInsufficientCustody:
      return "insufficient_custody";
  }
  return "unknown";
}

// Holds and moves the underlying asset on behalf of the ledger.
//
// send() may run recipient code, which may call back into the ledger before
// send() returns. Any status other than kDelivered means no value left
// custody, including value moved by calls nested inside this one.
class CustodyLayer {
 public:
  virtual ~CustodyLayer() = default;

  virtual TransferStatus send(common::Identity recipient, const common::Amount& amount) = 0;
  virtual common::Amount reserve() const = 0;
};

}  // namespace transfer
}  // namespace lendcore
