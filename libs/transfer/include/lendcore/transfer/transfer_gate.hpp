#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/transfer/custody.hpp"

namespace lendcore {
namespace transfer {

enum class TransferMode : std::uint8_t {
  kPush,  // deliver through custody once the bookkeeping effect is applied
  kPull,  // credit a pending balance; the recipient claims it later
};

std::optional<TransferMode> parse_transfer_mode(std::string_view text);
std::string_view to_string(TransferMode mode) noexcept;

// Outbound side of the ledger. The gate never mutates account balances; the
// executor applies its bookkeeping first and only then asks the gate to move
// value or record a credit.
class TransferGate {
 public:
  struct Stats {
    std::uint64_t delivered{0};
    std::uint64_t failed{0};
    std::uint64_t credited{0};
  };

  TransferGate(CustodyLayer& custody, TransferMode mode);

  [[nodiscard]] TransferMode mode() const noexcept { return mode_; }

  TransferStatus send(common::Identity recipient, const common::Amount& amount);

  // Pull-credit bookkeeping. credit() throws std::overflow_error past 2^256-1.
  void credit(common::Identity recipient, const common::Amount& amount);
  [[nodiscard]] common::Amount pending(common::Identity recipient) const;
  common::Amount take_pending(common::Identity recipient);
  void restore_pending(common::Identity recipient, const common::Amount& amount);
  void clear_pending();

  [[nodiscard]] std::vector<std::pair<common::Identity, common::Amount>> ordered_pending() const;
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  CustodyLayer& custody_;
  TransferMode mode_;
  std::unordered_map<common::Identity, common::Amount> pending_{};
  Stats stats_{};
};

}  // namespace transfer
}  // namespace lendcore
