#include "lendcore/transfer/transfer_gate.hpp"

#include <algorithm>

namespace lendcore {
namespace transfer {

std::optional<TransferMode> parse_transfer_mode(std::string_view text) {
  if (text == "push") {
    return TransferMode::kPush;
  }
  if (text == "pull") {
    return TransferMode::kPull;
  }
  return std::nullopt;
}

std::string_view to_string(TransferMode mode) noexcept {
  return mode == TransferMode::kPull ? "pull" : "push";
}

TransferGate::TransferGate(CustodyLayer& custody, TransferMode mode)
    : custody_(custody), mode_(mode) {}

TransferStatus TransferGate::send(common::Identity recipient, const common::Amount& amount) {
  const TransferStatus status = custody_.send(recipient, amount);
  if (status == TransferStatus::kDelivered) {
    ++stats_.delivered;
  } else {
    ++stats_.failed;
  }
  return status;
}

void TransferGate::credit(common::Identity recipient, const common::Amount& amount) {
  if (amount == 0) {
    return;
  }
  const common::Amount updated = pending(recipient) + amount;
  pending_.insert_or_assign(recipient, updated);
  ++stats_.credited;
}

common::Amount TransferGate::pending(common::Identity recipient) const {
  if (auto it = pending_.find(recipient); it != pending_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount TransferGate::take_pending(common::Identity recipient) {
  auto it = pending_.find(recipient);
  if (it == pending_.end()) {
    return 0;
  }
  common::Amount amount = std::move(it->second);
  pending_.erase(it);
  return amount;
}

void TransferGate::restore_pending(common::Identity recipient, const common::Amount& amount) {
  if (amount == 0) {
    pending_.erase(recipient);
    return;
  }
  pending_.insert_or_assign(recipient, amount);
}

void TransferGate::clear_pending() {
  pending_.clear();
}

std::vector<std::pair<common::Identity, common::Amount>> TransferGate::ordered_pending() const {
  std::vector<std::pair<common::Identity, common::Amount>> out(pending_.begin(), pending_.end());
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  return out;
}

}  // namespace transfer
}  // namespace lendcore
