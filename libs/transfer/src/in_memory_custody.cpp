#include "lendcore/transfer/in_memory_custody.hpp"

#include <exception>
#include <utility>

namespace lendcore {
namespace transfer {

InMemoryCustody::InMemoryCustody(common::Amount reserve)
    : reserve_(std::move(reserve)) {}

TransferStatus InMemoryCustody::send(common::Identity recipient, const common::Amount& amount) {
  if (rejecting_.contains(recipient)) {
    return TransferStatus::kRejected;
  }
  if (amount > reserve_) {
    return TransferStatus::kInsufficientCustody;
  }

  const std::size_t mark = in_flight_.size();
  auto& delivered = delivered_[recipient];
  in_flight_.push_back(UndoEntry{
      .recipient = recipient,
      .delivered_before = delivered,
      .reserve_before = reserve_,
      .count_before = delivery_count_,
  });

  reserve_ -= amount;
  delivered += amount;
  ++delivery_count_;

  bool accepted = true;
  if (auto it = hooks_.find(recipient); it != hooks_.end()) {
    // Copy: the hook may replace itself while running.
    const RecipientHook hook = it->second;
    try {
      accepted = hook(recipient, amount);
    } catch (const std::exception&) {
      accepted = false;
    } catch (...) {
      unwind_to(mark);
      throw;
    }
  }

  if (!accepted) {
    unwind_to(mark);
    return TransferStatus::kRejected;
  }

  if (mark == 0) {
    in_flight_.clear();
  }
  return TransferStatus::kDelivered;
}

void InMemoryCustody::receive(common::Identity sender, const common::Amount& amount) {
  reserve_ += amount;
  received_[sender] += amount;
}

void InMemoryCustody::set_recipient_hook(common::Identity recipient, RecipientHook hook) {
  hooks_.insert_or_assign(recipient, std::move(hook));
}

void InMemoryCustody::clear_recipient_hook(common::Identity recipient) {
  hooks_.erase(recipient);
}

void InMemoryCustody::set_rejecting(common::Identity recipient, bool rejecting) {
  if (rejecting) {
    rejecting_.insert(recipient);
  } else {
    rejecting_.erase(recipient);
  }
}

common::Amount InMemoryCustody::delivered_to(common::Identity recipient) const {
  if (auto it = delivered_.find(recipient); it != delivered_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryCustody::received_from(common::Identity sender) const {
  if (auto it = received_.find(sender); it != received_.end()) {
    return it->second;
  }
  return 0;
}

void InMemoryCustody::unwind_to(std::size_t mark) {
  while (in_flight_.size() > mark) {
    const UndoEntry entry = std::move(in_flight_.back());
    in_flight_.pop_back();
    delivered_[entry.recipient] = entry.delivered_before;
    reserve_ = entry.reserve_before;
    delivery_count_ = entry.count_before;
  }
}

}  // namespace transfer
}  // namespace lendcore
