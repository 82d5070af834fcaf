#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/transfer/custody.hpp"

namespace lendcore {
namespace transfer {

// Custody backed by a single in-process reserve.
//
// Recipients may register a hook that runs while their transfer is in flight;
// the hook returning false (or throwing a std::exception) rejects the transfer,
// which reverts every delivery made inside it. Any other exception reverts the
// same deliveries and then propagates to the sender.
class InMemoryCustody : public CustodyLayer {
 public:
  using RecipientHook = std::function<bool(common::Identity, const common::Amount&)>;

  explicit InMemoryCustody(common::Amount reserve = 0);

  TransferStatus send(common::Identity recipient, const common::Amount& amount) override;
  common::Amount reserve() const override { return reserve_; }

  // Inbound value (deposits, repayments) entering custody.
  void receive(common::Identity sender, const common::Amount& amount);

  void set_recipient_hook(common::Identity recipient, RecipientHook hook);
  void clear_recipient_hook(common::Identity recipient);
  void set_rejecting(common::Identity recipient, bool rejecting);

  [[nodiscard]] common::Amount delivered_to(common::Identity recipient) const;
  [[nodiscard]] common::Amount received_from(common::Identity sender) const;
  [[nodiscard]] std::uint64_t delivery_count() const noexcept { return delivery_count_; }

 private:
  struct UndoEntry {
    common::Identity recipient{};
    common::Amount delivered_before{};
    common::Amount reserve_before{};
    std::uint64_t count_before{};
  };

  common::Amount reserve_;
  std::unordered_map<common::Identity, common::Amount> delivered_{};
  std::unordered_map<common::Identity, common::Amount> received_{};
  std::unordered_map<common::Identity, RecipientHook> hooks_{};
  std::unordered_set<common::Identity> rejecting_{};
  std::vector<UndoEntry> in_flight_{};
  std::uint64_t delivery_count_{0};

  void unwind_to(std::size_t mark);
};

}  // namespace transfer
}  // namespace lendcore
