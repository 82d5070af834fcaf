#include "lendcore/events/event_codec.hpp"

#include <stdexcept>
#include <string>

#include "lendcore/common/amount.hpp"

namespace lendcore {
namespace events {

namespace {

bool valid_kind(std::uint8_t raw) noexcept {
  return raw >= static_cast<std::uint8_t>(EventKind::kDeposited) &&
         raw <= static_cast<std::uint8_t>(EventKind::kClaimed);
}

}  // namespace

std::vector<std::byte> encode(const Event& event) {
  std::vector<std::byte> out;
  out.reserve(kEncodedEventSize);
  out.push_back(static_cast<std::byte>(event.kind));
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((event.identity >> shift) & 0xff));
  }
  common::append_amount(out, event.amount);
  return out;
}

Event decode(common::SequenceId sequence, std::span<const std::byte> payload) {
  if (payload.size() != kEncodedEventSize) {
    throw std::runtime_error("event payload has " + std::to_string(payload.size()) + " bytes, expected " +
                             std::to_string(kEncodedEventSize));
  }
  const auto raw_kind = static_cast<std::uint8_t>(payload[0]);
  if (!valid_kind(raw_kind)) {
    throw std::runtime_error("unknown event kind " + std::to_string(raw_kind));
  }

  common::Identity identity = 0;
  for (std::size_t i = 1; i <= 8; ++i) {
    identity = (identity << 8) | static_cast<std::uint8_t>(payload[i]);
  }

  return Event{
      .sequence = sequence,
      .kind = static_cast<EventKind>(raw_kind),
      .identity = identity,
      .amount = common::decode_amount(payload.subspan<9, common::kAmountBytes>()),
  };
}

}  // namespace events
}  // namespace lendcore
