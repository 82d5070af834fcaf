#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_log.hpp"

namespace lendcore {
namespace events {

// Payload layout: [kind:1][identity:8 BE][amount:32 BE]. The sequence travels
// in the enclosing record header.
constexpr std::size_t kEncodedEventSize = 1 + 8 + common::kAmountBytes;

std::vector<std::byte> encode(const Event& event);
// Throws std::runtime_error on a malformed payload.
Event decode(common::SequenceId sequence, std::span<const std::byte> payload);

}  // namespace events
}  // namespace lendcore
