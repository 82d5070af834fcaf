#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace events {

enum class EventKind : std::uint8_t {
  kDeposited = 1,
  kBorrowed = 2,
  kRepaid = 3,
  kWithdrawn = 4,
  kClaimed = 5,
};

std::string_view to_string(EventKind kind) noexcept;

struct Event {
  common::SequenceId sequence{0};
  EventKind kind{EventKind::kDeposited};
  common::Identity identity{0};
  common::Amount amount{};

  friend bool operator==(const Event&, const Event&) = default;
};

// An event awaiting its sequence number.
struct PendingEvent {
  EventKind kind{EventKind::kDeposited};
  common::Identity identity{0};
  common::Amount amount{};
};

// Append-only record of committed transitions. Sequences start at 1 and follow
// commit order; there is no way to edit or remove an entry.
class EventLog {
 public:
  using Sink = std::function<void(const Event&)>;

  // Stamps the next sequence, stores the event and forwards it to the sink.
  const Event& append(EventKind kind, common::Identity identity, const common::Amount& amount);
  // Stamps and stores the whole batch, then forwards it to the sink in order.
  // A throwing sink propagates only after every event of the batch is stored.
  void append_all(const std::vector<PendingEvent>& batch);

  // Re-inserts an already sequenced event (replay). Throws std::invalid_argument
  // when the sequence does not continue the log.
  void restore(const Event& event);
  // Positions an empty log after a snapshot taken at `last_sequence`.
  void reset(common::SequenceId last_sequence);

  void set_sink(Sink sink);

  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  [[nodiscard]] std::vector<Event> since(common::SequenceId sequence) const;
  [[nodiscard]] common::SequenceId last_sequence() const noexcept { return next_sequence_ - 1; }
  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

 private:
  std::vector<Event> events_{};
  common::SequenceId next_sequence_{1};
  Sink sink_{};
};

}  // namespace events
}  // namespace lendcore
