#include "lendcore/events/event_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace lendcore {
namespace events {

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kDeposited:
      return "Deposited";
    case EventKind::kBorrowed:
      return "Borrowed";
    case EventKind::kRepaid:
      return "Repaid";
    case EventKind::kWithdrawn:
      return "Withdrawn";
    case EventKind::kClaimed:
      return "Claimed";
  }
  return "Unknown";
}

const Event& EventLog::append(EventKind kind, common::Identity identity, const common::Amount& amount) {
  events_.push_back(Event{
      .sequence = next_sequence_++,
      .kind = kind,
      .identity = identity,
      .amount = amount,
  });
  if (sink_) {
    sink_(events_.back());
  }
  return events_.back();
}

void EventLog::append_all(const std::vector<PendingEvent>& batch) {
  const std::size_t first = events_.size();
  for (const auto& pending : batch) {
    events_.push_back(Event{
        .sequence = next_sequence_++,
        .kind = pending.kind,
        .identity = pending.identity,
        .amount = pending.amount,
    });
  }
  if (!sink_) {
    return;
  }
  for (std::size_t i = first; i < events_.size(); ++i) {
    sink_(events_[i]);
  }
}

void EventLog::restore(const Event& event) {
  if (event.sequence != next_sequence_) {
    throw std::invalid_argument("event sequence " + std::to_string(event.sequence) +
                                " does not follow " + std::to_string(next_sequence_ - 1));
  }
  events_.push_back(event);
  ++next_sequence_;
}

void EventLog::reset(common::SequenceId last_sequence) {
  events_.clear();
  next_sequence_ = last_sequence + 1;
}

void EventLog::set_sink(Sink sink) {
  sink_ = std::move(sink);
}

std::vector<Event> EventLog::since(common::SequenceId sequence) const {
  std::vector<Event> result;
  auto it = std::lower_bound(events_.begin(), events_.end(), sequence,
                             [](const Event& event, common::SequenceId seq) { return event.sequence < seq; });
  result.assign(it, events_.end());
  return result;
}

}  // namespace events
}  // namespace lendcore
