#include "lendcore/executor/journal.hpp"

#include <utility>

namespace lendcore {
namespace executor {

Journal::Savepoint Journal::savepoint() const noexcept {
  return Savepoint{.undo_mark = undo_.size(), .event_mark = staged_.size()};
}

void Journal::record(Undo undo) {
  undo_.push_back(std::move(undo));
}

void Journal::stage(events::EventKind kind, common::Identity identity, const common::Amount& amount) {
  staged_.push_back(StagedEvent{.kind = kind, .identity = identity, .amount = amount});
}

void Journal::rollback_to(const Savepoint& savepoint) {
  while (undo_.size() > savepoint.undo_mark) {
    const Undo undo = std::move(undo_.back());
    undo_.pop_back();
    undo();
  }
  if (staged_.size() > savepoint.event_mark) {
    staged_.resize(savepoint.event_mark);
  }
}

std::vector<Journal::StagedEvent> Journal::release() {
  undo_.clear();
  auto released = std::move(staged_);
  staged_.clear();
  return released;
}

}  // namespace executor
}  // namespace lendcore
