#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_log.hpp"

namespace lendcore {
namespace executor {

// Undo log for the unit of work opened by the outermost transition.
//
// Transitions entered reentrantly (from inside an outbound transfer) take a
// savepoint and join the same unit: rolling back to a savepoint undoes their
// effects and drops their staged events, while the outermost commit releases
// every staged event in the order they were staged.
class Journal {
 public:
  using Undo = std::function<void()>;

  struct Savepoint {
    std::size_t undo_mark{0};
    std::size_t event_mark{0};
  };

  using StagedEvent = events::PendingEvent;

  [[nodiscard]] Savepoint savepoint() const noexcept;
  void record(Undo undo);
  void stage(events::EventKind kind, common::Identity identity, const common::Amount& amount);
  void rollback_to(const Savepoint& savepoint);
  [[nodiscard]] std::vector<StagedEvent> release();

  [[nodiscard]] bool empty() const noexcept { return undo_.empty() && staged_.empty(); }

 private:
  std::vector<Undo> undo_{};
  std::vector<StagedEvent> staged_{};
};

}  // namespace executor
}  // namespace lendcore
