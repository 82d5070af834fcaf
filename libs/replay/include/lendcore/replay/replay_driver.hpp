#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_log.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"

namespace lendcore {
namespace executor {
class TransitionExecutor;
}  // namespace executor

namespace replay {

// Rebuilds ledger state: the latest snapshot first, then every journaled
// event committed after it, in sequence order.
class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using EventHandler = std::function<void(const events::Event&)>;

  struct Summary {
    std::optional<common::SequenceId> snapshot_sequence{};
    std::uint64_t events_applied{0};
    common::SequenceId last_sequence{0};
  };

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);
  // Routes the snapshot and events into the executor's restore/replay paths.
  void bind(executor::TransitionExecutor& executor);
  Summary execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
};

}  // namespace replay
}  // namespace lendcore
