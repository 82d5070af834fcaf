#include "lendcore/replay/replay_driver.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "lendcore/events/event_codec.hpp"
#include "lendcore/executor/transition_executor.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

void Driver::bind(executor::TransitionExecutor& executor) {
  set_snapshot_handler([&executor](common::SequenceId sequence, std::span<const std::byte> payload) {
    executor.restore_state(sequence, payload);
  });
  set_event_handler([&executor](const events::Event& event) { executor.replay(event); });
}

Driver::Summary Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  Summary summary;
  common::SequenceId resume_from{1};

  if (auto snap = snapshot_store_.latest()) {
    resume_from = snap->sequence + 1;
    summary.snapshot_sequence = snap->sequence;
    summary.last_sequence = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload.data(), snap->payload.size()));
    }
  }

  if (wal_path_.empty() || !std::filesystem::exists(wal_path_)) {
    return summary;
  }

  wal::Reader reader(wal_path_);
  reader.seek_sequence(resume_from);
  wal::Record record;
  while (reader.next(record)) {
    const events::Event event = events::decode(record.header.sequence, record.payload);
    if (static_cast<std::uint8_t>(event.kind) != record.header.kind) {
      throw std::runtime_error("WAL record " + std::to_string(record.header.sequence) +
                               " header kind does not match its payload");
    }
    event_handler_(event);
    ++summary.events_applied;
    summary.last_sequence = event.sequence;
  }

  return summary;
}

}  // namespace replay
}  // namespace lendcore
