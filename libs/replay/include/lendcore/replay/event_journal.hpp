#pragma once

#include "lendcore/events/event_log.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace replay {

// Event log sink that journals each committed event to the WAL under the
// event's own sequence, so replay can resume exactly after a snapshot.
events::EventLog::Sink journal_to(wal::Writer& writer);

}  // namespace replay
}  // namespace lendcore
