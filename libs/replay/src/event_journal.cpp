#include "lendcore/replay/event_journal.hpp"

#include "lendcore/events/event_codec.hpp"

namespace lendcore {
namespace replay {

events::EventLog::Sink journal_to(wal::Writer& writer) {
  return [&writer](const events::Event& event) {
    const auto payload = events::encode(event);
    wal::RecordHeader header;
    header.kind = static_cast<std::uint8_t>(event.kind);
    header.sequence = event.sequence;
    writer.append(wal::RecordView{.header = header, .payload = payload});
  };
}

}  // namespace replay
}  // namespace lendcore
