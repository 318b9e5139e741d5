#include "ledgercore/replay/replay_driver.hpp"

#include <stdexcept>
#include <utility>

#include "ledgercore/store/codec.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path journal_path) {
  journal_path_ = std::move(journal_path);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

std::uint64_t Driver::execute(std::uint64_t resume_from) {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }
  if (journal_path_.empty() || !std::filesystem::exists(journal_path_)) {
    return 0;
  }

  std::uint64_t delivered = 0;
  wal::Reader reader(journal_path_);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence < resume_from) {
      continue;
    }
    event_handler_(record);
    ++delivered;
  }
  return delivered;
}

std::uint64_t Driver::rebuild(store::Store& target, telemetry::TelemetrySink* sink) {
  set_event_handler([&target, sink](const wal::Record& record) {
    target.replay(store::ChangeSetCodec::decode(record.payload));
    if (sink) {
      sink->increment(telemetry::metrics::kJournalRecordsReplayed);
    }
  });
  return execute();
}

void attach_writer(store::Store& source, wal::Writer& writer, telemetry::TelemetrySink* sink) {
  source.set_journal_listener([&writer, sink](const store::ChangeSet& changes) {
    const auto payload = store::ChangeSetCodec::encode(changes);
    writer.append(payload);
    if (sink) {
      sink->increment(telemetry::metrics::kJournalRecordsWritten);
    }
  });
}

}  // namespace replay
}  // namespace ledgercore
