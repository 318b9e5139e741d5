#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>

#include "ledgercore/store/store.hpp"
#include "ledgercore/wal/wal_writer.hpp"

namespace ledgercore {
namespace telemetry {
class TelemetrySink;
}  // namespace telemetry

namespace replay {

class Driver {
 public:
  using EventHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path journal_path);
  void set_event_handler(EventHandler handler);
  // Feeds every journal record with sequence >= resume_from to the handler.
  // Returns the number of records delivered. A missing journal is empty.
  std::uint64_t execute(std::uint64_t resume_from = 1);

  // Decodes each record as a change set and replays it into the store.
  std::uint64_t rebuild(store::Store& target, telemetry::TelemetrySink* sink = nullptr);

 private:
  std::filesystem::path journal_path_{};
  EventHandler event_handler_{};
};

// Routes every committed change set of the store into the journal writer.
void attach_writer(store::Store& source, wal::Writer& writer, telemetry::TelemetrySink* sink = nullptr);

}  // namespace replay
}  // namespace ledgercore
