#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace ledgercore {
namespace wal {

// On-disk record: header followed by payload_size bytes of payload. The
// payload of a commit record is an encoded store::ChangeSet.
struct RecordHeader {
  std::uint32_t magic{0x4c434a4c};  // 'LCJL'
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

std::uint32_t checksum32(std::span<const std::byte> data) noexcept;

// Append-only commit journal. Records are buffered and written once the
// buffer passes the flush threshold, or on flush()/sync().
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at a clean end of file. Throws std::runtime_error on a bad magic,
  // a truncated record or a checksum mismatch.
  bool next(Record& out_record);

 private:
  std::FILE* file_{nullptr};
};

}  // namespace wal
}  // namespace ledgercore
