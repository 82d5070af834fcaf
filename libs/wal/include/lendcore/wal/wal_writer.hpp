#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace lendcore {
namespace wal {

struct RecordHeader {
  std::uint32_t magic{0x4c43574c};  // 'LCWL'
  std::uint16_t version{1};
  std::uint8_t kind{0};
  std::uint8_t reserved{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct RecordView {
  RecordHeader header{};
  std::span<const std::byte> payload{};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Appends checksummed records. A record whose header carries a sequence keeps
// it (it must be greater than the last one written); sequence 0 means "next".
// Opening an existing log drops a torn trailing record left by a crash.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  std::uint64_t append(const RecordView& record);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void recover(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at end of log, including a torn trailing record. Throws on a bad
  // magic or checksum.
  bool next(Record& out_record);
  void seek_sequence(std::uint64_t sequence);
  // Byte offset just past the last complete record read.
  [[nodiscard]] std::uint64_t valid_bytes() const noexcept { return valid_bytes_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  std::uint64_t valid_bytes_{0};
};

}  // namespace wal
}  // namespace lendcore
