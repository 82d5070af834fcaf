#include "lendcore/wal/wal_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace lendcore {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x4c43574c;  // 'LCWL'
constexpr std::uint16_t kVersion = 1;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

void fsync_file(std::FILE* file) {
  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  recover(path);
  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open WAL file: " + path.string());
  }
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception&) {
    // Buffered records are lost; nothing can be reported from a destructor.
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::recover(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return;
  }

  std::uint64_t valid_bytes = 0;
  {
    Reader reader(path);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
    valid_bytes = reader.valid_bytes();
  }

  if (std::filesystem::file_size(path) > valid_bytes) {
    std::filesystem::resize_file(path, valid_bytes);
  }
}

std::uint64_t Writer::append(const RecordView& record_view) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header = record_view.header;
  if (header.sequence == 0) {
    header.sequence = next_sequence_;
  } else if (header.sequence < next_sequence_) {
    throw std::invalid_argument("WAL sequence " + std::to_string(header.sequence) +
                                " is not after " + std::to_string(next_sequence_ - 1));
  }
  next_sequence_ = header.sequence + 1;

  header.magic = kMagic;
  header.version = kVersion;
  header.payload_size = static_cast<std::uint32_t>(record_view.payload.size());
  header.checksum = checksum32(record_view.payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), record_view.payload.begin(), record_view.payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write WAL buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "WAL fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (file_) {
    fsync_file(file_);
  }
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  if (std::fread(&header, sizeof(RecordHeader), 1, file_) != 1) {
    return false;
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      return false;
    }
    if (header.checksum != checksum32(out_record.payload)) {
      throw std::runtime_error("WAL checksum mismatch at sequence " + std::to_string(header.sequence));
    }
  }

  valid_bytes_ += sizeof(RecordHeader) + header.payload_size;
  return true;
}

void Reader::seek_sequence(std::uint64_t sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  valid_bytes_ = 0;
  Record record;
  while (next(record)) {
    if (record.header.sequence >= sequence) {
      const auto offset = static_cast<long>(sizeof(RecordHeader) + record.header.payload_size);
      if (std::fseek(file_, -offset, SEEK_CUR) != 0) {
        throw std::runtime_error("failed to seek in WAL");
      }
      valid_bytes_ -= static_cast<std::uint64_t>(offset);
      break;
    }
  }
}

}  // namespace wal
}  // namespace lendcore
