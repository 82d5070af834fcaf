#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lendcore {
namespace config {

struct LedgerConfig {
  std::int64_t collateral_ratio_percent{150};
};

struct TransferConfig {
  std::string mode{"push"};
};

struct CustodyConfig {
  std::string initial_reserve{"1000000000000000000000000"};
};

struct MeteringConfig {
  std::int64_t deposit{21'000};
  std::int64_t borrow{45'000};
  std::int64_t repay{26'000};
  std::int64_t withdraw{45'000};
  std::int64_t claim{40'000};
  std::int64_t query{2'100};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/lendcore/events.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/lendcore/snapshots"};
  std::int64_t wal_flush_threshold{128};
  std::int64_t snapshot_interval{1000};
};

struct TelemetryConfig {
  bool enabled{true};
  std::int64_t buffer_size{1024};
};

struct EngineConfig {
  LedgerConfig ledger;
  TransferConfig transfer;
  CustodyConfig custody;
  MeteringConfig metering;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
