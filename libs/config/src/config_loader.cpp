#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>
#include <string>
#include <utility>

#include "lendcore/common/amount.hpp"
#include "lendcore/policy/collateral_policy.hpp"
#include "lendcore/transfer/transfer_gate.hpp"

namespace lendcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

LedgerConfig parse_ledger(const toml::table& root) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.collateral_ratio_percent = get_int_or(*ledger, "collateral_ratio_percent", cfg.collateral_ratio_percent);
  }
  return cfg;
}

TransferConfig parse_transfer(const toml::table& root) {
  TransferConfig cfg;
  if (auto* transfer = root["transfer"].as_table()) {
    cfg.mode = get_str_or(*transfer, "mode", cfg.mode);
  }
  return cfg;
}

CustodyConfig parse_custody(const toml::table& root) {
  CustodyConfig cfg;
  if (auto* custody = root["custody"].as_table()) {
    // Reserves routinely exceed 64 bits, so they are written as decimal strings.
    cfg.initial_reserve = get_str_or(*custody, "initial_reserve", cfg.initial_reserve);
  }
  return cfg;
}

MeteringConfig parse_metering(const toml::table& root) {
  MeteringConfig cfg;
  if (auto* metering = root["metering"].as_table()) {
    cfg.deposit = get_int_or(*metering, "deposit", cfg.deposit);
    cfg.borrow = get_int_or(*metering, "borrow", cfg.borrow);
    cfg.repay = get_int_or(*metering, "repay", cfg.repay);
    cfg.withdraw = get_int_or(*metering, "withdraw", cfg.withdraw);
    cfg.claim = get_int_or(*metering, "claim", cfg.claim);
    cfg.query = get_int_or(*metering, "query", cfg.query);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.wal_flush_threshold = get_int_or(*persistence, "wal_flush_threshold", cfg.wal_flush_threshold);
    cfg.snapshot_interval = get_int_or(*persistence, "snapshot_interval", cfg.snapshot_interval);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
    cfg.buffer_size = get_int_or(*telemetry, "buffer_size", cfg.buffer_size);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.ledger = parse_ledger(root);
  cfg.transfer = parse_transfer(root);
  cfg.custody = parse_custody(root);
  cfg.metering = parse_metering(root);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

void require_positive(std::vector<ValidationError>& errors, std::string field, std::int64_t value) {
  if (value <= 0) {
    errors.push_back({std::move(field), "must be greater than 0"});
  }
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.collateral_ratio_percent < policy::kMinimumCollateralRatioPercent ||
      config.ledger.collateral_ratio_percent > 1'000'000) {
    errors.push_back({"ledger.collateral_ratio_percent", "must be between 100 and 1000000"});
  }

  if (!transfer::parse_transfer_mode(config.transfer.mode)) {
    errors.push_back({"transfer.mode", "must be \"push\" or \"pull\""});
  }

  if (!common::parse_amount(config.custody.initial_reserve)) {
    errors.push_back({"custody.initial_reserve", "must be a decimal integer below 2^256"});
  }

  require_positive(errors, "metering.deposit", config.metering.deposit);
  require_positive(errors, "metering.borrow", config.metering.borrow);
  require_positive(errors, "metering.repay", config.metering.repay);
  require_positive(errors, "metering.withdraw", config.metering.withdraw);
  require_positive(errors, "metering.claim", config.metering.claim);
  require_positive(errors, "metering.query", config.metering.query);

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  require_positive(errors, "persistence.wal_flush_threshold", config.persistence.wal_flush_threshold);

  if (config.persistence.snapshot_interval < 0) {
    errors.push_back({"persistence.snapshot_interval", "must not be negative"});
  }

  if (config.telemetry.buffer_size < 0) {
    errors.push_back({"telemetry.buffer_size", "must not be negative"});
  } else if (config.telemetry.enabled && config.telemetry.buffer_size == 0) {
    errors.push_back({"telemetry.buffer_size", "must be greater than 0 when telemetry is enabled"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore ledger configuration
# Generated default configuration

[ledger]
collateral_ratio_percent = 150  # debt <= collateral * 100 / 150

[transfer]
mode = "push"  # "push" delivers on borrow/withdraw, "pull" credits a claimable balance

[custody]
initial_reserve = "1000000000000000000000000"

[metering]
deposit = 21000
borrow = 45000
repay = 26000
withdraw = 45000
claim = 40000
query = 2100

[persistence]
wal_path = "/var/lib/lendcore/events.wal"
snapshot_dir = "/var/lib/lendcore/snapshots"
wal_flush_threshold = 128
snapshot_interval = 1000  # events between snapshots, 0 disables

[telemetry]
enabled = true
buffer_size = 1024
)";
}

}  // namespace config
}  // namespace lendcore
