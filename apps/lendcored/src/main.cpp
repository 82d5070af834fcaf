#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "lendcore/common/amount.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/executor/transition_executor.hpp"
#include "lendcore/ingest/command_parser.hpp"
#include "lendcore/ledger/state_root.hpp"
#include "lendcore/replay/event_journal.hpp"
#include "lendcore/replay/replay_driver.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/transfer/in_memory_custody.hpp"
#include "lendcore/transfer/transfer_gate.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n"
            << "  Commands are read from stdin, one per line:\n"
            << "    <caller> deposit|borrow|repay|withdraw <account> <amount>\n"
            << "    <caller> claim <account>\n"
            << "    available <account> | account <account> | events [since] | root | snapshot\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{home ? home : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool inbound(const lendcore::executor::Transition& transition) {
  return std::holds_alternative<lendcore::executor::Deposit>(transition) ||
         std::holds_alternative<lendcore::executor::Repay>(transition);
}

lendcore::common::Amount amount_of(const lendcore::executor::Transition& transition) {
  return std::visit(
      [](const auto& t) -> lendcore::common::Amount {
        if constexpr (std::is_same_v<std::decay_t<decltype(t)>, lendcore::executor::Claim>) {
          return 0;
        } else {
          return t.amount;
        }
      },
      transition);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 1 && (std::string{argv[1]} == "-h" || std::string{argv[1]} == "--help")) {
    print_usage(argv[0]);
    return 0;
  }

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Collateral ratio: " << cfg.ledger.collateral_ratio_percent << "%\n";
  std::cout << "  Transfer mode: " << cfg.transfer.mode << "\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";

  telemetry::TelemetrySink telemetry{cfg.telemetry.enabled, static_cast<std::size_t>(cfg.telemetry.buffer_size)};
  transfer::InMemoryCustody custody{*common::parse_amount(cfg.custody.initial_reserve)};

  executor::TransitionExecutor::Options options;
  options.collateral_ratio_percent = static_cast<std::uint32_t>(cfg.ledger.collateral_ratio_percent);
  options.transfer_mode = *transfer::parse_transfer_mode(cfg.transfer.mode);
  options.costs = executor::CostSchedule{
      .deposit = static_cast<std::uint64_t>(cfg.metering.deposit),
      .borrow = static_cast<std::uint64_t>(cfg.metering.borrow),
      .repay = static_cast<std::uint64_t>(cfg.metering.repay),
      .withdraw = static_cast<std::uint64_t>(cfg.metering.withdraw),
      .claim = static_cast<std::uint64_t>(cfg.metering.claim),
      .query = static_cast<std::uint64_t>(cfg.metering.query),
  };
  executor::TransitionExecutor engine{custody, options, &telemetry};

  std::filesystem::create_directories(cfg.persistence.snapshot_dir);
  if (cfg.persistence.wal_path.has_parent_path()) {
    std::filesystem::create_directories(cfg.persistence.wal_path.parent_path());
  }

  replay::Driver driver;
  driver.configure(cfg.persistence.snapshot_dir, cfg.persistence.wal_path);
  driver.bind(engine);
  replay::Driver::Summary recovered;
  try {
    recovered = driver.execute();
  } catch (const std::exception& e) {
    std::cerr << "Replay failed: " << e.what() << "\n";
    return 1;
  }
  if (recovered.snapshot_sequence) {
    std::cout << "  Restored snapshot at sequence " << *recovered.snapshot_sequence << "\n";
  }
  std::cout << "  Replayed " << recovered.events_applied << " events, last sequence "
            << recovered.last_sequence << "\n";
  std::cout << "  Accounts: " << engine.ledger().size() << "\n";
  std::cout << "  State root: " << ledger::to_hex(engine.state_root()) << "\n";

  wal::Writer wal{cfg.persistence.wal_path, static_cast<std::size_t>(cfg.persistence.wal_flush_threshold)};
  snapshot::Store snapshots{cfg.persistence.snapshot_dir};
  engine.event_log().set_sink(replay::journal_to(wal));

  common::SequenceId last_snapshot = recovered.snapshot_sequence.value_or(0);
  auto take_snapshot = [&]() {
    wal.sync();
    const auto sequence = engine.event_log().last_sequence();
    snapshots.persist(sequence, engine.serialize_state());
    last_snapshot = sequence;
    std::cout << "snapshot " << sequence << "\n";
  };

  std::cout << "lendcored ready\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    const auto parsed = ingest::parse_command(line);
    if (!parsed.ok()) {
      std::cerr << "error: " << parsed.error << "\n";
      continue;
    }
    if (!parsed.command) {
      continue;
    }

    try {
      std::visit(
          [&](const auto& command) {
            using T = std::decay_t<decltype(command)>;
            if constexpr (std::is_same_v<T, ingest::TransitionCommand>) {
              const auto kind = executor::kind_of(command.transition);
              const auto result = engine.apply(command.caller, command.transition);
              if (!result.committed()) {
                std::cout << "rejected " << common::to_string(kind) << " " << executor::to_string(result.status)
                          << " code=" << result.reject_code << " cost=" << result.cost << "\n";
                return;
              }
              if (inbound(command.transition)) {
                custody.receive(command.caller, amount_of(command.transition));
              }
              std::cout << "ok " << common::to_string(kind) << " sequence=" << engine.event_log().last_sequence()
                        << " cost=" << result.cost << "\n";
              const auto interval = static_cast<std::uint64_t>(cfg.persistence.snapshot_interval);
              if (interval > 0 && engine.event_log().last_sequence() - last_snapshot >= interval) {
                take_snapshot();
              }
            } else if constexpr (std::is_same_v<T, ingest::AvailableQuery>) {
              std::cout << "available " << command.account << " "
                        << common::to_string(engine.available_to_borrow(command.account))
                        << " cost=" << engine.costs().query << "\n";
            } else if constexpr (std::is_same_v<T, ingest::AccountQuery>) {
              const auto account = engine.account(command.account);
              std::cout << "account " << command.account << " collateral=" << common::to_string(account.collateral)
                        << " debt=" << common::to_string(account.debt)
                        << " pending=" << common::to_string(engine.pending(command.account)) << "\n";
            } else if constexpr (std::is_same_v<T, ingest::EventsQuery>) {
              for (const auto& event : engine.event_log().since(command.since)) {
                std::cout << "event " << event.sequence << " " << events::to_string(event.kind) << " "
                          << event.identity << " " << common::to_string(event.amount) << "\n";
              }
            } else if constexpr (std::is_same_v<T, ingest::StateRootQuery>) {
              std::cout << "root " << ledger::to_hex(engine.state_root()) << "\n";
            } else {
              take_snapshot();
            }
          },
          *parsed.command);
    } catch (const std::exception& e) {
      // The ledger may be ahead of the WAL; recovery restarts from what was persisted.
      std::cerr << "fatal: " << e.what() << "\n";
      return 1;
    }
  }

  wal.sync();

  std::cout << "Custody reserve: " << common::to_string(custody.reserve()) << "\n";
  for (const auto& summary : telemetry.drain_latency()) {
    std::cout << "  latency[" << summary.id << "] count=" << summary.count << " mean_ns=" << summary.mean_ns
              << " p99_ns=" << summary.p99_ns << "\n";
  }
  std::cout << "lendcored shut down at sequence " << engine.event_log().last_sequence() << "\n";
  return 0;
}
