#include "test_persistence.hpp"

#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "lendcore/events/event_log.hpp"
#include "lendcore/executor/transition_executor.hpp"
#include "lendcore/ledger/state_root.hpp"
#include "lendcore/replay/event_journal.hpp"
#include "lendcore/replay/replay_driver.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/transfer/in_memory_custody.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore::tests {

namespace {

std::size_t count_records(const std::filesystem::path& path) {
  wal::Reader reader(path);
  wal::Record record;
  std::size_t count = 0;
  while (reader.next(record)) {
    ++count;
  }
  return count;
}

}  // namespace

void test_wal_torn_tail() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "lendcore_wal_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);
  const auto wal_path = tmp_root / "events.wal";

  {
    wal::Writer writer(wal_path, 128);
    events::EventLog log;
    log.set_sink(replay::journal_to(writer));
    log.append(events::EventKind::kDeposited, 1, 150);
    log.append(events::EventKind::kBorrowed, 1, 100);
    log.append(events::EventKind::kRepaid, 1, 100);
    writer.sync();
  }
  const auto valid_size = fs::file_size(wal_path);
  assert(count_records(wal_path) == 3);

  // Crash mid-header.
  {
    std::ofstream out(wal_path, std::ios::binary | std::ios::app);
    const std::array<char, 10> partial{};
    out.write(partial.data(), partial.size());
  }
  {
    wal::Reader reader(wal_path);
    wal::Record record;
    while (reader.next(record)) {
    }
    assert(reader.valid_bytes() == valid_size);
  }

  // Crash mid-payload after the partial header is dropped.
  {
    wal::Writer writer(wal_path);
    assert(fs::file_size(wal_path) == valid_size);
    assert(writer.next_sequence() == 4);
  }
  {
    wal::RecordHeader header;
    header.kind = 1;
    header.sequence = 4;
    header.payload_size = 41;
    std::ofstream out(wal_path, std::ios::binary | std::ios::app);
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    const std::array<char, 5> partial{};
    out.write(partial.data(), partial.size());
  }
  assert(count_records(wal_path) == 3);

  {
    wal::Writer writer(wal_path);
    assert(fs::file_size(wal_path) == valid_size);

    bool rejected = false;
    try {
      std::vector<std::byte> payload(4);
      wal::RecordHeader stale;
      stale.sequence = 2;
      writer.append(wal::RecordView{.header = stale, .payload = payload});
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }

  fs::remove_all(tmp_root);
}

void test_persistence_replay() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "lendcore_replay_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);
  const auto snapshot_dir = tmp_root / "snapshots";
  const auto wal_path = tmp_root / "events.wal";

  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor primary{custody};
  {
    wal::Writer wal(wal_path, 128);
    snapshot::Store snapshots(snapshot_dir);
    primary.event_log().set_sink(replay::journal_to(wal));

    assert(primary.deposit(1, 150).committed());
    assert(primary.borrow(1, 100).committed());
    assert(primary.deposit(2, 300).committed());
    wal.sync();
    snapshots.persist(primary.event_log().last_sequence(), primary.serialize_state());

    assert(primary.repay(1, 60).committed());
    assert(primary.borrow(2, 200).committed());
    assert(primary.borrow(2, 1).status == executor::Status::kInsufficientCollateral);
    wal.sync();
    primary.event_log().set_sink({});
  }

  // Snapshot plus the events after it.
  transfer::InMemoryCustody replica_custody{1'000'000};
  executor::TransitionExecutor replica{replica_custody};
  replay::Driver driver;
  driver.configure(snapshot_dir, wal_path);
  driver.bind(replica);
  const auto summary = driver.execute();

  assert(summary.snapshot_sequence == 3);
  assert(summary.events_applied == 2);
  assert(summary.last_sequence == 5);
  assert(replica.state_root() == primary.state_root());
  assert(replica.account(1).debt == 40);
  assert(replica.event_log().last_sequence() == 5);
  assert(replica_custody.delivery_count() == 0);

  // The whole log without a snapshot lands on the same root.
  executor::TransitionExecutor cold{replica_custody};
  replay::Driver full;
  full.configure(tmp_root / "no_snapshots", wal_path);
  full.bind(cold);
  const auto full_summary = full.execute();
  assert(!full_summary.snapshot_sequence);
  assert(full_summary.events_applied == 5);
  assert(cold.state_root() == primary.state_root());

  // Pull-credit ledgers replay their pending balances too.
  const auto pull_wal = tmp_root / "pull.wal";
  const executor::TransitionExecutor::Options pull{.transfer_mode = transfer::TransferMode::kPull};
  executor::TransitionExecutor pull_primary{custody, pull};
  {
    wal::Writer wal(pull_wal);
    pull_primary.event_log().set_sink(replay::journal_to(wal));
    assert(pull_primary.deposit(3, 300).committed());
    assert(pull_primary.borrow(3, 120).committed());
    assert(pull_primary.claim(3).committed());
    assert(pull_primary.borrow(3, 30).committed());
    wal.sync();
    pull_primary.event_log().set_sink({});
  }
  executor::TransitionExecutor pull_replica{replica_custody, pull};
  replay::Driver pull_driver;
  pull_driver.configure(tmp_root / "pull_snapshots", pull_wal);
  pull_driver.bind(pull_replica);
  assert(pull_driver.execute().events_applied == 4);
  assert(pull_replica.pending(3) == 30);
  assert(pull_replica.state_root() == pull_primary.state_root());

  fs::remove_all(tmp_root);
}

void test_replay_reentrant_log() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "lendcore_reentrant_replay_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);

  // Push: a repay made from inside the borrow's transfer, then a deposit made
  // from inside a withdrawal.
  const auto push_wal = tmp_root / "push.wal";
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor primary{custody};
  int step = 0;
  custody.set_recipient_hook(1, [&](common::Identity, const common::Amount&) {
    ++step;
    if (step == 1) {
      return primary.repay(1, 100).committed();
    }
    if (step == 2) {
      return primary.deposit(1, 10).committed();
    }
    return true;
  });
  {
    wal::Writer wal(push_wal);
    primary.event_log().set_sink(replay::journal_to(wal));
    assert(primary.deposit(1, 150).committed());
    assert(primary.borrow(1, 100).committed());
    assert(primary.withdraw(1, 150).committed());
    wal.sync();
    primary.event_log().set_sink({});
  }
  assert(primary.account(1).debt == 0);
  assert(primary.account(1).collateral == 10);

  const auto& logged = primary.event_log().events();
  assert(logged.size() == 5);
  assert(logged[1].kind == events::EventKind::kBorrowed);
  assert(logged[2].kind == events::EventKind::kRepaid);
  assert(logged[3].kind == events::EventKind::kWithdrawn);
  assert(logged[4].kind == events::EventKind::kDeposited);

  transfer::InMemoryCustody replica_custody{1'000'000};
  executor::TransitionExecutor replica{replica_custody};
  replay::Driver driver;
  driver.configure(tmp_root / "push_snapshots", push_wal);
  driver.bind(replica);
  assert(driver.execute().events_applied == 5);
  assert(replica.state_root() == primary.state_root());

  // Pull: a borrow made from inside a claim's transfer.
  const auto pull_wal = tmp_root / "pull.wal";
  const executor::ExecutorOptions pull{.transfer_mode = transfer::TransferMode::kPull};
  executor::TransitionExecutor pull_primary{custody, pull};
  bool entered = false;
  custody.set_recipient_hook(3, [&](common::Identity, const common::Amount&) {
    if (!entered) {
      entered = true;
      return pull_primary.borrow(3, 10).committed();
    }
    return true;
  });
  {
    wal::Writer wal(pull_wal);
    pull_primary.event_log().set_sink(replay::journal_to(wal));
    assert(pull_primary.deposit(3, 300).committed());
    assert(pull_primary.borrow(3, 100).committed());
    assert(pull_primary.claim(3).committed());
    wal.sync();
    pull_primary.event_log().set_sink({});
  }
  assert(pull_primary.pending(3) == 10);
  assert(pull_primary.account(3).debt == 110);
  assert(pull_primary.state_root() ==
         ledger::compute_state_root(pull_primary.ledger(), pull_primary.gate().ordered_pending()));

  executor::TransitionExecutor pull_replica{replica_custody, pull};
  replay::Driver pull_driver;
  pull_driver.configure(tmp_root / "pull_snapshots", pull_wal);
  pull_driver.bind(pull_replica);
  assert(pull_driver.execute().events_applied == 4);
  assert(pull_replica.pending(3) == 10);
  assert(pull_replica.state_root() == pull_primary.state_root());

  fs::remove_all(tmp_root);
}

void test_snapshot_ratio_mismatch() {
  transfer::InMemoryCustody custody{1'000'000};
  executor::TransitionExecutor source{custody};
  assert(source.deposit(1, 150).committed());
  assert(source.borrow(1, 100).committed());
  const auto payload = source.serialize_state();

  executor::TransitionExecutor same{custody};
  same.restore_state(2, payload);
  assert(same.state_root() == source.state_root());
  assert(same.event_log().last_sequence() == 2);
  assert(same.event_log().size() == 0);

  // 100 debt on 150 collateral is over the limit at 200%.
  executor::TransitionExecutor stricter{custody, {.collateral_ratio_percent = 200}};
  bool rejected = false;
  try {
    stricter.restore_state(2, payload);
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  assert(rejected);
  assert(stricter.ledger().size() == 0);

  bool truncated = false;
  try {
    same.restore_state(2, std::span<const std::byte>(payload.data(), payload.size() - 1));
  } catch (const std::runtime_error&) {
    truncated = true;
  }
  assert(truncated);
  assert(same.state_root() == source.state_root());
}

}  // namespace lendcore::tests
