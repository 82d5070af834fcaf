#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lendcore/common/types.hpp"
#include "lendcore/executor/transition.hpp"

namespace lendcore {
namespace ingest {

// Text command grammar (whitespace separated, '#' starts a comment):
//   <caller> deposit|borrow|repay|withdraw <account> <amount>
//   <caller> claim <account>
//   available <account>
//   account <account>
//   events [<since-sequence>]
//   root
//   snapshot

struct TransitionCommand {
  common::Identity caller{0};
  executor::Transition transition{};
};

struct AvailableQuery {
  common::Identity account{0};
};

struct AccountQuery {
  common::Identity account{0};
};

struct EventsQuery {
  common::SequenceId since{1};
};

struct StateRootQuery {};

struct SnapshotRequest {};

using Command =
    std::variant<TransitionCommand, AvailableQuery, AccountQuery, EventsQuery, StateRootQuery, SnapshotRequest>;

struct ParseResult {
  std::optional<Command> command{};
  std::string error{};

  // Blank lines and comments parse to neither a command nor an error.
  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

ParseResult parse_command(std::string_view line);

}  // namespace ingest
}  // namespace lendcore
