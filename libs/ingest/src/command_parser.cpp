#include "lendcore/ingest/command_parser.hpp"

#include <charconv>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "lendcore/common/amount.hpp"

namespace lendcore {
namespace ingest {

namespace {

std::vector<std::string_view> tokenize(std::string_view line) {
  if (const auto comment = line.find('#'); comment != std::string_view::npos) {
    line = line.substr(0, comment);
  }

  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r')) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '\r') {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(line.substr(start, pos - start));
    }
  }
  return tokens;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
  std::uint64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

ParseResult failure(std::string message) {
  ParseResult result;
  result.error = std::move(message);
  return result;
}

ParseResult success(Command command) {
  ParseResult result;
  result.command = std::move(command);
  return result;
}

ParseResult parse_transition(const std::vector<std::string_view>& tokens) {
  const auto caller = parse_u64(tokens[0]);
  if (!caller) {
    return failure("invalid caller identity '" + std::string(tokens[0]) + "'");
  }
  const std::string_view verb = tokens[1];

  if (verb == "claim") {
    if (tokens.size() != 3) {
      return failure("usage: <caller> claim <account>");
    }
    const auto account = parse_u64(tokens[2]);
    if (!account) {
      return failure("invalid account identity '" + std::string(tokens[2]) + "'");
    }
    return success(TransitionCommand{.caller = *caller, .transition = executor::Claim{.account = *account}});
  }

  if (tokens.size() != 4) {
    return failure("usage: <caller> " + std::string(verb) + " <account> <amount>");
  }
  const auto account = parse_u64(tokens[2]);
  if (!account) {
    return failure("invalid account identity '" + std::string(tokens[2]) + "'");
  }
  auto amount = common::parse_amount(tokens[3]);
  if (!amount) {
    return failure("invalid amount '" + std::string(tokens[3]) + "'");
  }

  executor::Transition transition;
  if (verb == "deposit") {
    transition = executor::Deposit{.account = *account, .amount = std::move(*amount)};
  } else if (verb == "borrow") {
    transition = executor::Borrow{.account = *account, .amount = std::move(*amount)};
  } else if (verb == "repay") {
    transition = executor::Repay{.account = *account, .amount = std::move(*amount)};
  } else if (verb == "withdraw") {
    transition = executor::Withdraw{.account = *account, .amount = std::move(*amount)};
  } else {
    return failure("unknown operation '" + std::string(verb) + "'");
  }
  return success(TransitionCommand{.caller = *caller, .transition = std::move(transition)});
}

}  // namespace

ParseResult parse_command(std::string_view line) {
  const auto tokens = tokenize(line);
  if (tokens.empty()) {
    return {};
  }

  const std::string_view head = tokens[0];
  if (head == "root" || head == "snapshot") {
    if (tokens.size() != 1) {
      return failure("'" + std::string(head) + "' takes no arguments");
    }
    if (head == "root") {
      return success(StateRootQuery{});
    }
    return success(SnapshotRequest{});
  }

  if (head == "events") {
    if (tokens.size() > 2) {
      return failure("usage: events [<since-sequence>]");
    }
    EventsQuery query;
    if (tokens.size() == 2) {
      const auto since = parse_u64(tokens[1]);
      if (!since) {
        return failure("invalid sequence '" + std::string(tokens[1]) + "'");
      }
      query.since = *since;
    }
    return success(query);
  }

  if (head == "available" || head == "account") {
    if (tokens.size() != 2) {
      return failure("usage: " + std::string(head) + " <account>");
    }
    const auto account = parse_u64(tokens[1]);
    if (!account) {
      return failure("invalid account identity '" + std::string(tokens[1]) + "'");
    }
    if (head == "available") {
      return success(AvailableQuery{.account = *account});
    }
    return success(AccountQuery{.account = *account});
  }

  if (tokens.size() < 2) {
    return failure("expected '<caller> <operation> ...'");
  }
  return parse_transition(tokens);
}

}  // namespace ingest
}  // namespace lendcore
