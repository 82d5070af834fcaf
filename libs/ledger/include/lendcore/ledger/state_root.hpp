#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_state.hpp"

namespace lendcore {
namespace ledger {

constexpr std::size_t kStateRootSize = 32;

using StateRoot = std::array<std::uint8_t, kStateRootSize>;

using PendingCredit = std::pair<common::Identity, common::Amount>;

// BLAKE2b-256 over the ledger and the outstanding pull credits, each section
// prefixed with its entry count and sorted by identity:
//   [accounts:8 BE] then [identity:8 BE][collateral:32 BE][debt:32 BE] per account,
//   [credits:8 BE] then [identity:8 BE][pending:32 BE] per credit.
[[nodiscard]] StateRoot compute_state_root(const LedgerState& ledger,
                                           std::span<const PendingCredit> pending_credits);
[[nodiscard]] std::string to_hex(const StateRoot& root);

}  // namespace ledger
}  // namespace lendcore
