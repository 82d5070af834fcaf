#include "lendcore/ledger/state_root.hpp"

#include <sodium.h>

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "lendcore/common/amount.hpp"

namespace lendcore {
namespace ledger {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

class StateHasher {
 public:
  StateHasher() { ensure_sodium_init(); }

  void add_u64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      message_.push_back(static_cast<std::byte>((value >> shift) & 0xff));
    }
  }

  void add_account(common::Identity identity, const AccountState& account) {
    add_u64(identity);
    common::append_amount(message_, account.collateral);
    common::append_amount(message_, account.debt);
  }

  void add_pending_credit(common::Identity identity, const common::Amount& amount) {
    add_u64(identity);
    common::append_amount(message_, amount);
  }

  StateRoot finish() const {
    StateRoot root{};
    if (crypto_generichash(root.data(), root.size(),
                           reinterpret_cast<const unsigned char*>(message_.data()), message_.size(),
                           nullptr, 0) != 0) {
      throw std::runtime_error("crypto_generichash failed");
    }
    return root;
  }

 private:
  std::vector<std::byte> message_{};
};

}  // namespace

StateRoot compute_state_root(const LedgerState& ledger, std::span<const PendingCredit> pending_credits) {
  const auto accounts = ledger.ordered();

  StateHasher hasher;
  hasher.add_u64(accounts.size());
  for (const auto& [identity, account] : accounts) {
    hasher.add_account(identity, account);
  }
  hasher.add_u64(pending_credits.size());
  for (const auto& [identity, amount] : pending_credits) {
    hasher.add_pending_credit(identity, amount);
  }
  return hasher.finish();
}

std::string to_hex(const StateRoot& root) {
  std::string hex(root.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), root.data(), root.size());
  hex.pop_back();
  return hex;
}

}  // namespace ledger
}  // namespace lendcore
