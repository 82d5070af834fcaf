#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

// Fixed-width big-endian encoding used by the WAL, snapshots and the state root.
using AmountBytes = std::array<std::byte, kAmountBytes>;

inline AmountBytes encode_amount(const Amount& value) {
  std::vector<std::uint8_t> digits;
  boost::multiprecision::export_bits(value, std::back_inserter(digits), 8);

  AmountBytes out{};
  const std::size_t offset = kAmountBytes - digits.size();
  for (std::size_t i = 0; i < digits.size(); ++i) {
    out[offset + i] = static_cast<std::byte>(digits[i]);
  }
  return out;
}

inline Amount decode_amount(std::span<const std::byte, kAmountBytes> bytes) {
  std::array<std::uint8_t, kAmountBytes> digits{};
  std::transform(bytes.begin(), bytes.end(), digits.begin(),
                 [](std::byte b) { return static_cast<std::uint8_t>(b); });
  Amount value;
  boost::multiprecision::import_bits(value, digits.begin(), digits.end(), 8);
  return value;
}

inline void append_amount(std::vector<std::byte>& out, const Amount& value) {
  const auto bytes = encode_amount(value);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

// Parses a non-negative decimal amount; rejects signs, blanks and values past 2^256-1.
inline std::optional<Amount> parse_amount(std::string_view text) {
  if (text.empty() || text.size() > 78) {
    return std::nullopt;
  }
  if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  WideAmount wide{std::string(text)};
  if (wide > WideAmount{std::numeric_limits<Amount>::max()}) {
    return std::nullopt;
  }
  return static_cast<Amount>(wide);
}

inline std::string to_string(const Amount& value) {
  return value.str();
}

}  // namespace common
}  // namespace lendcore
