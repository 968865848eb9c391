#include "paycore/common/amount.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace paycore {
namespace common {

namespace {
constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinUnits = std::numeric_limits<std::int64_t>::min();

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}
}  // namespace

Amount Amount::from_whole(std::int64_t whole) {
  if (whole > kMaxUnits / kScale || whole < kMinUnits / kScale) {
    throw std::overflow_error("amount out of range: " + std::to_string(whole));
  }
  return Amount{whole * kScale};
}

std::optional<Amount> Amount::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole_part = text.substr(0, dot);
  const std::string_view fraction_part = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole_part.empty() && fraction_part.empty()) {
    return std::nullopt;
  }
  if (fraction_part.size() > static_cast<std::size_t>(kFractionDigits)) {
    return std::nullopt;
  }

  std::int64_t whole = 0;
  for (char c : whole_part) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    const std::int64_t digit = c - '0';
    if (whole > (kMaxUnits / kScale - digit) / 10) {
      return std::nullopt;
    }
    whole = whole * 10 + digit;
  }

  std::int64_t fraction = 0;
  std::int64_t place = kScale;
  for (char c : fraction_part) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    place /= 10;
    fraction += (c - '0') * place;
  }

  if (whole > (kMaxUnits - fraction) / kScale) {
    return std::nullopt;
  }

  const std::int64_t units = whole * kScale + fraction;
  return Amount{negative ? -units : units};
}

std::string Amount::to_string() const {
  // Work on the magnitude as unsigned so INT64_MIN renders correctly.
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(units_ + 1)) + 1
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / static_cast<std::uint64_t>(kScale);
  const std::uint64_t fraction = magnitude % static_cast<std::uint64_t>(kScale);

  std::string fraction_text = std::to_string(fraction);
  fraction_text.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction_text.size(), '0');

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += fraction_text;
  return out;
}

Amount& Amount::operator+=(Amount other) {
  std::int64_t result = 0;
  if (__builtin_add_overflow(units_, other.units_, &result)) {
    throw std::overflow_error("amount overflow: " + to_string() + " + " + other.to_string());
  }
  units_ = result;
  return *this;
}

Amount& Amount::operator-=(Amount other) {
  std::int64_t result = 0;
  if (__builtin_sub_overflow(units_, other.units_, &result)) {
    throw std::overflow_error("amount overflow: " + to_string() + " - " + other.to_string());
  }
  units_ = result;
  return *this;
}

}  // namespace common
}  // namespace paycore
