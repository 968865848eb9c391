#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paycore {
namespace common {

// Fixed-precision decimal with four fractional digits, stored as a scaled
// signed 64-bit integer. Arithmetic that leaves the representable range throws
// std::overflow_error.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() noexcept = default;

  static constexpr Amount from_units(std::int64_t units) noexcept { return Amount{units}; }
  static Amount from_whole(std::int64_t whole);

  // Accepts an optional sign, digits and at most four fractional digits.
  static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

  // Always renders exactly four fractional digits, e.g. "1.5000".
  [[nodiscard]] std::string to_string() const;

  Amount& operator+=(Amount other);
  Amount& operator-=(Amount other);

  friend Amount operator+(Amount lhs, Amount rhs) { return lhs += rhs; }
  friend Amount operator-(Amount lhs, Amount rhs) { return lhs -= rhs; }

  friend constexpr bool operator==(const Amount&, const Amount&) noexcept = default;
  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;

 private:
  constexpr explicit Amount(std::int64_t units) noexcept : units_(units) {}

  std::int64_t units_{0};
};

}  // namespace common
}  // namespace paycore
