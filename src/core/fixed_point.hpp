#pragma once

#include <string>
#include "types.hpp"

namespace orion {
namespace fixed_point {

Amount pow10(unsigned exponent);

// a * b / denominator with a 512-bit intermediate product.
Amount mul_div(const Amount& a, const Amount& b, const Amount& denominator,
               Rounding rounding = Rounding::FLOOR);

// amount * bps / 10_000, floor-rounded.
Amount apply_bps(const Amount& amount, std::uint32_t bps);

// amount * bps * duration / (10_000 * SECONDS_PER_YEAR), floor-rounded.
Amount annualized_bps(const Amount& amount, std::uint32_t bps, std::uint64_t duration_seconds);

SignedAmount to_signed(const Amount& value);
Amount magnitude(const SignedAmount& value);

Amount parse_amount(const std::string& text);
std::string format_amount(const Amount& value, unsigned decimals);

} // namespace fixed_point
} // namespace orion
