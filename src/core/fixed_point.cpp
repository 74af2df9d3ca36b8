#include "fixed_point.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include "exceptions.hpp"

namespace orion {
namespace fixed_point {

Amount pow10(unsigned exponent) {
    if (exponent > 77) {
        throw InvariantViolationError("10^" + std::to_string(exponent) + " does not fit in 256 bits");
    }
    Amount result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

Amount mul_div(const Amount& a, const Amount& b, const Amount& denominator, Rounding rounding) {
    if (denominator == 0) {
        throw InvariantViolationError("mul_div division by zero");
    }
    const WideAmount product = WideAmount(a) * WideAmount(b);
    const WideAmount wide_denominator(denominator);
    WideAmount quotient = product / wide_denominator;
    if (rounding == Rounding::CEIL && product % wide_denominator != 0) {
        quotient += 1;
    }
    if (quotient > WideAmount(std::numeric_limits<Amount>::max())) {
        throw InvariantViolationError("mul_div result exceeds 256 bits");
    }
    return static_cast<Amount>(quotient);
}

Amount apply_bps(const Amount& amount, std::uint32_t bps) {
    return mul_div(amount, Amount(bps), Amount(BASIS_POINTS));
}

Amount annualized_bps(const Amount& amount, std::uint32_t bps, std::uint64_t duration_seconds) {
    if (bps == 0 || duration_seconds == 0) {
        return 0;
    }
    const Amount numerator = Amount(bps) * Amount(duration_seconds);
    return mul_div(amount, numerator, Amount(BASIS_POINTS) * Amount(SECONDS_PER_YEAR));
}

SignedAmount to_signed(const Amount& value) {
    return static_cast<SignedAmount>(value);
}

Amount magnitude(const SignedAmount& value) {
    return static_cast<Amount>(value < 0 ? SignedAmount(-value) : value);
}

Amount parse_amount(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ValidationError("not an unsigned integer amount: '" + text + "'");
    }
    try {
        return Amount(text);
    } catch (const std::exception&) {
        throw ValidationError("amount out of range: '" + text + "'");
    }
}

std::string format_amount(const Amount& value, unsigned decimals) {
    std::string digits = value.str();
    if (decimals == 0) {
        return digits;
    }
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - decimals, ".");
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    if (!digits.empty() && digits.back() == '.') {
        digits.pop_back();
    }
    return digits;
}

} // namespace fixed_point
} // namespace orion
