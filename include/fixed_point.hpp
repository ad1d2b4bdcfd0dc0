#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace cd {

// Collateral quantities, share counts and 1e18-scaled fractions all share one
// checked 256-bit representation; overflow raises instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;
using WideAmount = boost::multiprecision::checked_uint512_t;

inline const Amount kScale{ 1'000'000'000'000'000'000ULL };
constexpr unsigned kScaleDigits = 18;

// floor(a * b / denominator) through a 512-bit intermediate.
Amount mulDiv(const Amount& a, const Amount& b, const Amount& denominator);

// Narrows a wide intermediate back to 256 bits, raising std::overflow_error if it does not fit.
Amount narrow(const WideAmount& wide);

// "0.25" -> 0.25e18. Accepts at most kScaleDigits fractional digits.
Amount parseFixed(const std::string& decimal);
// Plain unsigned integer in base units.
Amount parseAmount(const std::string& digits);

std::string formatFixed(const Amount& scaled, unsigned decimals = 4);
double toDouble(const Amount& scaled);

inline Amount fixedFromPercent(std::uint64_t percent) {
    return kScale * percent / 100;
}

} // namespace cd
