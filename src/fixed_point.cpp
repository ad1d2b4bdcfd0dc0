#include "fixed_point.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace cd {

namespace {

bool allDigits(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

} // namespace

Amount narrow(const WideAmount& wide) {
    static const WideAmount kMax = WideAmount(std::numeric_limits<Amount>::max());
    if (wide > kMax) {
        throw std::overflow_error("fixed-point result exceeds 256 bits");
    }
    return static_cast<Amount>(wide);
}

Amount mulDiv(const Amount& a, const Amount& b, const Amount& denominator) {
    if (denominator == 0) {
        throw std::domain_error("mulDiv denominator must be non-zero");
    }
    WideAmount wide = WideAmount(a) * WideAmount(b);
    wide /= WideAmount(denominator);
    return narrow(wide);
}

Amount parseAmount(const std::string& digits) {
    if (digits.empty() || !allDigits(digits)) {
        throw std::invalid_argument("amount must be an unsigned integer: \"" + digits + "\"");
    }
    // A leading zero would make cpp_int parse the text as octal.
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    std::string significant = digits.substr(first);
    if (significant.size() > 78) {
        throw std::overflow_error("amount exceeds 256 bits: \"" + digits + "\"");
    }
    return narrow(WideAmount(significant));
}

Amount parseFixed(const std::string& decimal) {
    const auto dot = decimal.find('.');
    std::string whole = decimal.substr(0, dot);
    std::string fraction = (dot == std::string::npos) ? std::string() : decimal.substr(dot + 1);

    if (whole.empty() && fraction.empty()) {
        throw std::invalid_argument("empty fixed-point value");
    }
    if (!allDigits(whole) || !allDigits(fraction)) {
        throw std::invalid_argument("fixed-point value must be decimal digits: \"" + decimal + "\"");
    }
    if (fraction.size() > kScaleDigits) {
        throw std::invalid_argument("fixed-point value has more than 18 fractional digits");
    }
    fraction.append(kScaleDigits - fraction.size(), '0');

    Amount wholePart = whole.empty() ? Amount(0) : parseAmount(whole);
    Amount fractionPart = parseAmount(fraction);
    return wholePart * kScale + fractionPart;
}

std::string formatFixed(const Amount& scaled, unsigned decimals) {
    Amount whole = scaled / kScale;
    std::string fraction = (scaled % kScale).str();
    fraction.insert(0, kScaleDigits - fraction.size(), '0');
    decimals = std::min(decimals, kScaleDigits);
    if (decimals == 0) {
        return whole.str();
    }
    return whole.str() + "." + fraction.substr(0, decimals);
}

double toDouble(const Amount& scaled) {
    return scaled.convert_to<double>() / kScale.convert_to<double>();
}

} // namespace cd
