#include "hashing.hpp"

#include "picosha2.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cd {

namespace {

int hexNibble(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

} // namespace

Hash256 sha256(const std::string& data) {
    Hash256 out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

std::string toHex(const Hash256& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

Hash256 hashFromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() != 64) {
        throw std::invalid_argument("block hash must be 32 bytes of hex");
    }
    Hash256 out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hexNibble(digits[2 * i]);
        int lo = hexNibble(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("block hash contains non-hex characters");
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

Amount hashToAmount(const Hash256& hash) {
    Amount value = 0;
    for (auto byte : hash) {
        value <<= 8;
        value |= byte;
    }
    return value;
}

Hash256 betOutcomeSeed(std::uint64_t betId, const Hash256& blockHash) {
    std::string preimage(64, '\0');
    for (int i = 0; i < 8; ++i) {
        preimage[31 - i] = static_cast<char>((betId >> (8 * i)) & 0xFF);
    }
    for (std::size_t i = 0; i < blockHash.size(); ++i) {
        preimage[32 + i] = static_cast<char>(blockHash[i]);
    }
    return sha256(preimage);
}

} // namespace cd
