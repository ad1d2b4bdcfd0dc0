#pragma once

#include "fixed_point.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace cd {

using Hash256 = std::array<std::uint8_t, 32>;

Hash256 sha256(const std::string& data);
std::string toHex(const Hash256& hash);
Hash256 hashFromHex(const std::string& hex);

// Big-endian import over the full 2^256 range.
Amount hashToAmount(const Hash256& hash);

// SHA-256(betId as a 32-byte big-endian word || blockHash). Folding the id in
// decorrelates bets that share an origin block.
Hash256 betOutcomeSeed(std::uint64_t betId, const Hash256& blockHash);

} // namespace cd
