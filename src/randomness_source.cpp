#include "randomness_source.hpp"

#include "secure_random.hpp"

#include <limits>
#include <stdexcept>

namespace cd {

BlockHashHistory::BlockHashHistory(std::uint64_t window, std::uint64_t startPosition)
    : window_(window)
    , current_(startPosition)
    , recent_() {
    if (window_ == 0) {
        throw std::invalid_argument("hash history window must be positive");
    }
}

HashLookup BlockHashHistory::hashAt(std::uint64_t position) const {
    HashLookup lookup;
    if (position >= current_) {
        lookup.state = Resolvability::NotYetAvailable;
        return lookup;
    }
    std::uint64_t age = current_ - position;
    if (age > window_ || age > recent_.size()) {
        lookup.state = Resolvability::NoLongerAvailable;
        return lookup;
    }
    lookup.state = Resolvability::Available;
    lookup.hash = recent_[recent_.size() - static_cast<std::size_t>(age)];
    return lookup;
}

void BlockHashHistory::sealBlock(const Hash256& hash) {
    if (current_ == std::numeric_limits<std::uint64_t>::max()) {
        throw std::overflow_error("ordering position exhausted");
    }
    recent_.push_back(hash);
    while (recent_.size() > window_) {
        recent_.pop_front();
    }
    ++current_;
}

Hash256 BlockHashHistory::sealBlock() {
    Hash256 hash = secureRandomHash();
    sealBlock(hash);
    return hash;
}

void BlockHashHistory::sealBlocks(std::uint64_t count) {
    for (std::uint64_t i = 0; i < count; ++i) {
        sealBlock();
    }
}

} // namespace cd
