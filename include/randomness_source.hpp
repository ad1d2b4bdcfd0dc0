#pragma once

#include "hashing.hpp"

#include <cstdint>
#include <deque>

namespace cd {

constexpr std::uint64_t kDefaultHashWindow = 256;

enum class Resolvability { NotYetAvailable, Available, NoLongerAvailable };

struct HashLookup {
    Resolvability state = Resolvability::NotYetAvailable;
    Hash256 hash{};

    bool available() const { return state == Resolvability::Available; }
};

// Ordering positions and the hashes they finalize. A position's hash is
// unknown while the position is still being built and is forgotten once it
// falls out of the history window.
class RandomnessSource {
public:
    virtual ~RandomnessSource() = default;

    // Position currently accepting operations; its hash is not final yet.
    virtual std::uint64_t currentPosition() const = 0;
    virtual std::uint64_t historyWindow() const = 0;
    virtual HashLookup hashAt(std::uint64_t position) const = 0;

    // Outcome hash for something committed at `origin`: the hash of origin + 1.
    HashLookup resolveAfter(std::uint64_t origin) const { return hashAt(origin + 1); }
};

// In-process ordering chain keeping the last `window` finalized block hashes.
class BlockHashHistory : public RandomnessSource {
public:
    explicit BlockHashHistory(std::uint64_t window = kDefaultHashWindow,
                              std::uint64_t startPosition = 0);

    std::uint64_t currentPosition() const override { return current_; }
    std::uint64_t historyWindow() const override { return window_; }
    HashLookup hashAt(std::uint64_t position) const override;

    // Finalizes the current position with `hash` and opens the next one.
    void sealBlock(const Hash256& hash);
    // Same, with a hash drawn from the operating system's CSPRNG.
    Hash256 sealBlock();
    void sealBlocks(std::uint64_t count);

private:
    std::uint64_t window_;
    std::uint64_t current_;
    std::deque<Hash256> recent_; // back() is the hash of current_ - 1
};

} // namespace cd
