#pragma once

#include "fixed_point.hpp"
#include "hashing.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace cd {

struct BetPlaced {
    std::uint64_t betId = 0;
    std::string owner;
    Amount amount;
    Amount targetOdds;
    std::uint64_t originBlock = 0;
};

struct BetResolved {
    std::uint64_t betId = 0;
    bool won = false;
    Amount payout;
};

struct BetClaimed {
    std::uint64_t betId = 0;
    std::string owner;
    Amount payout;
};

struct BetExpired {
    std::uint64_t betId = 0;
};

struct HouseEdgeChanged {
    Amount oldEdge;
    Amount newEdge;
};

struct LiquidityStaked {
    std::string provider;
    Amount assets;
    Amount shares;
};

struct LiquidityUnstaked {
    std::string provider;
    Amount shares;
    Amount assets;
};

using EngineEvent = std::variant<BetPlaced,
                                 BetResolved,
                                 BetClaimed,
                                 BetExpired,
                                 HouseEdgeChanged,
                                 LiquidityStaked,
                                 LiquidityUnstaked>;

// Canonical single-line encoding, e.g. "bet-expired|id=7".
std::string encodeEvent(const EngineEvent& event);

struct ListenerFailure {
    std::size_t eventIndex = 0;
    std::string message;
};

// Append-only record of everything an external indexer can observe, with a
// SHA-256 Merkle commitment over the encoded events.
//
// Listeners never run inside an engine operation. Appended events queue until
// deliverPending(), which the engine calls after releasing its EntryLock, so a
// listener may call back into the engine. A listener that throws is recorded in
// listenerFailures() and does not affect the operation that emitted the event.
class EventLog {
public:
    using Listener = std::function<void(const EngineEvent&)>;

    void append(const EngineEvent& event);
    void subscribe(Listener listener);
    // Hands queued events to the listeners in append order. A nested call made
    // by a listener returns at once; the outer call delivers its events.
    void deliverPending();

    std::vector<ListenerFailure> listenerFailures() const;

    std::vector<EngineEvent> events() const;
    std::size_t size() const;
    Hash256 leaf(std::size_t index) const;

    // Empty log -> all-zero root. Odd layers duplicate their last node.
    Hash256 merkleRoot() const;
    std::vector<Hash256> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const Hash256& leafHash,
                            std::size_t leafIndex,
                            const std::vector<Hash256>& proof,
                            const Hash256& root);

    template <typename T>
    std::vector<T> eventsOfType() const {
        std::vector<T> out;
        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& event : events_) {
            if (const T* typed = std::get_if<T>(&event)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

private:
    static Hash256 hashPair(const Hash256& left, const Hash256& right);
    std::vector<Hash256> leaves() const;

    std::vector<EngineEvent> events_;
    std::vector<Hash256> leaves_;
    std::vector<Listener> listeners_;

    mutable std::mutex mutex_;
    std::deque<std::size_t> undelivered_;
    bool delivering_ = false;
    std::vector<ListenerFailure> failures_;
};

} // namespace cd
