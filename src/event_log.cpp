#include "event_log.hpp"

#include <sstream>
#include <stdexcept>

namespace cd {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Clears the delivering flag if a listener throws something deliverPending
// does not catch. A normal exit clears it while still holding the mutex.
struct DeliveryReset {
    std::mutex& mutex;
    bool& delivering;
    bool released = false;

    ~DeliveryReset() {
        if (!released) {
            std::lock_guard<std::mutex> guard(mutex);
            delivering = false;
        }
    }
};

} // namespace

std::string encodeEvent(const EngineEvent& event) {
    std::ostringstream oss;
    std::visit(Overloaded{
                   [&](const BetPlaced& e) {
                       oss << "bet-placed|id=" << e.betId << "|owner=" << e.owner
                           << "|amount=" << e.amount << "|odds=" << e.targetOdds
                           << "|origin=" << e.originBlock;
                   },
                   [&](const BetResolved& e) {
                       oss << "bet-resolved|id=" << e.betId << "|won=" << (e.won ? 1 : 0)
                           << "|payout=" << e.payout;
                   },
                   [&](const BetClaimed& e) {
                       oss << "bet-claimed|id=" << e.betId << "|owner=" << e.owner
                           << "|payout=" << e.payout;
                   },
                   [&](const BetExpired& e) { oss << "bet-expired|id=" << e.betId; },
                   [&](const HouseEdgeChanged& e) {
                       oss << "house-edge-changed|old=" << e.oldEdge << "|new=" << e.newEdge;
                   },
                   [&](const LiquidityStaked& e) {
                       oss << "liquidity-staked|provider=" << e.provider << "|assets=" << e.assets
                           << "|shares=" << e.shares;
                   },
                   [&](const LiquidityUnstaked& e) {
                       oss << "liquidity-unstaked|provider=" << e.provider
                           << "|shares=" << e.shares << "|assets=" << e.assets;
                   },
               },
               event);
    return oss.str();
}

void EventLog::append(const EngineEvent& event) {
    std::lock_guard<std::mutex> guard(mutex_);
    events_.push_back(event);
    leaves_.push_back(sha256(encodeEvent(event)));
    undelivered_.push_back(events_.size() - 1);
}

void EventLog::subscribe(Listener listener) {
    std::lock_guard<std::mutex> guard(mutex_);
    listeners_.push_back(std::move(listener));
}

void EventLog::deliverPending() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (delivering_) {
            return;
        }
        delivering_ = true;
    }
    DeliveryReset reset{ mutex_, delivering_ };

    while (true) {
        std::size_t index = 0;
        EngineEvent event;
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (undelivered_.empty()) {
                delivering_ = false;
                reset.released = true;
                return;
            }
            index = undelivered_.front();
            undelivered_.pop_front();
            event = events_[index];
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& ex) {
                std::lock_guard<std::mutex> guard(mutex_);
                failures_.push_back(ListenerFailure{ index, ex.what() });
            }
        }
    }
}

std::vector<ListenerFailure> EventLog::listenerFailures() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return failures_;
}

std::vector<EngineEvent> EventLog::events() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return events_;
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return events_.size();
}

std::vector<Hash256> EventLog::leaves() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return leaves_;
}

Hash256 EventLog::leaf(std::size_t index) const {
    std::lock_guard<std::mutex> guard(mutex_);
    if (index >= leaves_.size()) {
        throw std::out_of_range("event index out of range");
    }
    return leaves_[index];
}

Hash256 EventLog::hashPair(const Hash256& left, const Hash256& right) {
    std::string preimage;
    preimage.reserve(left.size() + right.size());
    preimage.append(left.begin(), left.end());
    preimage.append(right.begin(), right.end());
    return sha256(preimage);
}

Hash256 EventLog::merkleRoot() const {
    std::vector<Hash256> layer = leaves();
    if (layer.empty()) {
        return Hash256{};
    }

    while (layer.size() > 1) {
        std::vector<Hash256> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const Hash256& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<Hash256> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<Hash256> proof;
    std::vector<Hash256> layer = leaves();
    if (leafIndex >= layer.size()) {
        return proof;
    }

    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= layer.size()) {
            sibling = index;
        }
        proof.push_back(layer[sibling]);

        std::vector<Hash256> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const Hash256& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool EventLog::verifyProof(const Hash256& leafHash,
                           std::size_t leafIndex,
                           const std::vector<Hash256>& proof,
                           const Hash256& root) {
    Hash256 node = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return node == root;
}

} // namespace cd
