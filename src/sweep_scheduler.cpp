#include "sweep_scheduler.hpp"

namespace cd {

SweepScheduler::SweepScheduler(BetLedger& ledger, EntryLock& lock, EventLog& events)
    : ledger_(ledger)
    , lock_(lock)
    , events_(events) {}

std::size_t SweepScheduler::sweepExpired(std::size_t maxCount) {
    std::size_t swept = expireBatch(maxCount);
    events_.deliverPending();
    return swept;
}

std::size_t SweepScheduler::expireBatch(std::size_t maxCount) {
    auto scope = lock_.enter("sweepExpired");
    std::size_t swept = 0;
    while (swept < maxCount) {
        auto candidate = ledger_.oldestPending();
        // Origins never decrease with id, so a young front bet means nothing behind it is due.
        if (!candidate || !ledger_.isSweepable(*candidate)) {
            break;
        }
        ledger_.expire(scope, *candidate);
        ++swept;
    }
    totalSwept_ += swept;
    return swept;
}

std::size_t SweepScheduler::eligibleCount() const {
    auto guard = lock_.read();
    std::size_t count = 0;
    for (BetId betId : ledger_.pendingIds()) {
        if (!ledger_.isSweepable(betId)) {
            break;
        }
        ++count;
    }
    return count;
}

std::uint64_t SweepScheduler::totalSwept() const {
    auto guard = lock_.read();
    return totalSwept_;
}

} // namespace cd
