#pragma once

#include "bet_ledger.hpp"
#include "entry_lock.hpp"
#include "event_log.hpp"

#include <cstddef>
#include <cstdint>

namespace cd {

// Reclaims abandoned bets in bounded batches. The ledger's ordered pending
// index acts as the cursor: every call resumes at the oldest unsettled bet, so
// repeated calls walk the whole backlog and never revisit a settled record.
class SweepScheduler {
public:
    SweepScheduler(BetLedger& ledger, EntryLock& lock, EventLog& events);

    // Expires at most maxCount bets past their horizon; returns how many were swept.
    std::size_t sweepExpired(std::size_t maxCount);

    // Bets a sweep could take right now.
    std::size_t eligibleCount() const;
    std::uint64_t totalSwept() const;

private:
    std::size_t expireBatch(std::size_t maxCount);

    BetLedger& ledger_;
    EntryLock& lock_;
    EventLog& events_;
    std::uint64_t totalSwept_ = 0;
};

} // namespace cd
