#include "clawdice.hpp"

namespace cd {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

Clawdice::Clawdice(const EngineConfig& config, RandomnessSource& randomness, AssetLedger& assets)
    : config_(validated(config))
    , lock_()
    , events_()
    , pool_(assets, lock_, events_, config_.poolAccount)
    , ledger_(config_, randomness, pool_, assets, lock_, events_)
    , sweeper_(ledger_, lock_, events_) {}

} // namespace cd
