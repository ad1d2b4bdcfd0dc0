#pragma once

#include <stdexcept>
#include <string>

namespace cd {

enum class ErrorCode {
    InvalidAmount,
    InvalidOdds,
    ExceedsRiskLimit,
    Unauthorized,
    TooEarly,
    ResultExpired,
    AlreadySettled,
    InsufficientLiquidity,
    DivisionByZeroOdds,
    UnknownBet,
    InvalidHouseEdge,
    InvalidConfig,
    TransferFailed,
    ReentrantCall
};

const char* errorCodeName(ErrorCode code);

// Every engine failure is recoverable by the caller; the code says whether to
// wait, resubmit with different parameters, or treat the bet as lost.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace cd
