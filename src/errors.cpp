#include "errors.hpp"

namespace cd {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidAmount:
        return "InvalidAmount";
    case ErrorCode::InvalidOdds:
        return "InvalidOdds";
    case ErrorCode::ExceedsRiskLimit:
        return "ExceedsRiskLimit";
    case ErrorCode::Unauthorized:
        return "Unauthorized";
    case ErrorCode::TooEarly:
        return "TooEarly";
    case ErrorCode::ResultExpired:
        return "ResultExpired";
    case ErrorCode::AlreadySettled:
        return "AlreadySettled";
    case ErrorCode::InsufficientLiquidity:
        return "InsufficientLiquidity";
    case ErrorCode::DivisionByZeroOdds:
        return "DivisionByZeroOdds";
    case ErrorCode::UnknownBet:
        return "UnknownBet";
    case ErrorCode::InvalidHouseEdge:
        return "InvalidHouseEdge";
    case ErrorCode::InvalidConfig:
        return "InvalidConfig";
    case ErrorCode::TransferFailed:
        return "TransferFailed";
    case ErrorCode::ReentrantCall:
        return "ReentrantCall";
    }
    return "Unknown";
}

EngineError::EngineError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorCodeName(code)) + ": " + detail)
    , code_(code) {}

} // namespace cd
