#include "engine_config.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cd {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

[[noreturn]] void rejectConfig(const std::string& detail) {
    throw EngineError(ErrorCode::InvalidConfig, detail);
}

template <typename Parser>
auto parseEnvValue(const char* name, const std::string& value, Parser parser) {
    try {
        return parser(value);
    } catch (const std::exception& ex) {
        std::ostringstream oss;
        oss << name << "=\"" << value << "\" is not valid: " << ex.what();
        rejectConfig(oss.str());
    }
}

void overrideFixed(const char* name, Amount& field) {
    if (auto value = readEnv(name)) {
        field = parseEnvValue(name, *value, [](const std::string& v) { return parseFixed(v); });
    }
}

void overrideAmount(const char* name, Amount& field) {
    if (auto value = readEnv(name)) {
        field = parseEnvValue(name, *value, [](const std::string& v) { return parseAmount(v); });
    }
}

void overridePositions(const char* name, std::uint64_t& field) {
    if (auto value = readEnv(name)) {
        field = parseEnvValue(name, *value, [](const std::string& v) {
            std::size_t consumed = 0;
            unsigned long long parsed = std::stoull(v, &consumed, 10);
            if (consumed != v.size() || v.front() == '-') {
                throw std::invalid_argument("expected an unsigned integer");
            }
            return static_cast<std::uint64_t>(parsed);
        });
    }
}

} // namespace

void EngineConfig::validate() const {
    if (minOdds == 0 || minOdds > maxOdds || maxOdds >= kScale) {
        rejectConfig("odds band must satisfy 0 < minOdds <= maxOdds < 1");
    }
    if (minBet == 0) {
        rejectConfig("minBet must be positive");
    }
    if (maxHouseEdge >= kScale) {
        rejectConfig("maxHouseEdge must be below 100%");
    }
    if (houseEdge > maxHouseEdge) {
        std::ostringstream oss;
        oss << "houseEdge " << formatFixed(houseEdge) << " exceeds ceiling "
            << formatFixed(maxHouseEdge);
        rejectConfig(oss.str());
    }
    if (hashWindow == 0) {
        rejectConfig("hashWindow must be positive");
    }
    if (expiryHorizon <= hashWindow) {
        std::ostringstream oss;
        oss << "expiryHorizon (" << expiryHorizon << ") must exceed hashWindow (" << hashWindow
            << ") so that sweeping never races a legitimate claim";
        rejectConfig(oss.str());
    }
    if (operatorId.empty() || custodyAccount.empty() || poolAccount.empty()) {
        rejectConfig("operator, custody and pool accounts must be named");
    }
    if (custodyAccount == poolAccount) {
        rejectConfig("custody and pool accounts must differ");
    }
}

EngineConfig loadConfigFromEnvironment(EngineConfig base) {
    overrideFixed("CD_HOUSE_EDGE", base.houseEdge);
    overrideFixed("CD_MAX_HOUSE_EDGE", base.maxHouseEdge);
    overrideAmount("CD_MIN_BET", base.minBet);
    overrideFixed("CD_MIN_ODDS", base.minOdds);
    overrideFixed("CD_MAX_ODDS", base.maxOdds);
    overridePositions("CD_HASH_WINDOW", base.hashWindow);
    overridePositions("CD_EXPIRY_HORIZON", base.expiryHorizon);
    if (auto op = readEnv("CD_OPERATOR")) {
        base.operatorId = *op;
    }
    base.validate();
    return base;
}

} // namespace cd
