#include "program_config.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace wh {

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

std::uint64_t parseUnsigned(const char* name, const std::string& value, std::uint64_t maxValue) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer, got \"" + value + "\"");
    }
    if (consumed != value.size() || value[0] == '-') {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer, got \"" + value + "\"");
    }
    if (parsed > maxValue) {
        throw std::runtime_error(std::string(name) + " exceeds " + std::to_string(maxValue));
    }
    return parsed;
}

} // namespace

Identity ProgramConfig::defaultProgramId() {
    return sha256Digest(std::string("program:worth-hub"));
}

ProgramConfig loadProgramConfigFromEnv() {
    ProgramConfig cfg;

    if (auto programId = readEnv("WH_PROGRAM_ID")) {
        try {
            cfg.programId = bytes32FromHex(*programId);
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(std::string("WH_PROGRAM_ID: ") + ex.what());
        }
    }
    if (auto reserve = readEnv("WH_ESCROW_RESERVE")) {
        cfg.escrowReserve =
            parseUnsigned("WH_ESCROW_RESERVE", *reserve, std::numeric_limits<std::uint64_t>::max());
    }
    if (auto batch = readEnv("WH_MAX_SETTLE_BATCH")) {
        cfg.maxSettleBatch = static_cast<std::uint32_t>(
            parseUnsigned("WH_MAX_SETTLE_BATCH", *batch, std::numeric_limits<std::uint32_t>::max()));
        if (cfg.maxSettleBatch == 0) {
            throw std::runtime_error("WH_MAX_SETTLE_BATCH must be positive");
        }
    }
    return cfg;
}

} // namespace wh
