#include "program_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace wh;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "program_config_test failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

void clearEnv() {
    ::unsetenv("WH_PROGRAM_ID");
    ::unsetenv("WH_ESCROW_RESERVE");
    ::unsetenv("WH_MAX_SETTLE_BATCH");
}

void expectRejected(const char* name, const char* value) {
    clearEnv();
    ::setenv(name, value, 1);
    try {
        loadProgramConfigFromEnv();
    } catch (const std::runtime_error&) {
        return;
    }
    fail(std::string(name) + "=\"" + value + "\" accepted");
}

void testDefaults() {
    clearEnv();
    ProgramConfig cfg = loadProgramConfigFromEnv();
    expect(cfg.programId == ProgramConfig::defaultProgramId(), "default program id");
    expect(cfg.escrowReserve == 890'880, "default reserve");
    expect(cfg.maxSettleBatch == 32, "default batch");

    ::setenv("WH_ESCROW_RESERVE", "   ", 1);
    expect(loadProgramConfigFromEnv().escrowReserve == 890'880, "blank value keeps default");
}

void testOverrides() {
    clearEnv();
    const std::string id = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    ::setenv("WH_PROGRAM_ID", id.c_str(), 1);
    ::setenv("WH_ESCROW_RESERVE", " 0 ", 1);
    ::setenv("WH_MAX_SETTLE_BATCH", "4", 1);
    ProgramConfig cfg = loadProgramConfigFromEnv();
    expect(toHex(cfg.programId) == id, "program id override");
    expect(cfg.escrowReserve == 0, "reserve override");
    expect(cfg.maxSettleBatch == 4, "batch override");
}

void testMalformedValues() {
    expectRejected("WH_PROGRAM_ID", "abc");
    expectRejected("WH_PROGRAM_ID", "zz112233445566778899aabbccddeeff00112233445566778899aabbccddeeff");
    expectRejected("WH_ESCROW_RESERVE", "-5");
    expectRejected("WH_ESCROW_RESERVE", "12ab");
    expectRejected("WH_ESCROW_RESERVE", "99999999999999999999999");
    expectRejected("WH_MAX_SETTLE_BATCH", "0");
    expectRejected("WH_MAX_SETTLE_BATCH", "4294967296");
}

} // namespace

int main() {
    testDefaults();
    testOverrides();
    testMalformedValues();
    clearEnv();

    std::cout << "program_config_test passed" << std::endl;
    return 0;
}
