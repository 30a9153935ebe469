// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the PromptGuard unit tests.
// Every suite lives in a header under test/unit/ and is compiled
// into this single translation unit. Log output is limited to
// errors so test output stays readable.

#include <gtest/gtest.h>
#include "util/logger.hpp"

#include "unit/test_config_parser.hpp"
#include "unit/test_decision_ledger.hpp"
#include "unit/test_gateway.hpp"
#include "unit/test_http_routes.hpp"
#include "unit/test_json_codec.hpp"
#include "unit/test_llama_server_generator.hpp"
#include "unit/test_pipeline.hpp"
#include "unit/test_scanners.hpp"
#include "unit/test_session_table.hpp"
#include "unit/test_vault.hpp"

int main(int argc, char** argv) {
    promptguard::util::logger::setLogLevel(promptguard::util::logger::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
