#ifndef PROMPTGUARD_TEST_UNIT_TEST_PIPELINE_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_PIPELINE_HPP

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "core/errors.hpp"
#include "core/vault.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "scanners/anonymize.hpp"
#include "scanners/output_checks.hpp"
#include "unit/test_fakes.hpp"

/**
 * @file test_pipeline.hpp
 * @brief ScannerSet ordering rules and PipelineRunner aggregation, monitor and fault handling.
 */

namespace promptguard {
namespace test {
namespace pipeline_tests {

using namespace promptguard;
using pipeline::PipelineRunner;
using pipeline::ScannerSet;
using pipeline::ScanResult;
using scanners::Direction;
using scanners::ScanMode;
using test::FaultyScanner;
using test::ScriptedScanner;

namespace {

PipelineRunner inboundOnly(ScannerSet in)
{
    return PipelineRunner(std::move(in), ScannerSet(Direction::Outbound));
}

} // namespace

TEST(ScannerSetTest, RejectsDuplicateNames) {
    ScannerSet set(Direction::Inbound);
    set.add(std::make_shared<ScriptedScanner>("A", true, 0.0));
    EXPECT_THROW(set.add(std::make_shared<ScriptedScanner>("A", true, 0.0)), core::ConfigurationError);
    EXPECT_EQ(set.size(), 1u);
}

TEST(ScannerSetTest, RejectsScannerForWrongDirection) {
    auto vault = std::make_shared<core::Vault>();
    ScannerSet in(Direction::Inbound);
    EXPECT_THROW(in.add(std::make_shared<scanners::Deanonymize>(vault)), core::ConfigurationError);
    ScannerSet out(Direction::Outbound);
    EXPECT_THROW(out.add(std::make_shared<scanners::Anonymize>(vault)), core::ConfigurationError);
}

TEST(ScannerSetTest, AnonymizeMustPrecedeRejectingScanners) {
    auto vault = std::make_shared<core::Vault>();
    ScannerSet in(Direction::Inbound);
    in.add(std::make_shared<ScriptedScanner>("PromptInjection", true, 0.0));
    in.add(std::make_shared<scanners::Anonymize>(vault));
    EXPECT_THROW(in.validate(), core::ConfigurationError);
    EXPECT_THROW(inboundOnly(std::move(in)), core::ConfigurationError);
}

TEST(ScannerSetTest, SensitiveBeforeDeanonymizeIsRejected) {
    auto vault = std::make_shared<core::Vault>();
    ScannerSet out(Direction::Outbound);
    out.add(std::make_shared<scanners::Sensitive>());
    out.add(std::make_shared<scanners::Deanonymize>(vault));
    EXPECT_THROW(out.validate(), core::ConfigurationError);
    EXPECT_THROW(PipelineRunner(ScannerSet(Direction::Inbound), std::move(out)), core::ConfigurationError);
}

TEST(ScannerSetTest, SetsSwappedBetweenDirectionsAreRejected) {
    EXPECT_THROW(PipelineRunner(ScannerSet(Direction::Outbound), ScannerSet(Direction::Inbound)),
                 core::ConfigurationError);
}

TEST(PipelineRunnerTest, EmptySetAllowsTextUnchanged) {
    PipelineRunner runner(ScannerSet(Direction::Inbound), ScannerSet(Direction::Outbound));
    ScanResult r = runner.run(Direction::Inbound, "anything at all");
    EXPECT_FALSE(r.blocked());
    EXPECT_EQ(r.text, "anything at all");
    EXPECT_TRUE(r.records.empty());
}

TEST(PipelineRunnerTest, RunsEveryScannerEvenAfterABlock) {
    auto first = std::make_shared<ScriptedScanner>("First", false, 0.9);
    auto second = std::make_shared<ScriptedScanner>("Second", true, 0.1);
    auto third = std::make_shared<ScriptedScanner>("Third", false, 0.8);
    ScannerSet in(Direction::Inbound);
    in.add(first).add(second).add(third);
    PipelineRunner runner = inboundOnly(std::move(in));

    ScanResult r = runner.run(Direction::Inbound, "text");
    EXPECT_TRUE(r.blocked());
    ASSERT_EQ(r.triggered.size(), 2u);
    EXPECT_EQ(r.triggered[0], "First");
    EXPECT_EQ(r.triggered[1], "Third");
    ASSERT_EQ(r.records.size(), 3u);
    ASSERT_NE(r.find("Second"), nullptr);
    EXPECT_TRUE(r.find("Second")->valid);
    EXPECT_DOUBLE_EQ(r.find("Second")->score, 0.1);
    EXPECT_EQ(second->calls(), 1);
    EXPECT_EQ(third->calls(), 1);
}

TEST(PipelineRunnerTest, ThrowingScannerFailsClosed) {
    auto after = std::make_shared<ScriptedScanner>("After", true, 0.0);
    ScannerSet in(Direction::Inbound);
    in.add(std::make_shared<FaultyScanner>("Faulty", ScanMode::Monitor)).add(after);
    PipelineRunner runner = inboundOnly(std::move(in));

    ScanResult r = runner.run(Direction::Inbound, "text");
    EXPECT_TRUE(r.blocked());
    ASSERT_EQ(r.triggered.size(), 1u);
    EXPECT_EQ(r.triggered[0], "Faulty");
    const auto *rec = r.find("Faulty");
    ASSERT_NE(rec, nullptr);
    EXPECT_TRUE(rec->faulted);
    EXPECT_FALSE(rec->valid);
    EXPECT_DOUBLE_EQ(rec->score, 1.0);
    EXPECT_NE(rec->details.find("model weights missing"), std::string::npos);
    EXPECT_EQ(after->calls(), 1);
    EXPECT_EQ(r.text, "text");
}

TEST(PipelineRunnerTest, MonitorModeReportsWithoutBlocking) {
    ScannerSet in(Direction::Inbound);
    in.add(std::make_shared<ScriptedScanner>("Watcher", false, 0.7, ScanMode::Monitor));
    PipelineRunner runner = inboundOnly(std::move(in));

    ScanResult r = runner.run(Direction::Inbound, "text");
    EXPECT_FALSE(r.blocked());
    EXPECT_TRUE(r.triggered.empty());
    ASSERT_EQ(r.monitored.size(), 1u);
    EXPECT_EQ(r.monitored[0], "Watcher");
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].kind, "Monitor");
}

TEST(PipelineRunnerTest, TransformedTextFlowsToLaterScanners) {
    auto vault = std::make_shared<core::Vault>();
    ScannerSet in(Direction::Inbound);
    in.add(std::make_shared<scanners::Anonymize>(vault));
    in.add(std::make_shared<ScriptedScanner>("Check", true, 0.0));
    PipelineRunner runner = inboundOnly(std::move(in));

    ScanResult r = runner.run(Direction::Inbound, "My email is a@b.com");
    EXPECT_FALSE(r.blocked());
    EXPECT_EQ(r.text, "My email is [REDACTED_EMAIL_1]");
}

TEST(PipelineRunnerTest, VaultMissSurfacesAsTypedWarning) {
    auto vault = std::make_shared<core::Vault>();
    ScannerSet out(Direction::Outbound);
    out.add(std::make_shared<scanners::Deanonymize>(vault));
    PipelineRunner runner(ScannerSet(Direction::Inbound), std::move(out));

    ScanResult r = runner.run(Direction::Outbound, "see [REDACTED_PHONE_3]", std::string("hi"));
    EXPECT_FALSE(r.blocked());
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].scanner, "Deanonymize");
    EXPECT_EQ(r.warnings[0].kind, "VaultMiss");
}

TEST(PipelineRunnerTest, SensitiveSeesRestoredValuesOnlyAfterDeanonymize) {
    auto vault = std::make_shared<core::Vault>();
    const std::string placeholder = vault->reserve("a@b.com", "EMAIL");
    const std::string reply = "Your email is " + placeholder;
    const std::string prompt = "what was my email again?";

    ScannerSet ordered(Direction::Outbound);
    ordered.add(std::make_shared<scanners::Deanonymize>(vault));
    ordered.add(std::make_shared<scanners::Sensitive>());
    PipelineRunner restoredFirst(ScannerSet(Direction::Inbound), std::move(ordered));
    ScanResult r = restoredFirst.run(Direction::Outbound, reply, prompt);
    EXPECT_TRUE(r.blocked());
    EXPECT_EQ(r.text, "Your email is a@b.com");
    ASSERT_EQ(r.triggered.size(), 1u);
    EXPECT_EQ(r.triggered[0], "Sensitive");

    ScannerSet sensitiveOnly(Direction::Outbound);
    sensitiveOnly.add(std::make_shared<scanners::Sensitive>());
    PipelineRunner placeholdersOnly(ScannerSet(Direction::Inbound), std::move(sensitiveOnly));
    ScanResult p = placeholdersOnly.run(Direction::Outbound, reply, prompt);
    EXPECT_FALSE(p.blocked());
    EXPECT_EQ(p.text, reply);
}

TEST(PipelineRunnerTest, ScoresSummaryMarksFaults) {
    ScannerSet in(Direction::Inbound);
    in.add(std::make_shared<ScriptedScanner>("Ok", true, 0.25));
    in.add(std::make_shared<FaultyScanner>("Broken"));
    PipelineRunner runner = inboundOnly(std::move(in));
    ScanResult r = runner.run(Direction::Inbound, "x");
    EXPECT_EQ(r.scoresSummary(), "Ok=0.25 Broken=fault");
}

} // namespace pipeline_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_PIPELINE_HPP
