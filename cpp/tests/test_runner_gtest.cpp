// ==============================================================================
// test_runner_gtest.cpp - Тесты реестра и исполнителя проверок (GoogleTest)
// ==============================================================================
//
// CheckRegistry: порядок, уникальность id, отказ на null/пустой id
// CheckRunner: пул потоков, отмена, дедлайн, исключения из проверок,
//              run_all по пути на диске
//
// ==============================================================================

#include "fixture_builder.hpp"

#include <raven/checks.hpp>
#include <raven/policy.hpp>
#include <raven/registry.hpp>
#include <raven/runner.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace raven::check::test {

using raven::test::build_elf;
using raven::test::Bytes;
using raven::test::ElfOptions;
using raven::test::make_memory_artifact;
using raven::test::TempDir;

namespace {

/// Проверка с заданным исходом; считает вызовы
class StubCheck : public ComplianceCheck {
public:
    StubCheck(std::string id, CheckStatus status, std::atomic<int>* calls = nullptr)
        : id_(std::move(id)), status_(status), calls_(calls) {}

    std::string id() const override { return id_; }
    std::string description() const override { return "stub " + id_; }

    CheckOutcome execute(const CheckContext&) const override {
        if (calls_ != nullptr) {
            calls_->fetch_add(1);
        }
        return CheckOutcome{status_, "stub details", Value()};
    }

private:
    std::string id_;
    CheckStatus status_;
    std::atomic<int>* calls_;
};

class ThrowingCheck : public ComplianceCheck {
public:
    std::string id() const override { return "throwing"; }
    std::string description() const override { return "always throws"; }
    CheckOutcome execute(const CheckContext&) const override {
        throw std::runtime_error("boom");
    }
};

/// Спит заданное время; ранние в реестре спят дольше поздних
class DelayedCheck : public ComplianceCheck {
public:
    DelayedCheck(std::string id, std::chrono::milliseconds delay)
        : id_(std::move(id)), delay_(delay) {}

    std::string id() const override { return id_; }
    std::string description() const override { return "delayed " + id_; }
    CheckOutcome execute(const CheckContext&) const override {
        std::this_thread::sleep_for(delay_);
        return CheckOutcome::pass("slept");
    }

private:
    std::string id_;
    std::chrono::milliseconds delay_;
};

/// Бросает из description(), не из execute()
class BrokenDescriptionCheck : public ComplianceCheck {
public:
    std::string id() const override { return "broken-description"; }
    std::string description() const override { throw std::logic_error("no description"); }
    CheckOutcome execute(const CheckContext&) const override {
        return CheckOutcome::pass("unreachable");
    }
};

/// Отменяет токен во время своего выполнения
class CancellingCheck : public ComplianceCheck {
public:
    explicit CancellingCheck(CancellationToken& token) : token_(token) {}
    std::string id() const override { return "cancelling"; }
    std::string description() const override { return "cancels the run"; }
    CheckOutcome execute(const CheckContext&) const override {
        token_.cancel();
        return CheckOutcome::pass("cancelled the run");
    }

private:
    CancellationToken& token_;
};

std::shared_ptr<const Artifact> plain_elf() {
    return make_memory_artifact(build_elf(ElfOptions{}).bytes, "app");
}

}  // namespace

// ==============================================================================
// CheckRegistry
// ==============================================================================

TEST(RegistryTest, DefaultRegistry_HasElevenChecksInCanonicalOrder) {
    const CheckRegistry registry = make_default_registry();
    const std::vector<std::string> expected = {
        "file-signature",         "binary-metadata",        "dependency-analysis",
        "binary-format",          "certificate-validation", "signature-verification",
        "hash-integrity",         "encryption-standard",    "security-flags",
        "version-information",    "license-compliance"};
    EXPECT_EQ(registry.ids(), expected);
    EXPECT_EQ(registry.size(), 11u);
    EXPECT_FALSE(registry.find("file-signature")->requires_descriptor());
    EXPECT_FALSE(registry.find("hash-integrity")->requires_descriptor());
    EXPECT_FALSE(registry.find("license-compliance")->requires_descriptor());
    EXPECT_TRUE(registry.find("security-flags")->requires_descriptor());
}

TEST(RegistryTest, DuplicateId_IsRejectedAndRegistryUnchanged) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("alpha", CheckStatus::Pass)));

    auto result = registry.add(std::make_unique<StubCheck>("alpha", CheckStatus::Fail));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, RegistryErrorKind::DuplicateCheckID);
    EXPECT_EQ(result.message, "check 'alpha' is already registered");
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.at(0).description(), "stub alpha");
}

TEST(RegistryTest, NullAndEmptyId_AreInvalid) {
    CheckRegistry registry;
    auto null_result = registry.add(nullptr);
    EXPECT_FALSE(null_result);
    EXPECT_EQ(null_result.error, RegistryErrorKind::InvalidCheck);

    auto empty_result = registry.add(std::make_unique<StubCheck>("", CheckStatus::Pass));
    EXPECT_FALSE(empty_result);
    EXPECT_EQ(empty_result.error, RegistryErrorKind::InvalidCheck);
    EXPECT_TRUE(registry.empty());
}

TEST(RegistryTest, CheckStatusToString) {
    EXPECT_EQ(std::string(check_status_to_string(CheckStatus::Pass)), "pass");
    EXPECT_EQ(std::string(check_status_to_string(CheckStatus::Fail)), "fail");
    EXPECT_EQ(std::string(check_status_to_string(static_cast<CheckStatus>(7))), "unknown");
}

TEST(RegistryTest, Find_UnknownId_ReturnsNull) {
    const CheckRegistry registry = make_default_registry();
    EXPECT_EQ(registry.find("no-such-check"), nullptr);
}

// ==============================================================================
// CheckRunner
// ==============================================================================

TEST(RunnerTest, Counts_MatchResults) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("a", CheckStatus::Pass)));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("b", CheckStatus::Fail)));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("c", CheckStatus::Pass)));
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    auto artifact = plain_elf();
    const auto report = runner.run(*artifact);
    EXPECT_EQ(report.total_checks, 3u);
    EXPECT_EQ(report.passed_checks, 2u);
    EXPECT_EQ(report.failed_checks, 1u);
    EXPECT_EQ(report.passed_checks + report.failed_checks, report.total_checks);
    EXPECT_FALSE(report.overall_pass());
    EXPECT_EQ(report.binary_path, "app");
    EXPECT_EQ(report.format, "ELF");
    EXPECT_EQ(report.timestamp.size(), 20u);  // YYYY-MM-DDTHH:MM:SSZ
}

TEST(RunnerTest, ManyThreads_EachCheckRunsOnce) {
    std::atomic<int> calls{0};
    CheckRegistry registry;
    for (int i = 0; i < 32; ++i) {
        ASSERT_TRUE(registry.add(
            std::make_unique<StubCheck>("check-" + std::to_string(i), CheckStatus::Pass, &calls)));
    }
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    RunOptions options;
    options.threads = 8;
    auto artifact = plain_elf();
    const auto report = runner.run(*artifact, options);

    EXPECT_EQ(calls.load(), 32);
    ASSERT_EQ(report.results.size(), 32u);
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(report.results[static_cast<std::size_t>(i)].id, "check-" + std::to_string(i));
    }
    EXPECT_TRUE(report.overall_pass());
}

TEST(RunnerTest, WorkerCount_IsClampedToRegistrySize) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("a", CheckStatus::Pass)));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("b", CheckStatus::Pass)));
    policy::Policy policy = policy::default_policy();
    policy.threads = 16;
    const CheckRunner runner(registry, policy);

    EXPECT_EQ(runner.worker_count(RunOptions{}), 2u);
    RunOptions options;
    options.threads = 1;
    EXPECT_EQ(runner.worker_count(options), 1u);
}

TEST(RunnerTest, ThrowingCheck_BecomesFailedResult) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<ThrowingCheck>()));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("after", CheckStatus::Pass)));
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    auto artifact = plain_elf();
    const auto report = runner.run(*artifact);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_FALSE(report.results[0].passed());
    EXPECT_EQ(report.results[0].details, "check raised an exception: boom");
    EXPECT_TRUE(report.results[1].passed());
}

TEST(RunnerTest, ThrowingDescription_BecomesFailedResult) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<BrokenDescriptionCheck>()));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("after", CheckStatus::Pass)));
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    RunOptions options;
    options.threads = 2;
    auto artifact = plain_elf();
    const auto report = runner.run(*artifact, options);

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].id, "broken-description");
    EXPECT_FALSE(report.results[0].passed());
    EXPECT_EQ(report.results[0].details, "check raised an exception: no description");
    EXPECT_TRUE(report.results[1].passed());
    EXPECT_EQ(report.failed_checks, 1u);
}

TEST(RunnerTest, DelayedChecks_KeepRegistrationOrderAcrossRuns) {
    // Arrange: первая зарегистрированная завершается последней
    CheckRegistry registry;
    constexpr int kChecks = 8;
    for (int i = 0; i < kChecks; ++i) {
        ASSERT_TRUE(registry.add(std::make_unique<DelayedCheck>(
            "delayed-" + std::to_string(i), std::chrono::milliseconds((kChecks - i) * 2))));
    }
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);
    auto artifact = plain_elf();

    RunOptions options;
    options.threads = 4;
    for (int run = 0; run < 20; ++run) {
        // Act
        const auto report = runner.run(*artifact, options);

        // Assert
        ASSERT_EQ(report.results.size(), static_cast<std::size_t>(kChecks)) << "run " << run;
        for (int i = 0; i < kChecks; ++i) {
            EXPECT_EQ(report.results[static_cast<std::size_t>(i)].id,
                      "delayed-" + std::to_string(i))
                << "run " << run;
        }
        EXPECT_FALSE(report.partial);
    }
}

TEST(RunnerTest, HugeTimeout_DoesNotExpireImmediately) {
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("a", CheckStatus::Pass)));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("b", CheckStatus::Pass)));
    auto artifact = plain_elf();

    for (const auto timeout : {std::chrono::milliseconds::max(),
                               *policy::timeout_from_seconds(1e10)}) {
        policy::Policy policy = policy::default_policy();
        policy.timeout = timeout;
        const CheckRunner runner(registry, policy);

        const auto report = runner.run(*artifact);
        EXPECT_FALSE(report.partial) << timeout.count();
        EXPECT_EQ(report.results.size(), 2u) << timeout.count();
    }
}

TEST(RunnerTest, CancelledBeforeStart_PartialWithoutResults) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    CancellationToken token;
    token.cancel();
    RunOptions options;
    options.cancellation = &token;

    auto artifact = plain_elf();
    const auto report = runner.run(*artifact, options);
    EXPECT_TRUE(report.partial);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.total_checks, 0u);
    EXPECT_FALSE(report.overall_pass());
}

TEST(RunnerTest, CancelledMidRun_KeepsFinishedResults) {
    CancellationToken token;
    CheckRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("first", CheckStatus::Pass)));
    ASSERT_TRUE(registry.add(std::make_unique<CancellingCheck>(token)));
    ASSERT_TRUE(registry.add(std::make_unique<StubCheck>("never", CheckStatus::Pass)));
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    RunOptions options;
    options.threads = 1;
    options.cancellation = &token;
    auto artifact = plain_elf();
    const auto report = runner.run(*artifact, options);

    EXPECT_TRUE(report.partial);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].id, "first");
    EXPECT_EQ(report.results[1].id, "cancelling");
    EXPECT_EQ(report.total_checks, 2u);
    EXPECT_EQ(report.failed_checks, 0u);
    EXPECT_FALSE(report.overall_pass());
}

TEST(RunnerTest, ExpiredDeadline_PartialReport) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    RunOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
    auto artifact = plain_elf();
    const auto report = runner.run(*artifact, options);
    EXPECT_TRUE(report.partial);
    EXPECT_TRUE(report.results.empty());
}

TEST(RunnerTest, RunAll_MissingFile_IsFileNotFound) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    TempDir dir;
    auto result = runner.run_all(dir.path() / "does-not-exist");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, io::SourceErrorKind::FileNotFound);
}

TEST(RunnerTest, RunAll_UnreadableFile_IsPermissionDenied) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    TempDir dir;
    const auto path = dir.write("locked.bin", build_elf(ElfOptions{}).bytes);
    std::filesystem::permissions(path, std::filesystem::perms::none);
    const bool readable = std::ifstream(path, std::ios::binary).is_open();
    if (readable) {
        // root читает файл и без прав
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        GTEST_SKIP() << "file with no permissions is still readable";
    }

    auto result = runner.run_all(path);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, io::SourceErrorKind::PermissionDenied);
    EXPECT_EQ(std::string(io::source_error_kind_to_string(result.error.kind)), "PermissionDenied");
}

TEST(RunnerTest, RunAll_EmptyFile_FileSignatureFailsAsTruncated) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    TempDir dir;
    const auto path = dir.write("empty.bin", Bytes{});
    auto result = runner.run_all(path);
    ASSERT_TRUE(result) << result.error.format();
    ASSERT_EQ(result.report.total_checks, 11u);
    // Без содержимого проходят только hash-integrity и encryption-standard
    EXPECT_EQ(result.report.failed_checks, 9u);
    EXPECT_NE(result.report.results[0].details.find("Truncated"), std::string::npos);
}

TEST(RunnerTest, RunAll_FileOnDisk_HashesContent) {
    const CheckRegistry registry = make_default_registry();
    const policy::Policy policy = policy::default_policy();
    const CheckRunner runner(registry, policy);

    TempDir dir;
    const auto bytes = build_elf(ElfOptions{}).bytes;
    const auto path = dir.write("app", bytes);
    auto result = runner.run_all(path);
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.report.binary_hash, make_memory_artifact(bytes, "app")->content_hash);
    EXPECT_EQ(result.report.binary_hash.size(), 64u);
}

}  // namespace raven::check::test
