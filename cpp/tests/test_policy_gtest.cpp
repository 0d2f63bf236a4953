// ==============================================================================
// test_policy_gtest.cpp - Тесты политики проверок (GoogleTest)
// ==============================================================================
//
// default_policy, policy_from_yaml, load_policy, glob_match,
// normalize_algorithm
//
// ==============================================================================

#include "fixture_builder.hpp"

#include <raven/policy.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>

namespace raven::policy::test {

using raven::test::TempDir;
using raven::test::TestKey;

namespace {

bool has(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace

// ==============================================================================
// Значения по умолчанию
// ==============================================================================

TEST(PolicyTest, Defaults_AreConservative) {
    const Policy p = default_policy();
    EXPECT_FALSE(p.expected_format.has_value());
    EXPECT_TRUE(p.check_extension);
    EXPECT_TRUE(p.require_certificate);
    EXPECT_TRUE(p.scan_strings);
    EXPECT_TRUE(p.trust_anchors.empty());
    EXPECT_TRUE(p.trusted_keys.empty());
    EXPECT_TRUE(has(p.denied_libraries, "libssl.so.1.0*"));
    EXPECT_TRUE(has(p.require_version, "libc.so.*"));
    EXPECT_TRUE(has(p.approved_algorithms, "AES-256-GCM"));
    EXPECT_TRUE(has(p.deprecated_algorithms, "MD5"));
    EXPECT_TRUE(has(p.denied_licenses, "AGPL-3.0-only"));
    EXPECT_EQ(p.threads, 0u);
    EXPECT_EQ(p.timeout.count(), 0);
}

// ==============================================================================
// policy_from_yaml
// ==============================================================================

TEST(PolicyTest, EmptyDocument_GivesDefaults) {
    auto result = policy_from_yaml("");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.policy.denied_libraries, default_policy().denied_libraries);
}

TEST(PolicyTest, FullDocument_OverridesDefaults) {
    auto result = policy_from_yaml(R"(
format:
  expected: pe32+
  check_extension: false
dependencies:
  denylist: ["msvcr*.dll"]
  require_version: []
crypto:
  require_certificate: false
  approved_algorithms: [AES-256-GCM]
  deprecated_algorithms: [RC4]
  scan_strings: false
licenses:
  denylist: [GPL-3.0-only]
runner:
  threads: 3
  timeout: 1.5
)");
    ASSERT_TRUE(result) << result.error;
    const Policy& p = result.policy;
    ASSERT_TRUE(p.expected_format.has_value());
    EXPECT_EQ(*p.expected_format, format::FormatKind::Pe);
    EXPECT_FALSE(p.check_extension);
    EXPECT_EQ(p.denied_libraries, std::vector<std::string>{"msvcr*.dll"});
    EXPECT_TRUE(p.require_version.empty());
    EXPECT_FALSE(p.require_certificate);
    EXPECT_EQ(p.approved_algorithms, std::vector<std::string>{"AES-256-GCM"});
    EXPECT_EQ(p.deprecated_algorithms, std::vector<std::string>{"RC4"});
    EXPECT_FALSE(p.scan_strings);
    EXPECT_EQ(p.denied_licenses, std::vector<std::string>{"GPL-3.0-only"});
    EXPECT_EQ(p.threads, 3u);
    EXPECT_EQ(p.timeout.count(), 1500);
}

TEST(PolicyTest, PartialDocument_KeepsOtherDefaults) {
    auto result = policy_from_yaml("licenses:\n  denylist: [SSPL-1.0]\n");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.policy.denied_licenses, std::vector<std::string>{"SSPL-1.0"});
    EXPECT_EQ(result.policy.approved_algorithms, default_policy().approved_algorithms);
    EXPECT_TRUE(result.policy.require_certificate);
}

TEST(PolicyTest, RootList_IsRejected) {
    auto result = policy_from_yaml("- a\n- b\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "policy root must be a mapping");
}

TEST(PolicyTest, UnknownExpectedFormat_IsRejected) {
    auto result = policy_from_yaml("format:\n  expected: coff\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "format.expected: unknown format 'coff'");
}

TEST(PolicyTest, ScalarWhereListExpected_IsRejected) {
    auto result = policy_from_yaml("dependencies:\n  denylist: libssl.so\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "'dependencies.denylist' must be a list");
}

TEST(PolicyTest, ScalarSection_IsRejected) {
    auto result = policy_from_yaml("format: elf\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "'format' must be a mapping");
}

TEST(PolicyTest, NegativeThreads_IsRejected) {
    auto result = policy_from_yaml("runner:\n  threads: -2\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "runner.threads must not be negative");
}

TEST(PolicyTest, NegativeTimeout_IsRejected) {
    auto result = policy_from_yaml("runner:\n  timeout: -1\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "runner.timeout must be a finite non-negative number");
}

TEST(PolicyTest, InfiniteTimeout_IsRejected) {
    for (const char* text : {"runner:\n  timeout: .inf\n", "runner:\n  timeout: .nan\n"}) {
        auto result = policy_from_yaml(text);
        EXPECT_FALSE(result) << text;
        EXPECT_EQ(result.error, "runner.timeout must be a finite non-negative number") << text;
    }
}

TEST(PolicyTest, HugeTimeout_IsClampedToOneDay) {
    auto result = policy_from_yaml("runner:\n  timeout: 1e10\n");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.policy.timeout.count(), 86400000);
}

TEST(PolicyTest, TimeoutFromSeconds) {
    EXPECT_EQ(timeout_from_seconds(0.0)->count(), 0);
    EXPECT_EQ(timeout_from_seconds(2.5)->count(), 2500);
    EXPECT_EQ(timeout_from_seconds(MAX_TIMEOUT_SECONDS)->count(), 86400000);
    EXPECT_EQ(timeout_from_seconds(1e300)->count(), 86400000);
    EXPECT_FALSE(timeout_from_seconds(-0.5));
    EXPECT_FALSE(timeout_from_seconds(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(timeout_from_seconds(std::numeric_limits<double>::quiet_NaN()));
}

TEST(PolicyTest, BrokenYaml_ReportsParseError) {
    auto result = policy_from_yaml("crypto: [unclosed\n");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.rfind("YAML parse error: ", 0), 0u) << result.error;
}

TEST(PolicyTest, InlinePem_IsKept) {
    TestKey key;
    const std::string pem = key.public_pem();
    std::string yaml = "crypto:\n  trusted_keys:\n    - |\n";
    std::size_t start = 0;
    while (start < pem.size()) {
        const std::size_t end = pem.find('\n', start);
        yaml += "      " + pem.substr(start, end - start) + "\n";
        start = end == std::string::npos ? pem.size() : end + 1;
    }
    auto result = policy_from_yaml(yaml);
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.policy.trusted_keys.size(), 1u);
    EXPECT_EQ(result.policy.trusted_keys[0], pem);
}

// ==============================================================================
// load_policy
// ==============================================================================

TEST(PolicyTest, LoadPolicy_ResolvesPemPathsRelativeToFile) {
    TempDir dir;
    TestKey key;
    const auto now = raven::test::unix_now();
    const auto cert = key.self_signed("Anchor", now - 60, now + 3600);
    dir.write("anchor.pem", cert.pem);
    dir.write("signer.pub", key.public_pem());
    const auto path = dir.write("policy.yaml",
                                std::string("crypto:\n"
                                            "  trust_anchors: [anchor.pem]\n"
                                            "  trusted_keys: [signer.pub]\n"));

    auto result = load_policy(path);
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.policy.trust_anchors.size(), 1u);
    EXPECT_EQ(result.policy.trust_anchors[0], cert.pem);
    ASSERT_EQ(result.policy.trusted_keys.size(), 1u);
    EXPECT_EQ(result.policy.trusted_keys[0], key.public_pem());
}

TEST(PolicyTest, LoadPolicy_MissingPemFile_IsError) {
    TempDir dir;
    const auto path =
        dir.write("policy.yaml", std::string("crypto:\n  trust_anchors: [missing.pem]\n"));
    auto result = load_policy(path);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("cannot open"), std::string::npos);
    EXPECT_NE(result.error.find("missing.pem"), std::string::npos);
}

TEST(PolicyTest, LoadPolicy_NonPemFile_IsError) {
    TempDir dir;
    dir.write("anchor.txt", std::string("not a certificate"));
    const auto path =
        dir.write("policy.yaml", std::string("crypto:\n  trust_anchors: [anchor.txt]\n"));
    auto result = load_policy(path);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("is not PEM"), std::string::npos);
}

TEST(PolicyTest, LoadPolicy_MissingFile_IsError) {
    TempDir dir;
    auto result = load_policy(dir.path() / "nope.yaml");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("cannot open policy file"), std::string::npos);
}

// ==============================================================================
// glob_match / normalize_algorithm
// ==============================================================================

TEST(PolicyTest, GlobMatch_StarAndQuestionMark) {
    EXPECT_TRUE(glob_match("libssl.so.1.0*", "libssl.so.1.0.0"));
    EXPECT_TRUE(glob_match("libssl.so.1.0*", "libssl.so.1.0"));
    EXPECT_FALSE(glob_match("libssl.so.1.0*", "libssl.so.1.1"));
    EXPECT_TRUE(glob_match("lib?.so", "libm.so"));
    EXPECT_FALSE(glob_match("lib?.so", "libmm.so"));
    EXPECT_TRUE(glob_match("*", ""));
    EXPECT_TRUE(glob_match("*crypto*", "libcrypto.so.3"));
    EXPECT_FALSE(glob_match("", "x"));
}

TEST(PolicyTest, NormalizeAlgorithm_IgnoresCaseAndSeparators) {
    EXPECT_EQ(normalize_algorithm("AES-256-GCM"), "aes256gcm");
    EXPECT_EQ(normalize_algorithm("aes_256 gcm"), "aes256gcm");
    EXPECT_EQ(normalize_algorithm("ChaCha20/Poly1305"), "chacha20poly1305");
    EXPECT_EQ(normalize_algorithm("TLS1.3"), "tls1.3");
}

}  // namespace raven::policy::test
