// ==============================================================================
// crypto_checks.cpp - Криптографические проверки
// ==============================================================================
//
// certificate-validation, signature-verification, hash-integrity,
// encryption-standard
//
// Сама криптография живёт в raven::crypto (OpenSSL); здесь только решения
// pass/fail и тексты.
//
// ==============================================================================

#include <raven/checks.hpp>
#include <raven/crypto.hpp>

#include "check_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>
#include <set>

namespace raven::check {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Value certificate_value(const Certificate& cert) {
    Value v = Value::make_object();
    v.set("subject", Value(cert.subject));
    v.set("issuer", Value(cert.issuer));
    v.set("serial", Value(cert.serial));
    v.set("not_before", detail::time_value(cert.not_before));
    v.set("not_after", detail::time_value(cert.not_after));
    return v;
}

}  // namespace

// ----------------------------------------------------------------------------
// certificate-validation
// ----------------------------------------------------------------------------

CheckOutcome CertificateValidationCheck::execute(const CheckContext& ctx) const {
    const auto& certs = ctx.descriptor->certificates;
    if (certs.empty()) {
        if (ctx.policy.require_certificate) {
            return CheckOutcome::fail("no embedded certificate");
        }
        return CheckOutcome::pass("no embedded certificate (not required by policy)");
    }

    Value list = Value::make_array();
    for (const auto& cert : certs) {
        list.push_back(certificate_value(cert));
    }
    Value meta = Value::make_object();
    meta.set("certificates", std::move(list));

    const auto verified = crypto::verify_chain(certs, ctx.policy.trust_anchors, ctx.evaluation_time);
    if (!verified) {
        return CheckOutcome::fail(certs.front().subject + ": " + verified.message,
                                  std::move(meta));
    }
    return CheckOutcome::pass(certs.front().subject + ": " + verified.message, std::move(meta));
}

// ----------------------------------------------------------------------------
// signature-verification
// ----------------------------------------------------------------------------

CheckOutcome SignatureVerificationCheck::execute(const CheckContext& ctx) const {
    const auto& signatures = ctx.descriptor->signatures;
    if (signatures.empty()) {
        return CheckOutcome::fail("no embedded signature");
    }

    // Сырая подпись: подходит любой доверенный ключ или сертификат-якорь
    std::vector<std::string> raw_keys = ctx.policy.trusted_keys;
    raw_keys.insert(raw_keys.end(), ctx.policy.trust_anchors.begin(),
                    ctx.policy.trust_anchors.end());

    Value list = Value::make_array();
    std::vector<std::string> failures;
    std::vector<std::string> passed;

    for (const auto& sig : signatures) {
        crypto::VerifyResult verified;
        switch (sig.kind) {
        case SignatureKind::Raw:
            if (raw_keys.empty()) {
                verified.message = "no trusted keys configured";
            } else {
                verified = crypto::verify_raw_signature(sig.data, ctx.source, sig.excluded, raw_keys);
            }
            break;
        case SignatureKind::Authenticode:
            verified = crypto::verify_authenticode(sig.data, ctx.source, sig.excluded,
                                                   ctx.policy.trust_anchors, ctx.evaluation_time);
            break;
        case SignatureKind::CodeSignature:
            verified = crypto::verify_cms_detached(sig.data, sig.signed_content,
                                                   ctx.policy.trust_anchors, ctx.evaluation_time);
            break;
        case SignatureKind::AdHoc:
            verified.message = "ad-hoc code signature has no signer";
            break;
        }

        const std::string kind = signature_kind_to_string(sig.kind);
        Value entry = Value::make_object();
        entry.set("kind", Value(kind));
        entry.set("verified", Value(verified.ok));
        entry.set("message", Value(verified.message));
        list.push_back(std::move(entry));

        if (verified) {
            passed.push_back(kind + ": " + verified.message);
        } else {
            failures.push_back(kind + ": " + verified.message);
        }
    }

    Value meta = Value::make_object();
    meta.set("signatures", std::move(list));

    if (!failures.empty()) {
        return CheckOutcome::fail(detail::join(failures, "; "), std::move(meta));
    }
    return CheckOutcome::pass(detail::join(passed, "; "), std::move(meta));
}

// ----------------------------------------------------------------------------
// hash-integrity
// ----------------------------------------------------------------------------

namespace {

/// Проверить одну заявленную сумму. Пустая строка - совпало.
std::string verify_checksum(const DeclaredChecksum& declared, const io::ByteSource& source) {
    switch (declared.kind) {
    case ChecksumKind::Sha256File: {
        const auto actual = crypto::digest_source(source, "sha256", declared.excluded);
        if (!actual) {
            return declared.name + ": " + actual.error;
        }
        if (actual.hex != lower(declared.expected)) {
            return declared.name + " mismatch: expected " + declared.expected + ", actual " +
                   actual.hex;
        }
        return {};
    }

    case ChecksumKind::PeImage: {
        if (declared.excluded.empty()) {
            return declared.name + ": checksum field location unknown";
        }
        const auto actual = crypto::pe_image_checksum(source, declared.excluded.front().offset);
        if (!actual) {
            return declared.name + ": read error";
        }
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(*actual));
        if (lower(declared.expected) != buf) {
            return declared.name + " mismatch: expected " + declared.expected + ", actual " + buf;
        }
        return {};
    }

    case ChecksumKind::CodePageHashes: {
        if (declared.page_size == 0) {
            return declared.name + ": page size is zero";
        }
        std::vector<std::string> bad_pages;
        for (std::size_t i = 0; i < declared.page_hashes.size(); ++i) {
            const std::uint64_t offset = static_cast<std::uint64_t>(i) * declared.page_size;
            if (offset >= declared.code_limit) {
                break;
            }
            const std::uint64_t len =
                std::min<std::uint64_t>(declared.page_size, declared.code_limit - offset);
            const auto actual = crypto::digest_range(source, offset, len, declared.algorithm);
            if (!actual) {
                return declared.name + ": page " + std::to_string(i) + ": " + actual.error;
            }
            // Усечённые хеши (hash type 3) сравниваются по длине заявленного значения
            const std::string expected = lower(declared.page_hashes[i]);
            if (expected.empty() || expected.size() > actual.hex.size() ||
                actual.hex.compare(0, expected.size(), expected) != 0) {
                bad_pages.push_back(std::to_string(i));
            }
        }
        if (!bad_pages.empty()) {
            return declared.name + " mismatch at page(s) " + detail::join(bad_pages, ", ");
        }
        return {};
    }
    }
    return declared.name + ": unsupported checksum kind";
}

}  // namespace

CheckOutcome HashIntegrityCheck::execute(const CheckContext& ctx) const {
    Value meta = Value::make_object();
    meta.set("content_hash", Value(ctx.content_hash));

    if (ctx.descriptor == nullptr) {
        if (ctx.detected != format::FormatKind::Unknown) {
            return CheckOutcome::fail("declared checksums cannot be read: " + ctx.format_error,
                                      std::move(meta));
        }
        return CheckOutcome::pass("no declared checksum; content sha256 " + ctx.content_hash,
                                  std::move(meta));
    }

    const auto& checksums = ctx.descriptor->checksums;
    if (checksums.empty()) {
        return CheckOutcome::pass("no declared checksum; content sha256 " + ctx.content_hash,
                                  std::move(meta));
    }

    Value list = Value::make_array();
    std::vector<std::string> failures;
    std::vector<std::string> names;
    for (const auto& declared : checksums) {
        const std::string problem = verify_checksum(declared, ctx.source);
        Value entry = Value::make_object();
        entry.set("name", Value(declared.name));
        entry.set("algorithm", Value(declared.algorithm));
        entry.set("matches", Value(problem.empty()));
        list.push_back(std::move(entry));

        if (problem.empty()) {
            names.push_back(declared.name);
        } else {
            failures.push_back(problem);
        }
    }
    meta.set("checksums", std::move(list));

    if (!failures.empty()) {
        return CheckOutcome::fail(detail::join(failures, "; "), std::move(meta));
    }
    return CheckOutcome::pass("verified " + detail::join(names, ", "), std::move(meta));
}

// ----------------------------------------------------------------------------
// encryption-standard
// ----------------------------------------------------------------------------

namespace {

bool token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
           c == '/';
}

/// Разрезать строку на кандидаты в идентификаторы алгоритмов
template <typename Fn>
void for_each_token(std::string_view text, Fn&& fn) {
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !token_char(text[i])) {
            ++i;
        }
        std::size_t start = i;
        while (i < text.size() && token_char(text[i])) {
            ++i;
        }
        std::string_view token = text.substr(start, i - start);
        while (!token.empty() && (token.back() == '.' || token.back() == '/')) {
            token.remove_suffix(1);
        }
        if (!token.empty()) {
            fn(token);
        }
    }
}

}  // namespace

CheckOutcome EncryptionStandardCheck::execute(const CheckContext& ctx) const {
    const policy::Policy& p = ctx.policy;

    std::set<std::string> approved;
    std::set<std::string> deprecated;
    std::map<std::string, std::string> vocabulary;  // normalized -> каноническое имя
    for (const auto& name : p.approved_algorithms) {
        approved.insert(policy::normalize_algorithm(name));
        vocabulary.emplace(policy::normalize_algorithm(name), name);
    }
    for (const auto& name : p.deprecated_algorithms) {
        deprecated.insert(policy::normalize_algorithm(name));
        vocabulary.emplace(policy::normalize_algorithm(name), name);
    }

    // normalized -> (имя для отчёта, откуда)
    std::map<std::string, std::pair<std::string, std::string>> found;
    if (ctx.descriptor != nullptr) {
        for (const auto& id : ctx.descriptor->crypto_identifiers) {
            const std::string norm = policy::normalize_algorithm(id);
            if (!norm.empty()) {
                found.emplace(norm, std::make_pair(id, std::string("manifest")));
            }
        }
    }

    if (p.scan_strings) {
        const bool read_ok = detail::scan_strings(ctx.source, [&](std::string_view s) {
            for_each_token(s, [&](std::string_view token) {
                const std::string norm = policy::normalize_algorithm(token);
                auto it = vocabulary.find(norm);
                if (it != vocabulary.end()) {
                    found.emplace(norm, std::make_pair(it->second, std::string("strings")));
                }
            });
            return true;
        });
        if (!read_ok) {
            return CheckOutcome::fail("read error while scanning strings");
        }
    }

    Value list = Value::make_array();
    std::vector<std::string> failures;
    std::vector<std::string> names;
    for (const auto& [norm, info] : found) {
        std::string status = "approved";
        if (approved.count(norm) == 0) {
            status = deprecated.count(norm) != 0 ? "deprecated" : "unapproved";
            failures.push_back(status + " algorithm " + info.first);
        }
        names.push_back(info.first);

        Value entry = Value::make_object();
        entry.set("name", Value(info.first));
        entry.set("status", Value(status));
        entry.set("source", Value(info.second));
        list.push_back(std::move(entry));
    }

    Value meta = Value::make_object();
    meta.set("algorithms", std::move(list));

    if (!failures.empty()) {
        return CheckOutcome::fail(detail::join(failures, "; "), std::move(meta));
    }
    if (found.empty()) {
        return CheckOutcome::pass("no cryptographic algorithm identifiers found", std::move(meta));
    }
    return CheckOutcome::pass("approved: " + detail::join(names, ", "), std::move(meta));
}

}  // namespace raven::check
