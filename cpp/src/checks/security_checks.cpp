// ==============================================================================
// security_checks.cpp - Проверки безопасности и метаданных
// ==============================================================================
//
// security-flags, version-information, license-compliance
//
// ==============================================================================

#include <raven/checks.hpp>

#include "check_util.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace raven::check {

// ----------------------------------------------------------------------------
// security-flags
// ----------------------------------------------------------------------------

CheckOutcome SecurityFlagsCheck::execute(const CheckContext& ctx) const {
    const BinaryDescriptor& d = *ctx.descriptor;
    const HardeningFacts& h = d.hardening;

    Value meta = Value::make_object();
    meta.set("pie", Value(h.pie));
    meta.set("nx_stack", Value(h.nx_stack));
    meta.set("stack_protector", Value(h.stack_protector));
    switch (d.format) {
    case format::FormatKind::Elf:
        meta.set("relro", Value(h.relro));
        meta.set("bind_now", Value(h.bind_now));
        break;
    case format::FormatKind::Pe:
        meta.set("cfg", Value(h.cfg));
        meta.set("high_entropy_va", Value(h.high_entropy_va));
        break;
    default:
        break;
    }

    const bool pe = d.format == format::FormatKind::Pe;
    std::vector<std::string> missing;
    if (!h.pie) {
        missing.push_back(pe ? "ASLR (DYNAMIC_BASE)" : "PIE");
    }
    if (!h.nx_stack) {
        missing.push_back(pe ? "DEP (NX_COMPAT)" : "non-executable stack");
    }
    if (!h.stack_protector) {
        missing.push_back(pe ? "security cookie (/GS)" : "stack protector");
    }

    if (!missing.empty()) {
        return CheckOutcome::fail("missing " + detail::join(missing, ", "), std::move(meta));
    }
    return CheckOutcome::pass(pe ? "ASLR, DEP and /GS enabled"
                                 : "PIE, non-executable stack and stack protector enabled",
                              std::move(meta));
}

// ----------------------------------------------------------------------------
// version-information
// ----------------------------------------------------------------------------

namespace {

/// "version 1.2.3" / "Version: v1.2.3" внутри строки
std::optional<detail::SemVer> version_in_text(std::string_view text) {
    static constexpr std::string_view KEY = "version";
    for (std::size_t i = 0; i + KEY.size() < text.size(); ++i) {
        bool match = true;
        for (std::size_t k = 0; k < KEY.size(); ++k) {
            if (std::tolower(static_cast<unsigned char>(text[i + k])) != KEY[k]) {
                match = false;
                break;
            }
        }
        if (!match) {
            continue;
        }
        std::size_t pos = i + KEY.size();
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
        }
        if (pos >= text.size() || text[pos] != ' ') {
            continue;
        }
        while (pos < text.size() && text[pos] == ' ') {
            ++pos;
        }
        std::size_t end = pos;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        if (auto v = detail::parse_semver(text.substr(pos, end - pos))) {
            return v;
        }
    }
    return std::nullopt;
}

}  // namespace

CheckOutcome VersionInformationCheck::execute(const CheckContext& ctx) const {
    Value fields = Value::make_object();
    std::vector<std::pair<std::string, detail::SemVer>> parsed;
    if (ctx.descriptor != nullptr) {
        for (const auto& field : ctx.descriptor->versions) {
            fields.set(field.source, Value(field.value));
            if (auto v = detail::parse_semver(field.value)) {
                parsed.emplace_back(field.source, *v);
            }
        }
    }

    // Структурированных версий нет - ищем "version X.Y.Z" в строках
    if (parsed.empty()) {
        std::optional<detail::SemVer> found;
        const bool read_ok = detail::scan_strings(ctx.source, [&](std::string_view s) {
            found = version_in_text(s);
            return !found;
        });
        if (!read_ok) {
            return CheckOutcome::fail("read error while scanning strings");
        }
        if (found) {
            parsed.emplace_back("strings", *found);
            fields.set("strings", Value(detail::semver_to_string(*found)));
        }
    }

    Value meta = Value::make_object();
    meta.set("fields", std::move(fields));

    if (parsed.empty()) {
        return CheckOutcome::fail("no parseable version information", std::move(meta));
    }

    const detail::SemVer& reference = parsed.front().second;
    const bool consistent =
        std::all_of(parsed.begin(), parsed.end(),
                    [&](const auto& entry) { return entry.second == reference; });

    if (!consistent) {
        std::vector<std::string> listed;
        for (const auto& [source, v] : parsed) {
            listed.push_back(source + "=" + detail::semver_to_string(v));
        }
        return CheckOutcome::fail("version fields disagree: " + detail::join(listed, ", "),
                                  std::move(meta));
    }

    const std::string version = detail::semver_to_string(reference);
    meta.set("version", Value(version));
    return CheckOutcome::pass("version " + version + " (" + std::to_string(parsed.size()) +
                                  " field(s) agree)",
                              std::move(meta));
}

// ----------------------------------------------------------------------------
// license-compliance
// ----------------------------------------------------------------------------

namespace {

constexpr std::string_view SPDX_TAG = "SPDX-License-Identifier:";

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

}  // namespace

CheckOutcome LicenseComplianceCheck::execute(const CheckContext& ctx) const {
    std::vector<std::string> expressions;
    std::set<std::string> seen;
    auto add = [&](std::string expr) {
        expr = trim(expr);
        if (!expr.empty() && seen.insert(expr).second) {
            expressions.push_back(std::move(expr));
        }
    };

    if (ctx.descriptor != nullptr) {
        for (const auto& license : ctx.descriptor->licenses) {
            add(license);
        }
    }
    const bool read_ok = detail::scan_strings(ctx.source, [&](std::string_view s) {
        const auto pos = s.find(SPDX_TAG);
        if (pos != std::string_view::npos) {
            add(std::string(s.substr(pos + SPDX_TAG.size())));
        }
        return true;
    });
    if (!read_ok) {
        return CheckOutcome::fail("read error while scanning strings");
    }

    if (expressions.empty()) {
        return CheckOutcome::fail("no license declared");
    }

    std::set<std::string> denied;
    for (const auto& id : ctx.policy.denied_licenses) {
        denied.insert(upper(id));
    }

    std::vector<std::string> identifiers;
    std::vector<std::string> failures;
    for (const auto& expr : expressions) {
        const auto parsed = detail::parse_spdx_expression(expr);
        if (!parsed) {
            failures.push_back("invalid SPDX expression '" + expr + "': " + parsed.error);
            continue;
        }
        for (const auto& id : parsed.identifiers) {
            identifiers.push_back(id);
            std::string key = upper(id);
            if (denied.count(key) == 0 && !key.empty() && key.back() == '+') {
                key.pop_back();
            }
            if (denied.count(key) != 0) {
                failures.push_back("denied license " + id);
            }
        }
    }

    Value meta = Value::make_object();
    meta.set("licenses", Value::make_string_array(expressions));
    meta.set("identifiers", Value::make_string_array(identifiers));

    if (!failures.empty()) {
        return CheckOutcome::fail(detail::join(failures, "; "), std::move(meta));
    }
    return CheckOutcome::pass(detail::join(expressions, ", "), std::move(meta));
}

}  // namespace raven::check
