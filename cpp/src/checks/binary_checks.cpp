// ==============================================================================
// binary_checks.cpp - Проверки структуры бинарника
// ==============================================================================
//
// file-signature, binary-metadata, dependency-analysis, binary-format
//
// ==============================================================================

#include <raven/checks.hpp>
#include <raven/platform.hpp>

#include "check_util.hpp"

#include <algorithm>
#include <cstdio>

namespace raven::check {

namespace {

std::string hex64(std::uint64_t value) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(value));
    return buf;
}

/// Диапазон файла с именем владельца (секция или сегмент)
struct NamedRange {
    std::string what;
    ByteRange range;
};

std::string describe_range(const NamedRange& r) {
    return r.what + " [" + hex64(r.range.offset) + ", " + hex64(r.range.end()) + ")";
}

/// Попарные перекрытия: сортировка по смещению + самый дальний конец
std::vector<std::string> find_overlaps(std::vector<NamedRange> ranges) {
    std::sort(ranges.begin(), ranges.end(), [](const NamedRange& a, const NamedRange& b) {
        return a.range.offset < b.range.offset;
    });
    std::vector<std::string> issues;
    std::size_t reach = 0;  // индекс диапазона с самым дальним концом
    for (std::size_t i = 1; i < ranges.size(); ++i) {
        if (ranges[reach].range.overlaps(ranges[i].range)) {
            issues.push_back(describe_range(ranges[reach]) + " overlaps " +
                             describe_range(ranges[i]));
        }
        if (ranges[i].range.end() > ranges[reach].range.end()) {
            reach = i;
        }
    }
    return issues;
}

}  // namespace

// ----------------------------------------------------------------------------
// file-signature
// ----------------------------------------------------------------------------

CheckOutcome FileSignatureCheck::execute(const CheckContext& ctx) const {
    if (ctx.descriptor == nullptr) {
        std::string details = UNSUPPORTED_FORMAT_DETAILS;
        if (!ctx.format_error.empty()) {
            details += ": " + ctx.format_error;
        }
        return CheckOutcome::fail(std::move(details));
    }

    const BinaryDescriptor& d = *ctx.descriptor;
    const std::string format = format::format_kind_to_string(d.format);

    Value meta = Value::make_object();
    meta.set("format", Value(format));
    meta.set("variant", Value(d.format_variant));
    meta.set("image_kind", Value(image_kind_to_string(d.image_kind)));

    std::vector<std::string> issues;
    for (const auto& anomaly : d.header_anomalies) {
        issues.push_back("header anomaly: " + anomaly);
    }
    if (!d.header_anomalies.empty()) {
        meta.set("header_anomalies", Value::make_string_array(d.header_anomalies));
    }

    if (ctx.policy.expected_format && *ctx.policy.expected_format != d.format) {
        issues.push_back(std::string("policy expects ") +
                         format::format_kind_to_string(*ctx.policy.expected_format) +
                         " but file is " + format);
    }

    if (ctx.policy.check_extension && !ctx.path.empty()) {
        const std::string ext = platform::lower_extension(platform::path_from_utf8(ctx.path));
        const auto implied = format::format_from_extension(ext);
        if (implied) {
            meta.set("extension", Value(ext));
            if (*implied != d.format) {
                issues.push_back("extension '." + ext + "' implies " +
                                 format::format_kind_to_string(*implied) + " but file is " +
                                 format);
            }
        }
    }

    if (!issues.empty()) {
        return CheckOutcome::fail(detail::join(issues, "; "), std::move(meta));
    }
    return CheckOutcome::pass(d.format_variant + " " + image_kind_to_string(d.image_kind),
                              std::move(meta));
}

// ----------------------------------------------------------------------------
// binary-metadata
// ----------------------------------------------------------------------------

CheckOutcome BinaryMetadataCheck::execute(const CheckContext& ctx) const {
    const BinaryDescriptor& d = *ctx.descriptor;

    Value meta = Value::make_object();
    meta.set("architecture", Value(d.architecture));
    meta.set("bits", Value(static_cast<std::uint64_t>(d.bits)));
    meta.set("endianness", Value(d.endianness == Endianness::Little ? "little" : "big"));
    meta.set("image_kind", Value(image_kind_to_string(d.image_kind)));
    meta.set("entry_point", Value(hex64(d.entry_point)));
    meta.set("sections", Value(static_cast<std::uint64_t>(d.sections.size())));
    if (!d.interpreter.empty()) {
        meta.set("interpreter", Value(d.interpreter));
    }

    std::vector<std::string> issues;
    if (d.architecture.empty() || d.architecture == "unknown") {
        issues.push_back("unknown architecture");
    }
    if (d.image_kind == ImageKind::Executable && d.entry_point == 0) {
        issues.push_back("executable has no entry point");
    }

    std::string code_section;
    switch (d.format) {
    case format::FormatKind::Elf:
        if (d.find_section(".text") != nullptr) {
            code_section = ".text";
        }
        break;
    case format::FormatKind::Pe: {
        auto it = std::find_if(d.sections.begin(), d.sections.end(),
                               [](const Section& s) { return s.executable; });
        if (it != d.sections.end()) {
            code_section = it->name;
        }
        break;
    }
    case format::FormatKind::MachO:
        if (d.find_section("__TEXT,__text") != nullptr) {
            code_section = "__TEXT,__text";
        }
        break;
    case format::FormatKind::Unknown:
        break;
    }
    if (code_section.empty()) {
        issues.push_back("no code section");
    } else {
        meta.set("code_section", Value(code_section));
    }

    if (!issues.empty()) {
        return CheckOutcome::fail(detail::join(issues, "; "), std::move(meta));
    }
    return CheckOutcome::pass(d.architecture + " " + std::to_string(d.bits) + "-bit, entry " +
                                  hex64(d.entry_point) + ", code in " + code_section,
                              std::move(meta));
}

// ----------------------------------------------------------------------------
// dependency-analysis
// ----------------------------------------------------------------------------

CheckOutcome DependencyAnalysisCheck::execute(const CheckContext& ctx) const {
    const BinaryDescriptor& d = *ctx.descriptor;
    const bool versioned_format =
        d.format == format::FormatKind::Elf || d.format == format::FormatKind::MachO;

    Value libraries = Value::make_array();
    std::vector<std::string> issues;

    for (const auto& lib : d.imports) {
        Value entry = Value::make_object();
        entry.set("name", Value(lib.name));
        if (!lib.version_hint.empty()) {
            entry.set("version", Value(lib.version_hint));
        }
        libraries.push_back(std::move(entry));

        for (const auto& pattern : ctx.policy.denied_libraries) {
            if (policy::glob_match(pattern, lib.name)) {
                issues.push_back("denied library " + lib.name + " (matches " + pattern + ")");
                break;
            }
        }

        if (!versioned_format || !lib.version_requirements.empty()) {
            continue;
        }
        for (const auto& pattern : ctx.policy.require_version) {
            if (policy::glob_match(pattern, lib.name)) {
                issues.push_back(lib.name + " has no version requirement");
                break;
            }
        }
    }

    Value meta = Value::make_object();
    meta.set("libraries", std::move(libraries));

    if (!issues.empty()) {
        return CheckOutcome::fail(detail::join(issues, "; "), std::move(meta));
    }
    if (d.imports.empty()) {
        return CheckOutcome::pass("no imported libraries", std::move(meta));
    }
    return CheckOutcome::pass(std::to_string(d.imports.size()) + " imported libraries, none denied",
                              std::move(meta));
}

// ----------------------------------------------------------------------------
// binary-format
// ----------------------------------------------------------------------------

CheckOutcome BinaryFormatCheck::execute(const CheckContext& ctx) const {
    const BinaryDescriptor& d = *ctx.descriptor;
    const std::uint64_t file_size = ctx.source.size();

    std::vector<std::string> issues;
    std::vector<NamedRange> section_ranges;
    std::vector<NamedRange> segment_ranges;

    for (const auto& s : d.sections) {
        if (s.file_size == 0) {
            continue;
        }
        NamedRange r{"section " + (s.name.empty() ? std::string("<unnamed>") : s.name),
                     s.file_range()};
        if (r.range.end() > file_size || r.range.end() < r.range.offset) {
            issues.push_back(describe_range(r) + " exceeds file size " + std::to_string(file_size));
            continue;
        }
        section_ranges.push_back(std::move(r));
    }

    for (const auto& seg : d.segments) {
        if (seg.file_size == 0) {
            continue;
        }
        NamedRange r{"segment " + seg.name, seg.file_range()};
        if (r.range.end() > file_size || r.range.end() < r.range.offset) {
            issues.push_back(describe_range(r) + " exceeds file size " + std::to_string(file_size));
            continue;
        }
        if (seg.loadable) {
            segment_ranges.push_back(std::move(r));
        }
    }

    for (auto& issue : find_overlaps(section_ranges)) {
        issues.push_back(std::move(issue));
    }
    for (auto& issue : find_overlaps(segment_ranges)) {
        issues.push_back(std::move(issue));
    }

    Value meta = Value::make_object();
    meta.set("file_size", Value(file_size));
    meta.set("sections", Value(static_cast<std::uint64_t>(d.sections.size())));
    meta.set("segments", Value(static_cast<std::uint64_t>(d.segments.size())));

    if (!issues.empty()) {
        return CheckOutcome::fail(detail::join(issues, "; "), std::move(meta));
    }
    return CheckOutcome::pass(std::to_string(section_ranges.size()) + " file-backed sections and " +
                                  std::to_string(segment_ranges.size()) +
                                  " loadable segments are consistent",
                              std::move(meta));
}

}  // namespace raven::check
