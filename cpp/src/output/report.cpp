// ==============================================================================
// report.cpp - JSON и текстовое представление ComplianceReport
// ==============================================================================

#include <raven/output.hpp>
#include <raven/report.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <sstream>

namespace raven::report {

namespace {

rapidjson::Value str(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

std::uint64_t nanos(std::chrono::nanoseconds d) {
    return d.count() < 0 ? 0 : static_cast<std::uint64_t>(d.count());
}

}  // namespace

void to_rapidjson(const check::ComplianceReport& report, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("timestamp", str(report.timestamp, alloc), alloc);
    doc.AddMember("binary_path", str(report.binary_path, alloc), alloc);
    doc.AddMember("binary_hash", str(report.binary_hash, alloc), alloc);
    doc.AddMember("total_checks", static_cast<std::uint64_t>(report.total_checks), alloc);
    doc.AddMember("passed_checks", static_cast<std::uint64_t>(report.passed_checks), alloc);
    doc.AddMember("failed_checks", static_cast<std::uint64_t>(report.failed_checks), alloc);
    doc.AddMember("partial", report.partial, alloc);

    rapidjson::Value results(rapidjson::kArrayType);
    for (const auto& r : report.results) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("check_id", str(r.id, alloc), alloc);
        item.AddMember("description", str(r.description, alloc), alloc);
        item.AddMember("status", rapidjson::StringRef(check::check_status_to_string(r.status)),
                       alloc);
        item.AddMember("details", str(r.details, alloc), alloc);
        if (!r.metadata.is_null()) {
            rapidjson::Value meta;
            r.metadata.to_rapidjson(meta, alloc);
            item.AddMember("metadata", meta, alloc);
        }
        item.AddMember("duration", nanos(r.duration), alloc);
        results.PushBack(item, alloc);
    }
    doc.AddMember("results", results, alloc);
    doc.AddMember("duration", nanos(report.duration), alloc);

    if (report.sbom_path) {
        doc.AddMember("sbom_path", str(*report.sbom_path, alloc), alloc);
    }
}

std::string to_json(const check::ComplianceReport& report, bool pretty) {
    rapidjson::Document doc;
    to_rapidjson(report, doc);

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string format_duration(std::chrono::nanoseconds duration) {
    const double ns = static_cast<double>(nanos(duration));
    char buf[32];
    if (ns < 1e3) {
        std::snprintf(buf, sizeof(buf), "%.0fns", ns);
    } else if (ns < 1e6) {
        std::snprintf(buf, sizeof(buf), "%.1fus", ns / 1e3);
    } else if (ns < 1e9) {
        std::snprintf(buf, sizeof(buf), "%.1fms", ns / 1e6);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fs", ns / 1e9);
    }
    return buf;
}

std::string to_text(const check::ComplianceReport& report) {
    std::ostringstream out;
    out << "Binary:    " << report.binary_path << "\n";
    out << "SHA-256:   " << report.binary_hash << "\n";
    out << "Format:    " << report.format;
    if (!report.format_error.empty()) {
        out << " (" << report.format_error << ")";
    }
    out << "\n";
    out << "Timestamp: " << report.timestamp << "\n\n";

    output::Table table;
    table.set_headers({"check", "status", "duration", "details"});
    for (const auto& r : report.results) {
        table.add_row({r.id, r.passed() ? "PASS" : "FAIL", format_duration(r.duration),
                       output::format_field(r.details, DETAILS_COLUMN_WIDTH)});
    }
    out << table.to_string();

    if (report.failed_checks > 0) {
        out << "\nFailed checks:\n";
        for (const auto& r : report.results) {
            if (!r.passed()) {
                out << "  " << r.id << ": " << r.details << "\n";
            }
        }
    }

    out << "\n"
        << report.passed_checks << "/" << report.total_checks << " checks passed, "
        << report.failed_checks << " failed in " << format_duration(report.duration);
    if (report.partial) {
        out << " (partial: run was cancelled or timed out)";
    }
    out << "\n";
    if (report.sbom_path) {
        out << "SBOM:      " << *report.sbom_path << "\n";
    }
    return out.str();
}

}  // namespace raven::report
