// ==============================================================================
// parser.cpp - Диспетчеризация парсеров, манифест raven, общие утилиты
// ==============================================================================

#include <raven/parser.hpp>

#include "byte_view.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace raven::format {

namespace {

std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

std::vector<std::string> split_list(std::string_view s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            pos = s.size();
        }
        std::string item = trim(s.substr(start, pos - start));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        start = pos + 1;
    }
    return out;
}

/// "name@version[:dep,dep]"
std::optional<DeclaredComponent> parse_requirement(std::string_view spec) {
    DeclaredComponent component;
    std::string_view head = spec;
    const std::size_t colon = spec.find(':');
    if (colon != std::string_view::npos) {
        head = spec.substr(0, colon);
        component.depends = split_list(spec.substr(colon + 1), ',');
    }
    const std::size_t at = head.find('@');
    if (at == std::string_view::npos) {
        component.name = trim(head);
    } else {
        component.name = trim(head.substr(0, at));
        component.version = trim(head.substr(at + 1));
    }
    if (component.name.empty()) {
        return std::nullopt;
    }
    return component;
}

}  // namespace

const char* parse_error_kind_to_string(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::MalformedHeader:
        return "MalformedHeader";
    case ParseErrorKind::UnexpectedEOF:
        return "UnexpectedEOF";
    case ParseErrorKind::UnsupportedVariant:
    default:
        return "UnsupportedVariant";
    }
}

std::string ParseError::format() const {
    return std::string(parse_error_kind_to_string(kind)) + ": " + message;
}

ParseResult parse_descriptor(FormatKind kind, const io::ByteSource& source) {
    switch (kind) {
    case FormatKind::Elf:
        return parse_elf(source);
    case FormatKind::Pe:
        return parse_pe(source);
    case FormatKind::MachO:
        return parse_macho(source);
    case FormatKind::Unknown:
    default:
        break;
    }
    ParseResult result;
    result.error.kind = ParseErrorKind::UnsupportedVariant;
    result.error.message = "no parser for unrecognized container format";
    return result;
}

void apply_manifest(std::string_view text, BinaryDescriptor& descriptor) {
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string line = trim(text.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line[0] == '#') {
            continue;
        }
        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = trim(std::string_view(line).substr(0, eq));
        const std::string value = trim(std::string_view(line).substr(eq + 1));
        if (value.empty()) {
            continue;
        }

        if (key == "version" || key == "product_version") {
            descriptor.versions.push_back({"manifest." + key, value});
        } else if (key == "license") {
            descriptor.licenses.push_back(value);
        } else if (key == "crypto") {
            for (auto& id : split_list(value, ',')) {
                descriptor.crypto_identifiers.push_back(std::move(id));
            }
        } else if (key == "requires") {
            if (auto component = parse_requirement(value)) {
                descriptor.declared_components.push_back(std::move(*component));
            }
        }
    }
}

namespace detail {

std::vector<unsigned long> version_key(const std::string& version) {
    std::vector<unsigned long> key;
    std::size_t i = 0;
    while (i < version.size() && !std::isdigit(static_cast<unsigned char>(version[i]))) {
        ++i;
    }
    while (i < version.size()) {
        unsigned long part = 0;
        bool any = false;
        while (i < version.size() && std::isdigit(static_cast<unsigned char>(version[i]))) {
            part = part * 10 + static_cast<unsigned long>(version[i] - '0');
            any = true;
            ++i;
        }
        if (any) {
            key.push_back(part);
        }
        if (i < version.size() && version[i] == '.') {
            ++i;
            continue;
        }
        break;
    }
    return key;
}

std::string highest_version(const std::vector<std::string>& versions) {
    std::string best;
    std::vector<unsigned long> best_key;
    for (const auto& v : versions) {
        auto key = version_key(v);
        if (best.empty() || key > best_key) {
            best = v;
            best_key = std::move(key);
        }
    }
    return best;
}

std::vector<std::vector<std::uint8_t>> split_der_sequences(const std::vector<std::uint8_t>& blob) {
    std::vector<std::vector<std::uint8_t>> out;
    std::size_t pos = 0;
    while (pos + 2 <= blob.size() && blob[pos] == 0x30) {
        std::size_t len = blob[pos + 1];
        std::size_t header = 2;
        if (len & 0x80) {
            const std::size_t n = len & 0x7F;
            if (n == 0 || n > 4 || pos + 2 + n > blob.size()) {
                break;
            }
            len = 0;
            for (std::size_t i = 0; i < n; ++i) {
                len = (len << 8) | blob[pos + 2 + i];
            }
            header += n;
        }
        if (len > blob.size() - pos - header) {
            break;
        }
        out.emplace_back(blob.begin() + static_cast<std::ptrdiff_t>(pos),
                         blob.begin() + static_cast<std::ptrdiff_t>(pos + header + len));
        pos += header + len;
    }
    return out;
}

}  // namespace detail

}  // namespace raven::format
