// ==============================================================================
// extract.cpp - Граф компонентов бинарника
// ==============================================================================
//
// Корень: приложение (имя файла, SHA-256 содержимого, лицензии).
// Библиотеки: импорты дескриптора (версия из version_hint) и требования
// манифеста requires=name@version:dep,dep. Зависимость на неизвестное имя
// добавляет библиотеку без версии.
//
// ==============================================================================

#include <raven/crypto.hpp>
#include <raven/platform.hpp>
#include <raven/sbom.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>
#include <utility>

namespace raven::sbom {

const char* component_type_to_string(ComponentType type) {
    switch (type) {
    case ComponentType::Application:
        return "application";
    case ComponentType::Library:
    default:
        return "library";
    }
}

const char* sbom_format_to_string(SbomFormat format) {
    switch (format) {
    case SbomFormat::CycloneDX:
        return "cyclonedx";
    case SbomFormat::Spdx:
    default:
        return "spdx";
    }
}

std::optional<SbomFormat> parse_sbom_format(std::string_view name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "cyclonedx") {
        return SbomFormat::CycloneDX;
    }
    if (n == "spdx") {
        return SbomFormat::Spdx;
    }
    return std::nullopt;
}

const char* sbom_error_kind_to_string(SbomErrorKind kind) {
    switch (kind) {
    case SbomErrorKind::CyclicDependency:
        return "CyclicDependency";
    case SbomErrorKind::EncodingError:
        return "EncodingError";
    case SbomErrorKind::DecodingError:
    default:
        return "DecodingError";
    }
}

std::string content_uuid(std::string_view content) {
    const auto digest = crypto::digest_bytes(reinterpret_cast<const std::uint8_t*>(content.data()),
                                             content.size(), "sha256");
    std::string hex = digest ? digest.hex : std::string(64, '0');
    // Версия 5, вариант RFC 4122
    hex[12] = '5';
    const int nibble = std::stoi(hex.substr(16, 1), nullptr, 16);
    hex[16] = "89ab"[nibble & 3];
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ----------------------------------------------------------------------------
// Граф
// ----------------------------------------------------------------------------

std::string find_cycle(const std::vector<Component>& components) {
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < components.size(); ++i) {
        index.emplace(components[i].name, i);
    }

    enum class Mark { White, Grey, Black };
    std::vector<Mark> marks(components.size(), Mark::White);

    // Обход в глубину с явным стеком: (вершина, индекс следующей зависимости).
    // Стек и есть текущий путь от корня обхода.
    std::vector<std::pair<std::size_t, std::size_t>> stack;

    for (std::size_t start = 0; start < components.size(); ++start) {
        if (marks[start] != Mark::White) {
            continue;
        }
        marks[start] = Mark::Grey;
        stack.emplace_back(start, 0);

        while (!stack.empty()) {
            auto& [i, next] = stack.back();
            const auto& depends = components[i].depends;
            if (next == depends.size()) {
                marks[i] = Mark::Black;
                stack.pop_back();
                continue;
            }
            auto it = index.find(depends[next++]);
            if (it == index.end()) {
                continue;
            }
            const std::size_t j = it->second;
            if (marks[j] == Mark::Grey) {
                auto from = std::find_if(stack.begin(), stack.end(),
                                         [j](const auto& frame) { return frame.first == j; });
                std::string cycle;
                for (auto p = from; p != stack.end(); ++p) {
                    cycle += components[p->first].name + " -> ";
                }
                return cycle + components[j].name;
            }
            if (marks[j] == Mark::White) {
                marks[j] = Mark::Grey;
                stack.emplace_back(j, 0);
            }
        }
    }
    return {};
}

std::string validate(const Sbom& sbom) {
    if (sbom.components.empty()) {
        return "SBOM has no components";
    }
    if (sbom.components.front().type != ComponentType::Application) {
        return "first component must be the application";
    }
    if (sbom.metadata.timestamp.empty()) {
        return "SBOM timestamp is empty";
    }

    std::unordered_map<std::string, std::size_t> names;
    for (const auto& c : sbom.components) {
        if (c.name.empty()) {
            return "component with empty name";
        }
        if (!names.emplace(c.name, 0).second) {
            return "duplicate component '" + c.name + "'";
        }
    }
    for (const auto& c : sbom.components) {
        for (const auto& dep : c.depends) {
            if (names.count(dep) == 0) {
                return "component '" + c.name + "' depends on unknown '" + dep + "'";
            }
        }
        for (const auto& [alg, value] : c.hashes) {
            if (value.empty() ||
                !std::all_of(value.begin(), value.end(),
                             [](unsigned char ch) { return std::isxdigit(ch) != 0; })) {
                return "component '" + c.name + "' has invalid " + alg + " digest";
            }
        }
    }

    const std::string cycle = find_cycle(sbom.components);
    if (!cycle.empty()) {
        return "dependency cycle: " + cycle;
    }
    return {};
}

// ----------------------------------------------------------------------------
// Извлечение
// ----------------------------------------------------------------------------

namespace {

const check::CheckResult* find_result(const check::ComplianceReport& report,
                                      const std::string& id) {
    for (const auto& r : report.results) {
        if (r.id == id) {
            return &r;
        }
    }
    return nullptr;
}

std::string root_version(const BinaryDescriptor* d, const check::ComplianceReport* report) {
    if (report != nullptr) {
        if (const auto* r = find_result(*report, "version-information")) {
            const Value* v = r->metadata.is_object() ? r->metadata.get("version") : nullptr;
            if (v != nullptr && v->is_string()) {
                return v->as_string();
            }
        }
    }
    if (d == nullptr || d->versions.empty()) {
        return {};
    }
    for (const auto& field : d->versions) {
        if (field.source == "manifest.version") {
            return field.value;
        }
    }
    return d->versions.front().value;
}

std::vector<std::string> root_licenses(const BinaryDescriptor* d,
                                       const check::ComplianceReport* report) {
    if (report != nullptr) {
        if (const auto* r = find_result(*report, "license-compliance")) {
            const Value* v = r->metadata.is_object() ? r->metadata.get("licenses") : nullptr;
            if (v != nullptr && v->is_array()) {
                std::vector<std::string> out;
                for (const auto& item : v->as_array()) {
                    if (item.is_string()) {
                        out.push_back(item.as_string());
                    }
                }
                return out;
            }
        }
    }
    return d != nullptr ? d->licenses : std::vector<std::string>{};
}

/// Упорядоченный набор библиотек с доступом по имени
class LibrarySet {
public:
    Component& ensure(const std::string& name) {
        auto it = index_.find(name);
        if (it != index_.end()) {
            return items_[it->second];
        }
        index_.emplace(name, items_.size());
        Component c;
        c.type = ComponentType::Library;
        c.name = name;
        items_.push_back(std::move(c));
        return items_.back();
    }

    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    std::vector<Component>& items() { return items_; }

private:
    std::vector<Component> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

void add_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

}  // namespace

ExtractResult extract_components(const Artifact& artifact, const check::ComplianceReport* report) {
    ExtractResult result;
    const BinaryDescriptor* d = artifact.descriptor_ptr();

    Component root;
    root.type = ComponentType::Application;
    root.name = platform::path_to_utf8(artifact.path.filename());
    if (root.name.empty()) {
        root.name = artifact.path_utf8;
    }
    root.version = root_version(d, report);
    root.hashes.emplace("SHA-256", artifact.content_hash);
    root.licenses = root_licenses(d, report);

    LibrarySet libraries;
    if (d != nullptr) {
        for (const auto& imported : d->imports) {
            Component& lib = libraries.ensure(imported.name);
            if (lib.version.empty()) {
                lib.version = imported.version_hint;
            }
            add_unique(root.depends, imported.name);
        }
        for (const auto& declared : d->declared_components) {
            Component& lib = libraries.ensure(declared.name);
            if (!declared.version.empty()) {
                lib.version = declared.version;
            }
            for (const auto& dep : declared.depends) {
                add_unique(lib.depends, dep);
            }
            add_unique(root.depends, declared.name);
        }
        // Зависимости на имена, которых нет среди компонентов
        for (std::size_t i = 0; i < libraries.items().size(); ++i) {
            const std::vector<std::string> deps = libraries.items()[i].depends;
            for (const auto& dep : deps) {
                if (dep != root.name && !libraries.contains(dep)) {
                    libraries.ensure(dep);
                }
            }
        }
    }

    result.components.push_back(std::move(root));
    for (auto& lib : libraries.items()) {
        result.components.push_back(std::move(lib));
    }

    const std::string cycle = find_cycle(result.components);
    if (!cycle.empty()) {
        result.components.clear();
        result.error = SbomErrorKind::CyclicDependency;
        result.message = "dependency cycle: " + cycle;
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace raven::sbom
