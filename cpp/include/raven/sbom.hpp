// ==============================================================================
// raven/sbom.hpp - Компоненты и SBOM (CycloneDX 1.5, SPDX 2.3)
// ==============================================================================
//
// Назначение:
// - extract_components: граф компонентов из разобранного бинарника
//   (корень-приложение + библиотеки из импортов и манифеста)
// - encode_cyclonedx / encode_spdx: чистые функции (компоненты, метаданные)
//   -> JSON-документ; serialNumber / documentNamespace выводятся из содержимого
// - decode_cyclonedx / decode_spdx: обратное восстановление компонентов
//
// Ошибки SBOM никогда не влияют на результат проверок соответствия.
//
// ==============================================================================

#ifndef RAVEN_SBOM_HPP
#define RAVEN_SBOM_HPP

#include <raven/artifact.hpp>
#include <raven/runner.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raven::sbom {

// ----------------------------------------------------------------------------
// Модель
// ----------------------------------------------------------------------------

enum class ComponentType { Application, Library };

const char* component_type_to_string(ComponentType type);

struct Component {
    ComponentType type = ComponentType::Library;
    std::string name;
    std::string version;

    /// Алгоритм ("SHA-256") -> hex
    std::map<std::string, std::string> hashes;

    std::vector<std::string> licenses;

    /// Имена компонентов, от которых зависит этот
    std::vector<std::string> depends;

    bool operator==(const Component& other) const {
        return type == other.type && name == other.name && version == other.version &&
               hashes == other.hashes && licenses == other.licenses && depends == other.depends;
    }
};

enum class SbomFormat { CycloneDX, Spdx };

const char* sbom_format_to_string(SbomFormat format);

/// "cyclonedx" | "spdx" (без учёта регистра)
std::optional<SbomFormat> parse_sbom_format(std::string_view name);

constexpr const char* TOOL_VENDOR = "Raven";
constexpr const char* TOOL_NAME = "raven-linter";

struct SbomMetadata {
    std::string timestamp;  // RFC 3339; задаётся вызывающим
    std::string tool_vendor = TOOL_VENDOR;
    std::string tool_name = TOOL_NAME;
    std::string tool_version;
};

struct Sbom {
    SbomFormat format = SbomFormat::CycloneDX;
    std::string spec_version;  // "1.5" | "SPDX-2.3"; заполняет кодировщик/декодер

    /// Первый компонент - корень (Application)
    std::vector<Component> components;

    SbomMetadata metadata;
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class SbomErrorKind { CyclicDependency, EncodingError, DecodingError };

const char* sbom_error_kind_to_string(SbomErrorKind kind);

struct ExtractResult {
    bool ok = false;
    std::vector<Component> components;
    SbomErrorKind error = SbomErrorKind::CyclicDependency;
    std::string message;

    explicit operator bool() const { return ok; }
};

struct EncodeResult {
    bool ok = false;
    std::string document;
    SbomErrorKind error = SbomErrorKind::EncodingError;
    std::string message;

    explicit operator bool() const { return ok; }
};

struct DecodeResult {
    bool ok = false;
    Sbom sbom;
    SbomErrorKind error = SbomErrorKind::DecodingError;
    std::string message;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Компоненты бинарника. Если передан отчёт, лицензии корня берутся из
/// метаданных license-compliance, версия - из version-information.
ExtractResult extract_components(const Artifact& artifact,
                                 const check::ComplianceReport* report = nullptr);

/// Найти цикл в графе зависимостей; пустая строка - циклов нет,
/// иначе путь вида "a -> b -> a"
std::string find_cycle(const std::vector<Component>& components);

/// Проверить модель перед кодированием (корень, уникальные имена, ссылки)
std::string validate(const Sbom& sbom);

EncodeResult encode_cyclonedx(const Sbom& sbom);
EncodeResult encode_spdx(const Sbom& sbom);

/// По sbom.format
EncodeResult encode(const Sbom& sbom);

DecodeResult decode_cyclonedx(std::string_view json);
DecodeResult decode_spdx(std::string_view json);

/// Детерминированный UUID (форма RFC 4122, версия 5) из SHA-256 текста
std::string content_uuid(std::string_view content);

}  // namespace raven::sbom

#endif  // RAVEN_SBOM_HPP
