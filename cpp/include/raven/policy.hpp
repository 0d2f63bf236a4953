// ==============================================================================
// raven/policy.hpp - Политика проверок (YAML)
// ==============================================================================
//
// Назначение:
// - Настраиваемые параметры правил: denylist'ы, allow-list алгоритмов,
//   якоря доверия, доверенные ключи
// - Настройки исполнителя: число потоков, таймаут
// - Загрузка из YAML (yaml-cpp), значения по умолчанию - default_policy()
//
// Формат файла:
// @code
//   format:
//     expected: elf              # необязательно
//     check_extension: true
//   dependencies:
//     denylist: ["libssl.so.1.0*"]
//     require_version: ["libc.so.*"]
//   crypto:
//     require_certificate: true
//     trust_anchors: [ca.pem]    # путь относительно файла политики или PEM
//     trusted_keys: [signer.pub]
//     approved_algorithms: [AES-256-GCM, SHA-256, Ed25519]
//     deprecated_algorithms: [MD5, SHA-1, RC4]
//     scan_strings: true
//   licenses:
//     denylist: [AGPL-3.0-only]
//   runner:
//     threads: 4
//     timeout: 30                # секунды, 0 - без ограничения
// @endcode
//
// ==============================================================================

#ifndef RAVEN_POLICY_HPP
#define RAVEN_POLICY_HPP

#include <raven/format.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raven::policy {

/// Имя переменной окружения с путём к файлу политики
constexpr const char* POLICY_ENV = "RAVEN_POLICY";

struct Policy {
    // file-signature
    std::optional<format::FormatKind> expected_format;
    bool check_extension = true;

    // dependency-analysis (glob-шаблоны: '*' и '?')
    std::vector<std::string> denied_libraries;
    std::vector<std::string> require_version;

    // certificate-validation / signature-verification
    bool require_certificate = true;
    std::vector<std::string> trust_anchors;  // PEM-текст
    std::vector<std::string> trusted_keys;   // PEM-текст (PUBLIC KEY или CERTIFICATE)

    // encryption-standard
    std::vector<std::string> approved_algorithms;
    std::vector<std::string> deprecated_algorithms;
    bool scan_strings = true;

    // license-compliance
    std::vector<std::string> denied_licenses;

    // runner
    std::size_t threads = 0;  // 0 - по числу ядер
    std::chrono::milliseconds timeout{0};
};

/// Политика по умолчанию (без якорей доверия и ключей)
Policy default_policy();

/// Верхняя граница таймаута запуска, секунды (сутки)
constexpr double MAX_TIMEOUT_SECONDS = 86400.0;

/// Таймаут из секунд: nullopt для отрицательных и нечисловых (NaN, inf),
/// большие значения срезаются до MAX_TIMEOUT_SECONDS
std::optional<std::chrono::milliseconds> timeout_from_seconds(double seconds);

struct PolicyResult {
    bool ok = false;
    Policy policy;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML-текст поверх default_policy().
/// base_dir - каталог для относительных путей trust_anchors / trusted_keys.
PolicyResult policy_from_yaml(std::string_view yaml, const std::filesystem::path& base_dir = {});

/// Загрузить файл политики
PolicyResult load_policy(const std::filesystem::path& path);

/// Совпадение имени с glob-шаблоном ('*' - любая подстрока, '?' - один символ)
bool glob_match(std::string_view pattern, std::string_view name);

/// Нормализованное имя алгоритма: нижний регистр без '-', '_', ' ', '/'
std::string normalize_algorithm(std::string_view name);

}  // namespace raven::policy

#endif  // RAVEN_POLICY_HPP
