// ==============================================================================
// raven/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// raven-linter [--no-banner] [-v] [-q] <command>
//   check <binary> [-f json|text] [-o file] [--policy file] [--threads N]
//                  [--timeout SECONDS] [--sbom] [--sbom-format cyclonedx|spdx]
//                  [--sbom-output file]
//   sbom <binary> [--format cyclonedx|spdx] [-o file]
//   list
//   help [command]
//   version
//
// ==============================================================================

#ifndef RAVEN_CLI_HPP
#define RAVEN_CLI_HPP

#include <raven/output.hpp>
#include <raven/sbom.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace raven::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (повторяемый)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// check - проверки соответствия
struct CheckCommand {
    std::filesystem::path binary;
    output::Format format = output::Format::Text;  // -f, --format
    std::optional<std::filesystem::path> output;   // -o, --output
    std::optional<std::filesystem::path> policy;   // --policy
    std::optional<std::size_t> threads;            // --threads
    std::optional<double> timeout_seconds;         // --timeout

    bool sbom = false;                                      // --sbom
    sbom::SbomFormat sbom_format = sbom::SbomFormat::CycloneDX;  // --sbom-format
    std::filesystem::path sbom_output = "sbom.json";        // --sbom-output
};

/// sbom - только SBOM
struct SbomCommand {
    std::filesystem::path binary;
    sbom::SbomFormat format = sbom::SbomFormat::CycloneDX;  // --format
    std::optional<std::filesystem::path> output;            // -o, --output
};

/// list - список проверок
struct ListCommand {};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<CheckCommand, SbomCommand, ListCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для команды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM = "raven-linter";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Audit compiled binaries against release compliance rules";

}  // namespace raven::cli

#endif  // RAVEN_CLI_HPP
