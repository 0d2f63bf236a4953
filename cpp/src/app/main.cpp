// ==============================================================================
// main.cpp - Точка входа raven-linter
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Exit code: 0 - все проверки прошли, 1 - есть проваленные,
//    2 - неверный ввод или конфигурация (в том числе нечитаемый бинарник)
//
// Исключения перехватываются здесь, на границе приложения.
//
// ==============================================================================

#include <raven/artifact.hpp>
#include <raven/cli.hpp>
#include <raven/output.hpp>
#include <raven/platform.hpp>
#include <raven/policy.hpp>
#include <raven/registry.hpp>
#include <raven/report.hpp>
#include <raven/runner.hpp>
#include <raven/sbom.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <type_traits>

namespace {

using namespace raven;

constexpr int EXIT_PASS = 0;
constexpr int EXIT_FAIL = 1;
constexpr int EXIT_INVALID = 2;

constexpr const char* BANNER = R"(
    ____                            __    _       __
   / __ \____ __   _____  ____     / /   (_)___  / /____  _____
  / /_/ / __ `/ | / / _ \/ __ \   / /   / / __ \/ __/ _ \/ ___/
 / _, _/ /_/ /| |/ /  __/ / / /  / /___/ / / / / /_/  __/ /
/_/ |_|\__,_/ |___/\___/_/ /_/  /_____/_/_/ /_/\__/\___/_/
)";

// ----------------------------------------------------------------------------
// Отмена по Ctrl-C: уже запущенные проверки дорабатывают, отчёт partial
// ----------------------------------------------------------------------------

check::CancellationToken g_interrupt;

extern "C" void on_interrupt(int) {
    g_interrupt.cancel();
}

void print_banner(output::Writer& writer, const cli::GlobalOptions& global) {
    if (global.no_banner || global.quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

output::OutputConfig make_output_config(const cli::GlobalOptions& global) {
    output::OutputConfig cfg;
    cfg.quiet = global.quiet;
    cfg.verbose = global.verbose;
    cfg.no_banner = global.no_banner;
    return cfg;
}

bool write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

/// --policy, затем RAVEN_POLICY, затем встроенные значения
policy::PolicyResult resolve_policy(const std::optional<std::filesystem::path>& explicit_path,
                                    output::Writer& writer) {
    if (explicit_path) {
        writer.debug("policy: " + platform::path_to_utf8(*explicit_path));
        return policy::load_policy(*explicit_path);
    }
    const char* env = std::getenv(policy::POLICY_ENV);
    if (env != nullptr && env[0] != '\0') {
        writer.debug(std::string("policy from ") + policy::POLICY_ENV + ": " + env);
        return policy::load_policy(platform::path_from_utf8(env));
    }
    policy::PolicyResult result;
    result.ok = true;
    result.policy = policy::default_policy();
    writer.debug("policy: built-in defaults");
    return result;
}

/// Извлечь компоненты и закодировать SBOM. Ошибка - текст в error.
bool build_sbom(const Artifact& artifact, const check::ComplianceReport* report,
                sbom::SbomFormat format, const std::string& timestamp, std::string& document,
                std::string& error) {
    auto extracted = sbom::extract_components(artifact, report);
    if (!extracted) {
        error = std::string(sbom::sbom_error_kind_to_string(extracted.error)) + ": " +
                extracted.message;
        return false;
    }

    sbom::Sbom doc;
    doc.format = format;
    doc.components = std::move(extracted.components);
    doc.metadata.timestamp = timestamp;
    doc.metadata.tool_version = cli::VERSION;

    auto encoded = sbom::encode(doc);
    if (!encoded) {
        error = std::string(sbom::sbom_error_kind_to_string(encoded.error)) + ": " +
                encoded.message;
        return false;
    }
    document = std::move(encoded.document);
    return true;
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const cli::CheckCommand& cmd, const cli::GlobalOptions& global,
              output::Writer& writer) {
    auto loaded_policy = resolve_policy(cmd.policy, writer);
    if (!loaded_policy) {
        writer.error("invalid policy: " + loaded_policy.error);
        return EXIT_INVALID;
    }
    policy::Policy policy = std::move(loaded_policy.policy);
    if (cmd.threads) {
        policy.threads = *cmd.threads;
    }
    if (cmd.timeout_seconds) {
        if (auto timeout = policy::timeout_from_seconds(*cmd.timeout_seconds)) {
            policy.timeout = *timeout;
        }
    }

    const std::string path_utf8 = platform::path_to_utf8(cmd.binary);
    writer.info("Checking " + path_utf8);

    auto loaded = load_artifact(cmd.binary);
    if (!loaded) {
        writer.error(std::string(io::source_error_kind_to_string(loaded.error.kind)) + ": " +
                     loaded.error.format());
        return EXIT_INVALID;
    }
    const Artifact& artifact = *loaded.artifact;
    if (artifact.descriptor) {
        writer.debug("format: " + artifact.descriptor->format_variant + " " +
                     artifact.descriptor->architecture);
    } else {
        writer.warn("format: " + artifact.format_error);
    }

    const check::CheckRegistry registry = check::make_default_registry();
    const check::CheckRunner runner(registry, policy);

    check::RunOptions options;
    options.cancellation = &g_interrupt;
    writer.debug("running " + std::to_string(registry.size()) + " checks on " +
                 std::to_string(runner.worker_count(options)) + " thread(s)");

    std::signal(SIGINT, on_interrupt);
    check::ComplianceReport report = runner.run(artifact, options);
    std::signal(SIGINT, SIG_DFL);

    if (report.partial) {
        writer.warn("run was interrupted; report is partial");
    }

    // Ошибка SBOM не влияет на результат проверок
    if (cmd.sbom) {
        std::string document;
        std::string error;
        if (!build_sbom(artifact, &report, cmd.sbom_format, report.timestamp, document, error)) {
            writer.warn("SBOM generation failed: " + error);
        } else if (!write_file(cmd.sbom_output, document)) {
            writer.warn("SBOM generation failed: cannot write '" +
                        platform::path_to_utf8(cmd.sbom_output) + "'");
        } else {
            const auto absolute = std::filesystem::absolute(cmd.sbom_output);
            report.sbom_path = platform::path_to_utf8(absolute);
            writer.info("SBOM written to " + *report.sbom_path);
        }
    }

    output::OutputConfig out_cfg = make_output_config(global);
    out_cfg.format = cmd.format;
    out_cfg.output_path = cmd.output;
    output::Writer out(out_cfg);
    if (cmd.output && !out.has_output_file()) {
        writer.error("cannot open output file '" + platform::path_to_utf8(*cmd.output) + "'");
        return EXIT_INVALID;
    }

    if (cmd.format == output::Format::Json) {
        out.write_line(output::Stream::Stdout, report::to_json(report));
    } else {
        out.write(output::Stream::Stdout, report::to_text(report));
        if (report.overall_pass()) {
            out.colored_line("PASS", output::Color::Green);
        } else {
            out.colored_line("FAIL", output::Color::Red);
        }
    }
    if (cmd.output) {
        writer.info("Report written to " + platform::path_to_utf8(*cmd.output));
    }

    return report.overall_pass() ? EXIT_PASS : EXIT_FAIL;
}

// ----------------------------------------------------------------------------
// sbom
// ----------------------------------------------------------------------------

int run_sbom(const cli::SbomCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    auto loaded = load_artifact(cmd.binary);
    if (!loaded) {
        writer.error(std::string(io::source_error_kind_to_string(loaded.error.kind)) + ": " +
                     loaded.error.format());
        return EXIT_INVALID;
    }
    if (!loaded.artifact->descriptor) {
        writer.warn("format: " + loaded.artifact->format_error);
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    std::string document;
    std::string error;
    if (!build_sbom(*loaded.artifact, nullptr, cmd.format, platform::format_utc_rfc3339(now),
                    document, error)) {
        writer.error("SBOM generation failed: " + error);
        return EXIT_FAIL;
    }

    output::OutputConfig out_cfg = make_output_config(global);
    out_cfg.output_path = cmd.output;
    output::Writer out(out_cfg);
    if (cmd.output && !out.has_output_file()) {
        writer.error("cannot open output file '" + platform::path_to_utf8(*cmd.output) + "'");
        return EXIT_INVALID;
    }
    out.write_line(output::Stream::Stdout, document);
    if (cmd.output) {
        writer.info(std::string(sbom::sbom_format_to_string(cmd.format)) + " SBOM written to " +
                    platform::path_to_utf8(*cmd.output));
    }
    return EXIT_PASS;
}

// ----------------------------------------------------------------------------
// list
// ----------------------------------------------------------------------------

int run_list(output::Writer& writer) {
    const check::CheckRegistry registry = check::make_default_registry();
    output::Table table;
    table.set_headers({"check", "description"});
    for (std::size_t i = 0; i < registry.size(); ++i) {
        const auto& c = registry.at(i);
        table.add_row({c.id(), c.description()});
    }
    writer.write(output::Stream::Stdout, table.to_string());
    return EXIT_PASS;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::Writer writer(make_output_config(parse_result.global));

    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                const std::string help_text = cli::render_help(cmd.command);
                writer.write(output::Stream::Stdout, help_text);
                return help_text.rfind("error:", 0) == 0 ? EXIT_INVALID : EXIT_PASS;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return EXIT_PASS;
            } else if constexpr (std::is_same_v<T, cli::ListCommand>) {
                return run_list(writer);
            } else if constexpr (std::is_same_v<T, cli::CheckCommand>) {
                print_banner(writer, parse_result.global);
                return run_check(cmd, parse_result.global, writer);
            } else {
                static_assert(std::is_same_v<T, cli::SbomCommand>);
                print_banner(writer, parse_result.global);
                return run_sbom(cmd, parse_result.global, writer);
            }
        },
        parse_result.command);
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return EXIT_INVALID;
    }
}
