// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Опции со значением принимаются в двух формах: "--opt value" и "--opt=value".
// Любая ошибка разбора - exit code 2 с usage-подсказкой.
//
// ==============================================================================

#include <raven/cli.hpp>
#include <raven/platform.hpp>
#include <raven/policy.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace raven::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Ошибка разбора; превращается в CliDiagnostic в parse()
class UsageError : public std::runtime_error {
public:
    UsageError(const std::string& message, std::string command)
        : std::runtime_error(message), command_(std::move(command)) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

std::string render_usage_error(const std::string& error_msg, const std::string& command) {
    std::string usage = std::string("Usage: ") + PROGRAM + " [OPTIONS] ";
    usage += command.empty() ? "<COMMAND>" : command + " [OPTIONS]";
    if (command == "check" || command == "sbom") {
        usage += " <BINARY>";
    }
    return "error: " + error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

/// Аргументы одной подкоманды с поддержкой "--opt value" / "--opt=value"
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start, std::string command)
        : argc_(argc), argv_(argv), index_(start), command_(std::move(command)) {}

    bool next() {
        if (index_ >= argc_) {
            return false;
        }
        arg_ = argv_[index_++];
        inline_value_.reset();
        if (starts_with(arg_, "--")) {
            if (const char* eq = std::strchr(arg_, '=')) {
                name_.assign(arg_, static_cast<std::size_t>(eq - arg_));
                inline_value_ = std::string(eq + 1);
                return true;
            }
        }
        name_ = arg_;
        return true;
    }

    bool is(const char* short_name, const char* long_name) const {
        return (short_name != nullptr && name_ == short_name) ||
               (long_name != nullptr && name_ == long_name);
    }

    const std::string& name() const { return name_; }
    const char* raw() const { return arg_; }
    bool positional() const { return arg_[0] != '-' || str_eq(arg_, "-"); }

    /// Значение опции (inline или следующий аргумент)
    std::string value() {
        if (inline_value_) {
            return *inline_value_;
        }
        if (index_ >= argc_) {
            fail("a value is required for '" + name_ + "' but none was supplied");
        }
        return argv_[index_++];
    }

    /// Флаг без значения
    void flag() const {
        if (inline_value_) {
            fail("unexpected value for '" + name_ + "'");
        }
    }

    [[noreturn]] void fail(const std::string& message) const { throw UsageError(message, command_); }

private:
    int argc_;
    char** argv_;
    int index_;
    std::string command_;
    const char* arg_ = "";
    std::string name_;
    std::optional<std::string> inline_value_;
};

std::size_t parse_threads(ArgCursor& cur) {
    const std::string text = cur.value();
    std::size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != text.size() || text.empty() || text[0] == '-') {
        cur.fail("invalid value '" + text + "' for '--threads <N>': expected a non-negative integer");
    }
    return static_cast<std::size_t>(value);
}

double parse_timeout(ArgCursor& cur) {
    const std::string text = cur.value();
    std::size_t pos = 0;
    double value = -1.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != text.size() || text.empty() || !policy::timeout_from_seconds(value)) {
        cur.fail("invalid value '" + text +
                 "' for '--timeout <SECONDS>': expected a non-negative number");
    }
    return std::min(value, policy::MAX_TIMEOUT_SECONDS);
}

sbom::SbomFormat parse_sbom_format_arg(ArgCursor& cur, const char* option) {
    const std::string text = cur.value();
    auto format = sbom::parse_sbom_format(text);
    if (!format) {
        cur.fail("invalid value '" + text + "' for '" + option +
                 " <FORMAT>': supported formats are cyclonedx, spdx");
    }
    return *format;
}

void set_binary(ArgCursor& cur, std::filesystem::path& binary) {
    if (!binary.empty()) {
        cur.fail(std::string("unexpected argument '") + cur.raw() + "'");
    }
    binary = platform::path_from_utf8(cur.raw());
}

Command parse_check(ArgCursor& cur) {
    CheckCommand cmd;
    while (cur.next()) {
        if (cur.positional()) {
            set_binary(cur, cmd.binary);
        } else if (cur.is("-h", "--help")) {
            return HelpCommand{"check"};
        } else if (cur.is("-f", "--format")) {
            const std::string format = cur.value();
            if (format == "json") {
                cmd.format = output::Format::Json;
            } else if (format == "text") {
                cmd.format = output::Format::Text;
            } else {
                cur.fail("invalid value '" + format +
                         "' for '--format <FORMAT>': supported formats are json, text");
            }
        } else if (cur.is("-o", "--output")) {
            cmd.output = platform::path_from_utf8(cur.value());
        } else if (cur.is(nullptr, "--policy")) {
            cmd.policy = platform::path_from_utf8(cur.value());
        } else if (cur.is(nullptr, "--threads")) {
            cmd.threads = parse_threads(cur);
        } else if (cur.is(nullptr, "--timeout")) {
            cmd.timeout_seconds = parse_timeout(cur);
        } else if (cur.is(nullptr, "--sbom")) {
            cur.flag();
            cmd.sbom = true;
        } else if (cur.is(nullptr, "--sbom-format")) {
            cmd.sbom_format = parse_sbom_format_arg(cur, "--sbom-format");
        } else if (cur.is(nullptr, "--sbom-output")) {
            const std::string path = cur.value();
            if (path.empty()) {
                cur.fail("SBOM output path cannot be empty");
            }
            cmd.sbom_output = platform::path_from_utf8(path);
        } else {
            cur.fail("unexpected argument '" + cur.name() + "'");
        }
    }
    if (cmd.binary.empty()) {
        cur.fail("the following required arguments were not provided:\n  <BINARY>");
    }
    return cmd;
}

Command parse_sbom(ArgCursor& cur) {
    SbomCommand cmd;
    while (cur.next()) {
        if (cur.positional()) {
            set_binary(cur, cmd.binary);
        } else if (cur.is("-h", "--help")) {
            return HelpCommand{"sbom"};
        } else if (cur.is("-f", "--format")) {
            cmd.format = parse_sbom_format_arg(cur, "--format");
        } else if (cur.is("-o", "--output")) {
            cmd.output = platform::path_from_utf8(cur.value());
        } else {
            cur.fail("unexpected argument '" + cur.name() + "'");
        }
    }
    if (cmd.binary.empty()) {
        cur.fail("the following required arguments were not provided:\n  <BINARY>");
    }
    return cmd;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM) + " " + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: raven-linter [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  check    Run all compliance checks against a binary\n"
               "  sbom     Generate a Software Bill of Materials for a binary\n"
               "  list     List the available compliance checks\n"
               "  version  Print version information\n"
               "  help     Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational messages\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Environment:\n"
               "  RAVEN_POLICY     Policy file used when --policy is not given\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Check a binary and print a table:\n"
               "        raven-linter check ./my-binary\n"
               "\n"
               "    Check with a policy and write a JSON report:\n"
               "        raven-linter check ./my-binary --policy policy.yml -f json -o report.json\n"
               "\n"
               "    Check and generate an SPDX SBOM alongside:\n"
               "        raven-linter check ./my-binary --sbom --sbom-format spdx "
               "--sbom-output sbom.spdx.json\n";
    }
    if (*command == "check") {
        return "Run all compliance checks against a binary\n"
               "\n"
               "Usage: raven-linter check [OPTIONS] <BINARY>\n"
               "\n"
               "Arguments:\n"
               "  <BINARY>  Path to the ELF, PE or Mach-O binary\n"
               "\n"
               "Options:\n"
               "  -f, --format <FORMAT>         Output format: text or json [default: text]\n"
               "  -o, --output <OUTPUT>         Write the report to a file\n"
               "      --policy <POLICY>         Policy file (YAML)\n"
               "      --threads <N>             Worker threads [default: num of CPUs]\n"
               "      --timeout <SECONDS>       Stop starting new checks after this time\n"
               "      --sbom                    Generate a Software Bill of Materials\n"
               "      --sbom-format <FORMAT>    SBOM format: cyclonedx or spdx "
               "[default: cyclonedx]\n"
               "      --sbom-output <FILE>      SBOM output file [default: sbom.json]\n"
               "  -h, --help                    Print help\n";
    }
    if (*command == "sbom") {
        return "Generate a Software Bill of Materials for a binary\n"
               "\n"
               "Usage: raven-linter sbom [OPTIONS] <BINARY>\n"
               "\n"
               "Arguments:\n"
               "  <BINARY>  Path to the ELF, PE or Mach-O binary\n"
               "\n"
               "Options:\n"
               "  -f, --format <FORMAT>  SBOM format: cyclonedx or spdx [default: cyclonedx]\n"
               "  -o, --output <OUTPUT>  Write the SBOM to a file\n"
               "  -h, --help             Print help\n";
    }
    if (*command == "list") {
        return "List the available compliance checks\n"
               "\n"
               "Usage: raven-linter list\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "version") {
        return "Print version information\n"
               "\n"
               "Usage: raven-linter version\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (starts_with(arg, "-vv") && std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.stderr_message =
                render_usage_error(std::string("unexpected argument '") + arg + "'", "");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const std::string cmd = argv[cmd_idx];
    try {
        ArgCursor cur(argc, argv, cmd_idx + 1, cmd);
        if (cmd == "check") {
            result.command = parse_check(cur);
        } else if (cmd == "sbom") {
            result.command = parse_sbom(cur);
        } else if (cmd == "list" || cmd == "version") {
            while (cur.next()) {
                if (cur.is("-h", "--help")) {
                    result.ok = true;
                    result.command = HelpCommand{cmd};
                    return result;
                }
                cur.fail("unexpected argument '" + cur.name() + "'");
            }
            if (cmd == "list") {
                result.command = ListCommand{};
            } else {
                result.command = VersionCommand{};
            }
        } else if (cmd == "help") {
            HelpCommand help;
            if (cur.next()) {
                help.command = cur.name();
            }
            result.command = help;
        } else {
            result.diagnostic.stderr_message =
                render_usage_error("unrecognized subcommand '" + cmd + "'", "");
            return result;
        }
    } catch (const UsageError& e) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_usage_error(e.what(), e.command());
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace raven::cli
