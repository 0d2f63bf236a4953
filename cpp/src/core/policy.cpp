// ==============================================================================
// policy.cpp - Загрузка политики из YAML (yaml-cpp)
// ==============================================================================

#include <raven/platform.hpp>
#include <raven/policy.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace raven::policy {

namespace {

/// Ошибка содержимого политики (не синтаксиса YAML)
class PolicyFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::vector<std::string> string_list(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> out;
    if (!node.IsDefined() || node.IsNull()) {
        return out;
    }
    if (!node.IsSequence()) {
        throw PolicyFailure("'" + key + "' must be a list");
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PolicyFailure("cannot open '" + platform::path_to_utf8(path) + "'");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/// Элемент trust_anchors / trusted_keys: PEM-текст или путь к файлу
std::vector<std::string> pem_list(const YAML::Node& node, const std::string& key,
                                  const std::filesystem::path& base_dir) {
    std::vector<std::string> out;
    for (const auto& entry : string_list(node, key)) {
        if (entry.find("-----BEGIN ") != std::string::npos) {
            out.push_back(entry);
            continue;
        }
        std::filesystem::path path = platform::path_from_utf8(entry);
        if (path.is_relative() && !base_dir.empty()) {
            path = base_dir / path;
        }
        std::string text = read_text_file(path);
        if (text.find("-----BEGIN ") == std::string::npos) {
            throw PolicyFailure("'" + entry + "' in " + key + " is not PEM");
        }
        out.push_back(std::move(text));
    }
    return out;
}

bool flag(const YAML::Node& node, bool fallback) {
    if (!node.IsDefined() || node.IsNull()) {
        return fallback;
    }
    return node.as<bool>();
}

/// Подраздел политики; отсутствующий раздел - пустой mapping
YAML::Node section(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node.IsDefined() || node.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!node.IsMap()) {
        throw PolicyFailure(std::string("'") + key + "' must be a mapping");
    }
    return node;
}

}  // namespace

Policy default_policy() {
    Policy p;
    p.denied_libraries = {"libssl.so.0.9*", "libcrypto.so.0.9*", "libssl.so.1.0*",
                          "libcrypto.so.1.0*"};
    p.require_version = {"libc.so.*"};
    p.approved_algorithms = {"AES-128",     "AES-192",          "AES-256",  "AES-128-GCM",
                             "AES-256-GCM", "ChaCha20",         "ChaCha20-Poly1305",
                             "SHA-256",     "SHA-384",          "SHA-512",  "SHA3-256",
                             "SHA3-512",    "HMAC-SHA256",      "RSA-2048", "RSA-3072",
                             "RSA-4096",    "ECDSA-P256",       "ECDSA-P384", "Ed25519",
                             "X25519",      "TLS1.2",           "TLS1.3"};
    p.deprecated_algorithms = {"DES",  "3DES",  "RC2",   "RC4",    "MD4",   "MD5",
                               "SHA-1", "Blowfish", "RSA-1024", "SSLv2", "SSLv3", "TLS1.0",
                               "TLS1.1"};
    p.denied_licenses = {"AGPL-3.0-only", "AGPL-3.0-or-later", "SSPL-1.0"};
    return p;
}

PolicyResult policy_from_yaml(std::string_view yaml, const std::filesystem::path& base_dir) {
    PolicyResult result;
    result.policy = default_policy();
    Policy& p = result.policy;

    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "policy root must be a mapping";
            return result;
        }

        const YAML::Node format_node = section(root, "format");
        if (format_node["expected"]) {
            const auto name = format_node["expected"].as<std::string>();
            auto kind = format::parse_format_kind(name);
            if (!kind || *kind == format::FormatKind::Unknown) {
                result.error = "format.expected: unknown format '" + name + "'";
                return result;
            }
            p.expected_format = kind;
        }
        p.check_extension = flag(format_node["check_extension"], p.check_extension);

        const YAML::Node deps = section(root, "dependencies");
        if (deps["denylist"]) {
            p.denied_libraries = string_list(deps["denylist"], "dependencies.denylist");
        }
        if (deps["require_version"]) {
            p.require_version = string_list(deps["require_version"], "dependencies.require_version");
        }

        const YAML::Node crypto = section(root, "crypto");
        p.require_certificate = flag(crypto["require_certificate"], p.require_certificate);
        p.trust_anchors = pem_list(crypto["trust_anchors"], "crypto.trust_anchors", base_dir);
        p.trusted_keys = pem_list(crypto["trusted_keys"], "crypto.trusted_keys", base_dir);
        if (crypto["approved_algorithms"]) {
            p.approved_algorithms =
                string_list(crypto["approved_algorithms"], "crypto.approved_algorithms");
        }
        if (crypto["deprecated_algorithms"]) {
            p.deprecated_algorithms =
                string_list(crypto["deprecated_algorithms"], "crypto.deprecated_algorithms");
        }
        p.scan_strings = flag(crypto["scan_strings"], p.scan_strings);

        const YAML::Node licenses = section(root, "licenses");
        if (licenses["denylist"]) {
            p.denied_licenses = string_list(licenses["denylist"], "licenses.denylist");
        }

        const YAML::Node runner = section(root, "runner");
        if (runner["threads"]) {
            const int threads = runner["threads"].as<int>();
            if (threads < 0) {
                result.error = "runner.threads must not be negative";
                return result;
            }
            p.threads = static_cast<std::size_t>(threads);
        }
        if (runner["timeout"]) {
            const auto timeout = timeout_from_seconds(runner["timeout"].as<double>());
            if (!timeout) {
                result.error = "runner.timeout must be a finite non-negative number";
                return result;
            }
            p.timeout = *timeout;
        }

        result.ok = true;
        return result;

    } catch (const PolicyFailure& e) {
        result.error = e.what();
        return result;
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        result.error = std::string("error loading policy: ") + e.what();
        return result;
    }
}

PolicyResult load_policy(const std::filesystem::path& path) {
    PolicyResult result;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.error = "cannot open policy file: " + platform::path_to_utf8(path);
        return result;
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    result = policy_from_yaml(ss.str(), path.parent_path());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

std::optional<std::chrono::milliseconds> timeout_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    seconds = std::min(seconds, MAX_TIMEOUT_SECONDS);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

bool glob_match(std::string_view pattern, std::string_view name) {
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::string normalize_algorithm(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ' || c == '/') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace raven::policy
