// ==============================================================================
// check_util.cpp - Поиск строк, semver, SPDX
// ==============================================================================

#include "check_util.hpp"

#include <raven/platform.hpp>

#include <cctype>
#include <stdexcept>

namespace raven::check::detail {

// ----------------------------------------------------------------------------
// Строки
// ----------------------------------------------------------------------------

namespace {

bool is_printable(std::uint8_t c) {
    return (c >= 0x20 && c < 0x7f) || c == '\t';
}

}  // namespace

bool scan_strings(const io::ByteSource& source,
                  const std::function<bool(std::string_view)>& visitor, std::size_t min_length,
                  std::size_t max_length) {
    std::string current;
    bool stopped = false;

    auto flush = [&]() {
        if (current.size() >= min_length && !visitor(current)) {
            stopped = true;
        }
        current.clear();
    };

    const bool read_ok = source.for_each_chunk(
        [&](std::uint64_t, const std::uint8_t* data, std::size_t len) {
            for (std::size_t i = 0; i < len && !stopped; ++i) {
                if (is_printable(data[i])) {
                    current.push_back(static_cast<char>(data[i]));
                    if (current.size() >= max_length) {
                        flush();
                    }
                } else if (!current.empty()) {
                    flush();
                }
            }
            return !stopped;
        });

    if (read_ok && !stopped && !current.empty()) {
        flush();
    }
    return read_ok;
}

// ----------------------------------------------------------------------------
// Версии
// ----------------------------------------------------------------------------

std::optional<SemVer> parse_semver(std::string_view text) {
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == 'v' || text[pos] == 'V')) {
        ++pos;
    }

    SemVer out{};
    for (std::size_t part = 0; part < out.size(); ++part) {
        if (part > 0) {
            if (pos >= text.size() || text[pos] != '.') {
                return std::nullopt;
            }
            ++pos;
        }
        const std::size_t start = pos;
        unsigned long value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (pos - start >= 9) {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned long>(text[pos] - '0');
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
        out[part] = value;
    }

    // Допустимый хвост: четвёртый компонент, pre-release, build metadata
    if (pos < text.size()) {
        const char c = text[pos];
        if (c != '.' && c != '-' && c != '+') {
            return std::nullopt;
        }
    }
    return out;
}

std::string semver_to_string(const SemVer& v) {
    return std::to_string(v[0]) + "." + std::to_string(v[1]) + "." + std::to_string(v[2]);
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

Value time_value(std::int64_t unix_seconds) {
    return Value(platform::format_utc_rfc3339(unix_seconds));
}

// ----------------------------------------------------------------------------
// SPDX
// ----------------------------------------------------------------------------

namespace {

/// Предел вложенности скобок в выражении лицензии
constexpr std::size_t MAX_SPDX_NESTING = 64;

class SpdxParser {
public:
    explicit SpdxParser(std::string_view text) { tokenize(text); }

    std::vector<std::string> parse() {
        if (tokens_.empty()) {
            throw std::runtime_error("empty license expression");
        }
        expression();
        if (pos_ != tokens_.size()) {
            throw std::runtime_error("unexpected '" + tokens_[pos_] + "'");
        }
        return ids_;
    }

private:
    static bool id_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' ||
               c == ':';
    }

    static bool is_operator(const std::string& token, const char* op) {
        if (token.size() != std::char_traits<char>::length(op)) {
            return false;
        }
        for (std::size_t i = 0; i < token.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(token[i])) != op[i]) {
                return false;
            }
        }
        return true;
    }

    void tokenize(std::string_view text) {
        std::size_t i = 0;
        while (i < text.size()) {
            const char c = text[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
            } else if (c == '(' || c == ')') {
                tokens_.emplace_back(1, c);
                ++i;
            } else if (id_char(c)) {
                const std::size_t start = i;
                while (i < text.size() && id_char(text[i])) {
                    ++i;
                }
                tokens_.emplace_back(text.substr(start, i - start));
            } else {
                throw std::runtime_error(std::string("invalid character '") + c + "'");
            }
        }
    }

    const std::string* peek() const { return pos_ < tokens_.size() ? &tokens_[pos_] : nullptr; }

    // expression := term ("OR" term)*
    void expression() {
        term();
        while (peek() != nullptr && is_operator(*peek(), "OR")) {
            ++pos_;
            term();
        }
    }

    // term := factor ("AND" factor)*
    void term() {
        factor();
        while (peek() != nullptr && is_operator(*peek(), "AND")) {
            ++pos_;
            factor();
        }
    }

    // factor := "(" expression ")" | id ["WITH" id]
    void factor() {
        const std::string* token = peek();
        if (token == nullptr) {
            throw std::runtime_error("expression ends unexpectedly");
        }
        if (*token == "(") {
            if (++depth_ > MAX_SPDX_NESTING) {
                throw std::runtime_error("parentheses nested deeper than " +
                                         std::to_string(MAX_SPDX_NESTING));
            }
            ++pos_;
            expression();
            --depth_;
            if (peek() == nullptr || *peek() != ")") {
                throw std::runtime_error("missing ')'");
            }
            ++pos_;
            return;
        }
        identifier();
        if (peek() != nullptr && is_operator(*peek(), "WITH")) {
            ++pos_;
            identifier();
        }
    }

    void identifier() {
        const std::string* token = peek();
        if (token == nullptr) {
            throw std::runtime_error("identifier expected");
        }
        if (*token == "(" || *token == ")" || is_operator(*token, "AND") ||
            is_operator(*token, "OR") || is_operator(*token, "WITH")) {
            throw std::runtime_error("identifier expected before '" + *token + "'");
        }
        ids_.push_back(*token);
        ++pos_;
    }

    std::vector<std::string> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    std::vector<std::string> ids_;
};

}  // namespace

SpdxParse parse_spdx_expression(std::string_view expression) {
    SpdxParse result;
    try {
        SpdxParser parser(expression);
        result.identifiers = parser.parse();
        result.ok = true;
    } catch (const std::runtime_error& e) {
        result.error = e.what();
    }
    return result;
}

}  // namespace raven::check::detail
