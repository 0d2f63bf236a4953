// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Байты первичны: пишем через fwrite, без std::endl.
//
// ==============================================================================

#include "raven/output.hpp"

#include "raven/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace raven::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    // stdout-часть уходит в файл, если задан --output
    if (s == Stream::Stdout && output_file_ != nullptr) {
        return output_file_;
    }
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::colored_line(std::string_view message, Color color) {
    // В файл ANSI-коды не пишем
    if (output_file_ == nullptr && supports_color(Stream::Stdout)) {
        write(Stream::Stdout, ansi_color_code(color));
        write(Stream::Stdout, message);
        write(Stream::Stdout, ANSI_RESET);
    } else {
        write(Stream::Stdout, message);
    }
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(std::vector<std::string> headers) {
    headers_ = std::move(headers);
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(const std::vector<size_t>& widths, Edge edge) const {
    const char* left = edge == Edge::Top ? BOX_TL : (edge == Edge::Middle ? BOX_LT : BOX_BL);
    const char* middle = edge == Edge::Top ? BOX_TT : (edge == Edge::Middle ? BOX_CROSS : BOX_BT);
    const char* right = edge == Edge::Top ? BOX_TR : (edge == Edge::Middle ? BOX_RT : BOX_BR);

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел отступа с каждой стороны
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? middle : right;
    }
    return line;
}

std::string Table::format_row(const std::vector<size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += ' ';
        line += cell;
        size_t w = display_width(cell);
        if (w < widths[i]) {
            line.append(widths[i] - w, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    const auto widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result = format_line(widths, Edge::Top) + "\n";
    if (!headers_.empty()) {
        result += format_row(widths, headers_) + "\n";
        result += format_line(widths, Edge::Middle) + "\n";
    }
    for (const auto& row : rows_) {
        result += format_row(widths, row) + "\n";
    }
    result += format_line(widths, Edge::Bottom) + "\n";
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return "[+] " + std::string(message) + "\n";
}

std::string format_error(std::string_view message) {
    return "[x] " + std::string(message) + "\n";
}

std::string format_warning(std::string_view message) {
    return "[!] " + std::string(message) + "\n";
}

std::string format_debug(std::string_view message) {
    return "[*] " + std::string(message) + "\n";
}

std::string format_field(std::string_view field, size_t limit) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        bool space = (c == '\n' || c == '\r' || c == '\t' || c == ' ');
        if (space) {
            if (!prev_space) {
                result += ' ';
            }
            prev_space = true;
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (limit > 3 && display_width(result) > limit) {
        // Режем по символам, не разрывая UTF-8 последовательности
        std::string cut;
        size_t chars = 0;
        for (size_t i = 0; i < result.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(result[i]);
            bool continuation = (c & 0xC0) == 0x80;
            if (!continuation) {
                if (chars == limit - 3) {
                    break;
                }
                ++chars;
            }
            cut += result[i];
        }
        result = cut + "...";
    }
    return result;
}

size_t display_width(std::string_view s) {
    size_t width = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace raven::output
