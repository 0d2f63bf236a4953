// ==============================================================================
// raven/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал процесса: "[+]" info, "[!]" warn, "[x]" error, "[*]" debug
// - Таблицы с выравниванием (текстовый отчёт)
// - Вывод в файл (--output)
//
// Ядро (парсеры, проверки, SBOM) ничего не печатает: оно возвращает данные,
// а печатает только приложение через Writer.
//
// ==============================================================================

#ifndef RAVEN_OUTPUT_HPP
#define RAVEN_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raven::output {

// ----------------------------------------------------------------------------
// Потоки и форматы
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

enum class Format {
    Text,  // таблица + детали упавших проверок
    Json   // документ отчёта
};

enum class Color { Default, Green, Yellow, Red, Cyan };

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;            // -q: подавить информационные сообщения
    int verbose = 0;               // -v: уровень подробности
    bool no_banner = false;        // --no-banner
    Format format = Format::Text;  // -f, --format

    /// Файл для stdout-части вывода (-o, --output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты как есть
    void write(Stream s, std::string_view bytes);

    /// Записать строку и перевод строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr, кроме --quiet
    void info(std::string_view message);

    /// "[!] <message>" в stderr, кроме --quiet
    void warn(std::string_view message);

    /// "[x] <message>" в stderr, всегда
    void error(std::string_view message);

    /// "[*] <message>" в stderr, только при -v
    void debug(std::string_view message);

    /// Цветная строка в stdout (PASS/FAIL итог)
    void colored_line(std::string_view message, Color color);

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыт ли файл вывода (false если путь не задан или fopen не удался)
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    bool open_output_file();
    void close_output_file();
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - выровненная таблица с box-drawing рамкой
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(std::vector<std::string> headers);
    void add_row(std::vector<std::string> cells);

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    enum class Edge { Top, Middle, Bottom };

    std::vector<size_t> column_widths() const;
    std::string format_line(const std::vector<size_t>& widths, Edge edge) const;
    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message);
std::string format_error(std::string_view message);
std::string format_warning(std::string_view message);
std::string format_debug(std::string_view message);

/// Свернуть переводы строк/табуляции в пробелы и обрезать до limit символов
/// (с "..." в конце). limit == 0 - без обрезки.
std::string format_field(std::string_view field, size_t limit);

/// Ширина строки в символах (UTF-8 continuation bytes не считаются)
size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();
bool supports_color(Stream s);

}  // namespace raven::output

#endif  // RAVEN_OUTPUT_HPP
