// ==============================================================================
// raven/parser.hpp - Парсеры ELF / PE / Mach-O
// ==============================================================================
//
// Назначение:
// - parse_descriptor(): диспетчеризация по закрытому FormatKind
// - parse_elf / parse_pe / parse_macho: построение BinaryDescriptor
//
// Каждое смещение и размер из файла проверяется против длины файла до
// использования. Выход за границы - MalformedHeader, файл короче
// фиксированного заголовка - UnexpectedEOF. Стоимость пропорциональна
// размеру заголовков и таблиц, а не размеру файла.
//
// ==============================================================================

#ifndef RAVEN_PARSER_HPP
#define RAVEN_PARSER_HPP

#include <raven/descriptor.hpp>
#include <raven/format.hpp>
#include <raven/source.hpp>

#include <string>
#include <string_view>

namespace raven::format {

enum class ParseErrorKind {
    MalformedHeader,    // поле заголовка/таблицы указывает за пределы файла или бессмысленно
    UnexpectedEOF,      // файл закончился раньше фиксированного заголовка
    UnsupportedVariant  // корректный, но неподдерживаемый вариант (fat Mach-O, ROM PE, ...)
};

const char* parse_error_kind_to_string(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::MalformedHeader;
    std::string message;

    /// "MalformedHeader: section header table out of bounds"
    std::string format() const;
};

struct ParseResult {
    bool ok = false;
    BinaryDescriptor descriptor;
    ParseError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать источник парсером для `kind`. Unknown -> UnsupportedVariant.
ParseResult parse_descriptor(FormatKind kind, const io::ByteSource& source);

ParseResult parse_elf(const io::ByteSource& source);
ParseResult parse_pe(const io::ByteSource& source);
ParseResult parse_macho(const io::ByteSource& source);

/// Применить текстовый манифест raven (key=value построчно) к дескриптору.
/// Ключи: version, product_version, license, crypto, requires.
/// Неизвестные ключи и строки без '=' пропускаются.
void apply_manifest(std::string_view text, BinaryDescriptor& descriptor);

}  // namespace raven::format

#endif  // RAVEN_PARSER_HPP
