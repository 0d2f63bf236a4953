// ==============================================================================
// raven/format.hpp - Определение формата исполняемого контейнера
// ==============================================================================
//
// Назначение:
// - FormatKind: закрытый набор {Elf, Pe, MachO, Unknown}
// - detect_format(): классификация по сигнатуре в заголовке
//
// Классификация читает только заголовок (не более DETECT_WINDOW байт, плюс
// 4 байта "PE\0\0" по e_lfanew если они доступны). Нераспознанное содержимое -
// это Unknown, а не ошибка. Ошибка только Truncated: меньше 4 байт.
//
// ==============================================================================

#ifndef RAVEN_FORMAT_HPP
#define RAVEN_FORMAT_HPP

#include <raven/source.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace raven::format {

enum class FormatKind { Elf, Pe, MachO, Unknown };

/// "ELF", "PE", "MachO", "Unknown"
const char* format_kind_to_string(FormatKind kind);

/// Обратное преобразование (регистр не важен, "macho"/"mach-o" допустимы)
std::optional<FormatKind> parse_format_kind(std::string_view name);

/// Формат, который подразумевает расширение файла (exe/dll/sys, so, dylib)
std::optional<FormatKind> format_from_extension(std::string_view ext_lower);

/// Минимальная длина сигнатуры
constexpr std::size_t MIN_SIGNATURE_LENGTH = 4;

/// Сколько байт заголовка достаточно для классификации
constexpr std::size_t DETECT_WINDOW = 64;

enum class DetectErrorKind { Truncated };

struct DetectResult {
    bool ok = false;
    FormatKind kind = FormatKind::Unknown;
    DetectErrorKind error = DetectErrorKind::Truncated;
    std::string message;

    explicit operator bool() const { return ok; }
};

/// Классифицировать по первым байтам. Чистая функция.
DetectResult detect_format(const std::uint8_t* data, std::size_t size);

/// Классифицировать источник: читает окно заголовка и, для MZ, сигнатуру PE
DetectResult detect_format(const io::ByteSource& source);

}  // namespace raven::format

#endif  // RAVEN_FORMAT_HPP
