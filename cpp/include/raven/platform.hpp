// ==============================================================================
// raven/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Временные файлы (отчёты, SBOM, тестовые фикстуры)
//
// Вся платформенная специфика (_WIN32 / POSIX) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef RAVEN_PLATFORM_HPP
#define RAVEN_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace raven::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки (argv, YAML политики)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Представить path как UTF-8 (отчёты, сообщения об ошибках)
std::string path_to_utf8(const std::filesystem::path& p);

/// Нижний регистр расширения без точки ("EXE" -> "exe", "" если нет)
std::string lower_extension(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл и вернуть его путь
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(std::string_view prefix);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// unix seconds -> "2024-05-01T12:00:00Z"
std::string format_utc_rfc3339(std::int64_t unix_seconds);

}  // namespace raven::platform

#endif  // RAVEN_PLATFORM_HPP
