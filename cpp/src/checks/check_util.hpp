// ==============================================================================
// check_util.hpp - Общие помощники проверок (внутренний заголовок)
// ==============================================================================

#ifndef RAVEN_CHECKS_CHECK_UTIL_HPP
#define RAVEN_CHECKS_CHECK_UTIL_HPP

#include <raven/source.hpp>
#include <raven/value.hpp>

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raven::check::detail {

/// Минимальная длина строки при поиске печатаемых строк
constexpr std::size_t MIN_STRING_LENGTH = 4;

/// Потоково перебрать печатаемые ASCII-строки источника (как strings(1)).
/// Строки длиннее max_length режутся. Visitor, вернувший false, останавливает обход.
/// @return false при ошибке чтения
bool scan_strings(const io::ByteSource& source,
                  const std::function<bool(std::string_view)>& visitor,
                  std::size_t min_length = MIN_STRING_LENGTH, std::size_t max_length = 4096);

using SemVer = std::array<unsigned long, 3>;

/// "1.2.3", "v1.2.3", "1.2.3.4", "1.2.3-rc1" -> {1,2,3}; "123" / "1.2" -> nullopt
std::optional<SemVer> parse_semver(std::string_view text);

std::string semver_to_string(const SemVer& v);

/// Значения через разделитель
std::string join(const std::vector<std::string>& items, std::string_view sep);

/// unix seconds -> RFC 3339, для метаданных сертификатов
Value time_value(std::int64_t unix_seconds);

// ----------------------------------------------------------------------------
// SPDX
// ----------------------------------------------------------------------------

struct SpdxParse {
    bool ok = false;
    std::vector<std::string> identifiers;  // лицензии и исключения (WITH) по порядку
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать SPDX license expression: id, "(...)", AND, OR, WITH
SpdxParse parse_spdx_expression(std::string_view expression);

}  // namespace raven::check::detail

#endif  // RAVEN_CHECKS_CHECK_UTIL_HPP
