// ==============================================================================
// raven/report.hpp - Представление отчёта соответствия
// ==============================================================================
//
// JSON (RapidJSON):
//   {timestamp, binary_path, binary_hash, total_checks, passed_checks,
//    failed_checks, partial, results:[{check_id, description, status,
//    details, metadata?, duration}], duration, sbom_path?}
//   Длительности в наносекундах.
//
// Текст: заголовок, таблица проверок, детали упавших проверок, итог.
//
// ==============================================================================

#ifndef RAVEN_REPORT_HPP
#define RAVEN_REPORT_HPP

#include <raven/runner.hpp>

#include <rapidjson/document.h>

#include <string>

namespace raven::report {

/// Ширина столбца details в таблице
constexpr std::size_t DETAILS_COLUMN_WIDTH = 50;

/// Заполнить doc объектом отчёта
/// @throws std::runtime_error если метаданные содержат NaN/Inf
void to_rapidjson(const check::ComplianceReport& report, rapidjson::Document& doc);

/// JSON-документ отчёта
std::string to_json(const check::ComplianceReport& report, bool pretty = true);

/// Человекочитаемое представление
std::string to_text(const check::ComplianceReport& report);

/// "1.234ms", "12.5s" - для таблицы
std::string format_duration(std::chrono::nanoseconds duration);

}  // namespace raven::report

#endif  // RAVEN_REPORT_HPP
