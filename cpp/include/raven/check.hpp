// ==============================================================================
// raven/check.hpp - Интерфейс проверки соответствия
// ==============================================================================
//
// Назначение:
// - ComplianceCheck: идентификатор, описание, execute(CheckContext)
// - CheckContext: всё, что проверке разрешено видеть (только чтение)
// - CheckOutcome / CheckResult: pass|fail, детали, метаданные, длительность
//
// Проверки чистые: не ходят в сеть, не меняют входные данные и не зависят
// от результатов и порядка других проверок. Исключение из execute()
// исполнитель превращает в проваленный результат.
//
// ==============================================================================

#ifndef RAVEN_CHECK_HPP
#define RAVEN_CHECK_HPP

#include <raven/descriptor.hpp>
#include <raven/format.hpp>
#include <raven/policy.hpp>
#include <raven/source.hpp>
#include <raven/value.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace raven::check {

// ----------------------------------------------------------------------------
// Статус
// ----------------------------------------------------------------------------

/// Закрытый двузначный исход
enum class CheckStatus { Pass, Fail };

/// "pass" | "fail"
const char* check_status_to_string(CheckStatus status);

/// Текст для проверок, которым нужен дескриптор, а его нет
constexpr const char* UNSUPPORTED_FORMAT_DETAILS = "unsupported or malformed binary format";

// ----------------------------------------------------------------------------
// Контекст и результат
// ----------------------------------------------------------------------------

struct CheckContext {
    /// Разобранный дескриптор или nullptr (формат неизвестен / разбор не удался)
    const BinaryDescriptor* descriptor = nullptr;

    /// Почему дескриптора нет
    std::string format_error;

    const io::ByteSource& source;
    const std::string& content_hash;
    const policy::Policy& policy;

    /// Момент оценки (проверка срока действия сертификатов), unix seconds
    std::int64_t evaluation_time = 0;

    /// Путь к бинарнику в UTF-8 (проверка расширения)
    std::string path;
    /// Что нашёл детектор (Unknown и при Truncated)
    format::FormatKind detected = format::FormatKind::Unknown;
};

/// То, что возвращает сама проверка
struct CheckOutcome {
    CheckStatus status = CheckStatus::Fail;
    std::string details;
    Value metadata;  // Null если метаданных нет

    static CheckOutcome pass(std::string details, Value metadata = Value()) {
        return CheckOutcome{CheckStatus::Pass, std::move(details), std::move(metadata)};
    }

    static CheckOutcome fail(std::string details, Value metadata = Value()) {
        return CheckOutcome{CheckStatus::Fail, std::move(details), std::move(metadata)};
    }
};

/// Результат в отчёте: исход + идентичность проверки + длительность
struct CheckResult {
    std::string id;
    std::string description;
    CheckStatus status = CheckStatus::Fail;
    std::string details;
    Value metadata;
    std::chrono::nanoseconds duration{0};

    bool passed() const { return status == CheckStatus::Pass; }
};

// ----------------------------------------------------------------------------
// ComplianceCheck
// ----------------------------------------------------------------------------

class ComplianceCheck {
public:
    virtual ~ComplianceCheck() = default;

    /// Стабильный идентификатор ("file-signature")
    virtual std::string id() const = 0;

    virtual std::string description() const = 0;

    /// Нужен ли разобранный дескриптор. Если да, а дескриптора нет,
    /// исполнитель не вызывает execute() и пишет UNSUPPORTED_FORMAT_DETAILS.
    virtual bool requires_descriptor() const { return true; }

    virtual CheckOutcome execute(const CheckContext& ctx) const = 0;
};

}  // namespace raven::check

#endif  // RAVEN_CHECK_HPP
