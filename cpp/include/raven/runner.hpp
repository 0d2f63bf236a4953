// ==============================================================================
// raven/runner.hpp - Исполнитель проверок и отчёт соответствия
// ==============================================================================
//
// Назначение:
// - CheckRunner: открыть бинарник, посчитать хеш и разобрать формат один раз,
//   выполнить все проверки реестра на пуле потоков фиксированного размера
// - ComplianceReport: итог запуска в порядке регистрации проверок
// - Отмена (CancellationToken) и дедлайн: уже запущенные проверки
//   дорабатывают, новые не стартуют, отчёт помечается partial
//
// Каждый рабочий поток пишет только в свою ячейку результата (по индексу
// проверки), поэтому порядок результатов не зависит от планирования.
//
// ==============================================================================

#ifndef RAVEN_RUNNER_HPP
#define RAVEN_RUNNER_HPP

#include <raven/artifact.hpp>
#include <raven/check.hpp>
#include <raven/policy.hpp>
#include <raven/registry.hpp>
#include <raven/source.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace raven::check {

// ----------------------------------------------------------------------------
// Отмена
// ----------------------------------------------------------------------------

class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct RunOptions {
    /// Число рабочих потоков; 0 - из политики, затем по числу ядер
    std::size_t threads = 0;

    /// Момент, после которого новые проверки не запускаются.
    /// Если не задан, берётся policy.timeout (когда он ненулевой).
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// Внешняя отмена (может быть nullptr)
    const CancellationToken* cancellation = nullptr;

    /// Момент оценки сертификатов, unix seconds (по умолчанию - сейчас)
    std::optional<std::int64_t> evaluation_time;
};

// ----------------------------------------------------------------------------
// Отчёт
// ----------------------------------------------------------------------------

struct ComplianceReport {
    std::string timestamp;           // RFC 3339, UTC
    std::int64_t timestamp_unix = 0;

    std::string binary_path;
    std::string binary_hash;  // SHA-256 hex

    /// Что нашёл детектор и почему нет дескриптора (для текстового вывода)
    std::string format;
    std::string format_error;

    std::size_t total_checks = 0;
    std::size_t passed_checks = 0;
    std::size_t failed_checks = 0;

    /// В порядке регистрации; при partial - только выполненные проверки
    std::vector<CheckResult> results;

    std::chrono::nanoseconds duration{0};

    /// Запуск прерван отменой или дедлайном
    bool partial = false;

    std::optional<std::string> sbom_path;

    bool overall_pass() const { return failed_checks == 0 && !partial; }
};

struct RunResult {
    bool ok = false;
    ComplianceReport report;
    io::SourceError error;  // только при !ok: путь не открылся

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// CheckRunner
// ----------------------------------------------------------------------------

class CheckRunner {
public:
    /// Реестр и политика должны пережить исполнителя
    CheckRunner(const CheckRegistry& registry, const policy::Policy& policy);

    /// Полный запуск по пути. Ошибка только если файл не открылся.
    RunResult run_all(const std::filesystem::path& path, const RunOptions& options = {}) const;

    /// Запуск над уже загруженным бинарником (его разделяет экстрактор SBOM)
    ComplianceReport run(const Artifact& artifact, const RunOptions& options = {}) const;

    /// Итоговое число рабочих потоков для данного запуска
    std::size_t worker_count(const RunOptions& options) const;

private:
    CheckResult execute_one(const ComplianceCheck& check, const CheckContext& ctx) const;

    const CheckRegistry& registry_;
    const policy::Policy& policy_;
};

}  // namespace raven::check

#endif  // RAVEN_RUNNER_HPP
