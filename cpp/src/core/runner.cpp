// ==============================================================================
// runner.cpp - Исполнение проверок на пуле потоков
// ==============================================================================
//
// Пул фиксированного размера: N-1 потоков std::thread плюс вызывающий поток.
// Задачи забираются атомарным счётчиком следующего индекса; результат
// кладётся в ячейку slots[index]. Перед каждым захватом поток смотрит на
// отмену и дедлайн.
//
// ==============================================================================

#include <raven/platform.hpp>
#include <raven/runner.hpp>

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

namespace raven::check {

namespace {

using Clock = std::chrono::steady_clock;

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

CheckRunner::CheckRunner(const CheckRegistry& registry, const policy::Policy& policy)
    : registry_(registry), policy_(policy) {}

std::size_t CheckRunner::worker_count(const RunOptions& options) const {
    std::size_t threads = options.threads;
    if (threads == 0) {
        threads = policy_.threads;
    }
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
    }
    if (threads == 0) {
        threads = 1;
    }
    return std::max<std::size_t>(1, std::min(threads, registry_.size()));
}

RunResult CheckRunner::run_all(const std::filesystem::path& path,
                               const RunOptions& options) const {
    RunResult result;
    auto loaded = load_artifact(path);
    if (!loaded) {
        result.error = loaded.error;
        return result;
    }
    result.report = run(*loaded.artifact, options);
    result.ok = true;
    return result;
}

ComplianceReport CheckRunner::run(const Artifact& artifact, const RunOptions& options) const {
    const auto started = Clock::now();

    ComplianceReport report;
    report.timestamp_unix = unix_now();
    report.timestamp = platform::format_utc_rfc3339(report.timestamp_unix);
    report.binary_path = artifact.path_utf8;
    report.binary_hash = artifact.content_hash;
    report.format = format::format_kind_to_string(artifact.detected);
    report.format_error = artifact.format_error;

    std::optional<Clock::time_point> deadline = options.deadline;
    if (!deadline && policy_.timeout.count() > 0) {
        // Насыщение: started + timeout не должен переполнить steady_clock
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - started);
        deadline = policy_.timeout >= headroom
                       ? Clock::time_point::max()
                       : started + std::chrono::duration_cast<Clock::duration>(policy_.timeout);
    }

    const CheckContext ctx{artifact.descriptor_ptr(),
                           artifact.format_error,
                           *artifact.source,
                           artifact.content_hash,
                           policy_,
                           options.evaluation_time.value_or(report.timestamp_unix),
                           artifact.path_utf8,
                           artifact.detected};

    const std::size_t count = registry_.size();
    std::vector<std::optional<CheckResult>> slots(count);
    std::atomic<std::size_t> next{0};

    auto stop_requested = [&]() {
        if (options.cancellation != nullptr && options.cancellation->cancelled()) {
            return true;
        }
        return deadline && Clock::now() >= *deadline;
    };

    auto worker = [&]() {
        for (;;) {
            if (stop_requested()) {
                return;
            }
            const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                return;
            }
            slots[index] = execute_one(registry_.at(index), ctx);
        }
    };

    const std::size_t workers = worker_count(options);
    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    for (std::size_t i = 1; i < workers; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error&) {
            // Поток не создался: оставшуюся работу доделают уже запущенные
            break;
        }
    }
    worker();
    for (auto& t : threads) {
        t.join();
    }

    for (auto& slot : slots) {
        if (!slot) {
            report.partial = true;
            continue;
        }
        if (slot->passed()) {
            ++report.passed_checks;
        } else {
            ++report.failed_checks;
        }
        report.results.push_back(std::move(*slot));
    }
    report.total_checks = report.results.size();
    report.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started);
    return report;
}

CheckResult CheckRunner::execute_one(const ComplianceCheck& check, const CheckContext& ctx) const {
    CheckResult result;
    result.status = CheckStatus::Fail;

    // Любой вызов кода проверки, включая id() и description(), только под try
    const auto started = Clock::now();
    try {
        result.id = check.id();
        result.description = check.description();
        if (check.requires_descriptor() && ctx.descriptor == nullptr) {
            result.details = UNSUPPORTED_FORMAT_DETAILS;
            if (!ctx.format_error.empty()) {
                result.details += ": " + ctx.format_error;
            }
        } else {
            CheckOutcome outcome = check.execute(ctx);
            result.status = outcome.status;
            result.details = std::move(outcome.details);
            result.metadata = std::move(outcome.metadata);
        }
    } catch (const std::exception& e) {
        result.status = CheckStatus::Fail;
        result.details = std::string("check raised an exception: ") + e.what();
    } catch (...) {
        result.status = CheckStatus::Fail;
        result.details = "check raised an unknown exception";
    }
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started);
    return result;
}

}  // namespace raven::check
