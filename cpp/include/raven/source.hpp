// ==============================================================================
// raven/source.hpp - Источник байтов (файл или память)
// ==============================================================================
//
// Назначение:
// - Единый seekable-интерфейс чтения для парсеров и проверок
// - Безопасное конкурентное чтение одного файла несколькими проверками
// - Ошибки открытия: FileNotFound / PermissionDenied / IoError
//
// Использование:
// @code
//   auto opened = ByteSource::open(path);
//   if (!opened) {
//       writer.error(opened.error.format());
//       return 2;
//   }
//   std::vector<std::uint8_t> head;
//   opened.source->read(0, 64, head);
// @endcode
//
// ==============================================================================

#ifndef RAVEN_SOURCE_HPP
#define RAVEN_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace raven::io {

// ----------------------------------------------------------------------------
// SourceError
// ----------------------------------------------------------------------------

enum class SourceErrorKind {
    FileNotFound,      // путь не существует или это не обычный файл
    PermissionDenied,  // нет прав на чтение
    IoError            // ошибка чтения
};

const char* source_error_kind_to_string(SourceErrorKind kind);

struct SourceError {
    SourceErrorKind kind = SourceErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to open binary '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// ByteSource
// ----------------------------------------------------------------------------

struct OpenResult;

class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Открыть файл. Проверяет существование и права.
    static OpenResult open(const std::filesystem::path& path);

    /// Размер источника в байтах
    virtual std::uint64_t size() const = 0;

    /// Прочитать до `length` байт с `offset` в `out`.
    /// @return false если диапазон выходит за размер источника (out не меняется)
    ///         или произошла ошибка чтения
    virtual bool read(std::uint64_t offset, std::size_t length,
                      std::vector<std::uint8_t>& out) const = 0;

    /// Последовательно отдать весь источник блоками (хеширование, поиск строк).
    /// Остановиться, если visitor вернул false.
    /// @return false при ошибке чтения
    bool for_each_chunk(
        const std::function<bool(std::uint64_t offset, const std::uint8_t* data, std::size_t len)>&
            visitor,
        std::size_t chunk_size = 64 * 1024) const;

    /// Прочитать источник целиком (только для небольших файлов и тестов)
    bool read_all(std::vector<std::uint8_t>& out) const;

protected:
    ByteSource() = default;
};

struct OpenResult {
    bool ok = false;
    std::shared_ptr<const ByteSource> source;
    SourceError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Реализации
// ----------------------------------------------------------------------------

/// Файл на диске. Чтения сериализуются мьютексом.
class FileSource final : public ByteSource {
public:
    FileSource(std::ifstream stream, std::uint64_t size);

    std::uint64_t size() const override { return size_; }
    bool read(std::uint64_t offset, std::size_t length,
              std::vector<std::uint8_t>& out) const override;

private:
    mutable std::mutex mutex_;
    mutable std::ifstream stream_;
    std::uint64_t size_ = 0;
};

/// Буфер в памяти (тесты, вложенные блобы)
class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    std::uint64_t size() const override { return data_.size(); }
    bool read(std::uint64_t offset, std::size_t length,
              std::vector<std::uint8_t>& out) const override;

    const std::vector<std::uint8_t>& data() const { return data_; }

private:
    std::vector<std::uint8_t> data_;
};

}  // namespace raven::io

#endif  // RAVEN_SOURCE_HPP
