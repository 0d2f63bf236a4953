// ==============================================================================
// raven/artifact.hpp - Открытый и разобранный бинарник
// ==============================================================================
//
// Назначение:
// - Открыть путь (единственное фатальное место: BinaryNotFound /
//   PermissionDenied / IoError)
// - Посчитать хеш содержимого один раз
// - Определить формат и разобрать дескриптор один раз
//
// Artifact неизменяем после создания и разделяется (shared_ptr<const>)
// между исполнителем проверок и экстрактором SBOM.
//
// ==============================================================================

#ifndef RAVEN_ARTIFACT_HPP
#define RAVEN_ARTIFACT_HPP

#include <raven/descriptor.hpp>
#include <raven/format.hpp>
#include <raven/parser.hpp>
#include <raven/source.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace raven {

struct Artifact {
    std::filesystem::path path;
    std::string path_utf8;
    std::shared_ptr<const io::ByteSource> source;

    std::string content_hash;  // SHA-256 hex
    std::uint64_t file_size = 0;

    /// Результат детектора (Unknown при Truncated)
    format::FormatKind detected = format::FormatKind::Unknown;

    /// Разобранный дескриптор; nullopt если формат неизвестен или разбор не удался
    std::optional<BinaryDescriptor> descriptor;

    /// Почему дескриптора нет (пусто, если он есть)
    std::string format_error;

    /// Дескриптор или nullptr
    const BinaryDescriptor* descriptor_ptr() const {
        return descriptor ? &*descriptor : nullptr;
    }
};

struct LoadResult {
    bool ok = false;
    std::shared_ptr<const Artifact> artifact;
    io::SourceError error;

    explicit operator bool() const { return ok; }
};

/// Открыть файл и построить Artifact
LoadResult load_artifact(const std::filesystem::path& path);

/// Построить Artifact из готового источника (память, тесты)
LoadResult make_artifact(std::shared_ptr<const io::ByteSource> source,
                         const std::filesystem::path& path);

}  // namespace raven

#endif  // RAVEN_ARTIFACT_HPP
