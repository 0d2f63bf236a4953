// ==============================================================================
// artifact.cpp - Загрузка бинарника: хеш, детектор, парсер
// ==============================================================================

#include <raven/artifact.hpp>
#include <raven/crypto.hpp>
#include <raven/platform.hpp>

namespace raven {

LoadResult load_artifact(const std::filesystem::path& path) {
    auto opened = io::ByteSource::open(path);
    if (!opened) {
        LoadResult result;
        result.error = opened.error;
        return result;
    }
    return make_artifact(std::move(opened.source), path);
}

LoadResult make_artifact(std::shared_ptr<const io::ByteSource> source,
                         const std::filesystem::path& path) {
    LoadResult result;
    auto artifact = std::make_shared<Artifact>();
    artifact->path = path;
    artifact->path_utf8 = platform::path_to_utf8(path);
    artifact->file_size = source->size();

    const auto hash = crypto::digest_source(*source, "sha256");
    if (!hash) {
        result.error.kind = io::SourceErrorKind::IoError;
        result.error.path = artifact->path_utf8;
        result.error.message = hash.error;
        return result;
    }
    artifact->content_hash = hash.hex;

    const auto detected = format::detect_format(*source);
    if (!detected) {
        artifact->format_error = "Truncated: " + detected.message;
    } else {
        artifact->detected = detected.kind;
        if (detected.kind == format::FormatKind::Unknown) {
            artifact->format_error = "unrecognized container signature";
        } else {
            auto parsed = format::parse_descriptor(detected.kind, *source);
            if (parsed) {
                parsed.descriptor.content_hash = artifact->content_hash;
                parsed.descriptor.file_size = artifact->file_size;
                artifact->descriptor = std::move(parsed.descriptor);
            } else {
                artifact->format_error = parsed.error.format();
            }
        }
    }

    artifact->source = std::move(source);
    result.ok = true;
    result.artifact = std::move(artifact);
    return result;
}

}  // namespace raven
