// ==============================================================================
// source.cpp - Источник байтов (файл или память)
// ==============================================================================

#include <raven/platform.hpp>
#include <raven/source.hpp>

#include <algorithm>
#include <system_error>

namespace raven::io {

// ----------------------------------------------------------------------------
// SourceError
// ----------------------------------------------------------------------------

const char* source_error_kind_to_string(SourceErrorKind kind) {
    switch (kind) {
    case SourceErrorKind::FileNotFound:
        return "BinaryNotFound";
    case SourceErrorKind::PermissionDenied:
        return "PermissionDenied";
    case SourceErrorKind::IoError:
    default:
        return "IoError";
    }
}

std::string SourceError::format() const {
    return "failed to open binary '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// ByteSource::open
// ----------------------------------------------------------------------------

OpenResult ByteSource::open(const std::filesystem::path& path) {
    OpenResult result;
    result.error.path = platform::path_to_utf8(path);

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        result.error.kind = SourceErrorKind::FileNotFound;
        result.error.message = "no such file";
        return result;
    }
    if (!std::filesystem::is_regular_file(status)) {
        result.error.kind = SourceErrorKind::FileNotFound;
        result.error.message = "not a regular file";
        return result;
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.error.kind = SourceErrorKind::IoError;
        result.error.message = ec.message();
        return result;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        // Файл существует, но не открывается - почти всегда права
        result.error.kind = SourceErrorKind::PermissionDenied;
        result.error.message = "permission denied";
        return result;
    }

    result.ok = true;
    result.source = std::make_shared<FileSource>(std::move(stream), size);
    return result;
}

bool ByteSource::for_each_chunk(
    const std::function<bool(std::uint64_t, const std::uint8_t*, std::size_t)>& visitor,
    std::size_t chunk_size) const {
    std::vector<std::uint8_t> buffer;
    const std::uint64_t total = size();
    std::uint64_t offset = 0;
    while (offset < total) {
        std::size_t len = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size, total - offset));
        if (!read(offset, len, buffer)) {
            return false;
        }
        if (!visitor(offset, buffer.data(), buffer.size())) {
            return true;
        }
        offset += len;
    }
    return true;
}

bool ByteSource::read_all(std::vector<std::uint8_t>& out) const {
    return read(0, static_cast<std::size_t>(size()), out);
}

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

FileSource::FileSource(std::ifstream stream, std::uint64_t size)
    : stream_(std::move(stream)), size_(size) {}

bool FileSource::read(std::uint64_t offset, std::size_t length,
                      std::vector<std::uint8_t>& out) const {
    if (offset > size_ || length > size_ - offset) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint8_t> buffer(length);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (length > 0) {
        stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(stream_.gcount()) != length) {
            return false;
        }
    }
    out = std::move(buffer);
    return true;
}

// ----------------------------------------------------------------------------
// MemorySource
// ----------------------------------------------------------------------------

bool MemorySource::read(std::uint64_t offset, std::size_t length,
                        std::vector<std::uint8_t>& out) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        return false;
    }
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    out.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
    return true;
}

}  // namespace raven::io
