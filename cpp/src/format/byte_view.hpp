// ==============================================================================
// byte_view.hpp - Внутренние примитивы парсеров (не публичный заголовок)
// ==============================================================================
//
// ByteView - окно на прочитанный блок с проверкой границ на каждом чтении.
// ParseFailure - внутреннее исключение парсеров; на границе parse_*()
// превращается в ParseResult.
//
// ==============================================================================

#ifndef RAVEN_FORMAT_BYTE_VIEW_HPP
#define RAVEN_FORMAT_BYTE_VIEW_HPP

#include <raven/parser.hpp>
#include <raven/source.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace raven::format::detail {

class ParseFailure : public std::runtime_error {
public:
    ParseFailure(ParseErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

[[noreturn]] inline void malformed(const std::string& message) {
    throw ParseFailure(ParseErrorKind::MalformedHeader, message);
}

/// Прочитать блок файла; диапазон за пределами файла - MalformedHeader
inline std::vector<std::uint8_t> read_block(const io::ByteSource& source, std::uint64_t offset,
                                            std::uint64_t size, const char* what) {
    const std::uint64_t total = source.size();
    if (offset > total || size > total - offset) {
        malformed(std::string(what) + " out of bounds (offset " + std::to_string(offset) +
                  ", size " + std::to_string(size) + ", file " + std::to_string(total) + ")");
    }
    std::vector<std::uint8_t> out;
    if (!source.read(offset, static_cast<std::size_t>(size), out)) {
        malformed(std::string("failed to read ") + what);
    }
    return out;
}

/// Окно над блоком байт с порядком байт формата
class ByteView {
public:
    ByteView(const std::uint8_t* data, std::size_t size, bool big_endian = false)
        : data_(data), size_(size), big_endian_(big_endian) {}

    explicit ByteView(const std::vector<std::uint8_t>& block, bool big_endian = false)
        : ByteView(block.data(), block.size(), big_endian) {}

    std::size_t size() const { return size_; }
    const std::uint8_t* data() const { return data_; }
    bool big_endian() const { return big_endian_; }

    void require(std::uint64_t offset, std::uint64_t len, const char* what) const {
        if (offset > size_ || len > size_ - offset) {
            malformed(std::string(what) + " exceeds its table (offset " +
                      std::to_string(offset) + ", length " + std::to_string(len) + ")");
        }
    }

    std::uint8_t u8(std::uint64_t off) const {
        require(off, 1, "field");
        return data_[off];
    }

    std::uint16_t u16(std::uint64_t off) const {
        require(off, 2, "field");
        const std::uint8_t* p = data_ + off;
        return big_endian_ ? static_cast<std::uint16_t>((p[0] << 8) | p[1])
                           : static_cast<std::uint16_t>(p[0] | (p[1] << 8));
    }

    std::uint32_t u32(std::uint64_t off) const {
        require(off, 4, "field");
        const std::uint8_t* p = data_ + off;
        if (big_endian_) {
            return (static_cast<std::uint32_t>(p[0]) << 24) |
                   (static_cast<std::uint32_t>(p[1]) << 16) |
                   (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
        }
        return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
               (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    }

    std::uint64_t u64(std::uint64_t off) const {
        const std::uint64_t a = u32(off);
        const std::uint64_t b = u32(off + 4);
        return big_endian_ ? ((a << 32) | b) : ((b << 32) | a);
    }

    /// Слово 32 или 64 бит в зависимости от класса файла
    std::uint64_t word(std::uint64_t off, bool is64) const { return is64 ? u64(off) : u32(off); }

    /// C-строка начиная с off, не длиннее max_len; без NUL в пределах окна -
    /// обрезается по границе окна
    std::string cstr(std::uint64_t off, std::size_t max_len = 4096) const {
        require(off, 0, "string");
        std::string out;
        for (std::uint64_t i = off; i < size_ && out.size() < max_len; ++i) {
            if (data_[i] == 0) {
                break;
            }
            out.push_back(static_cast<char>(data_[i]));
        }
        return out;
    }

    /// Строка фиксированной длины (имена секций PE/Mach-O), до первого NUL
    std::string fixed_str(std::uint64_t off, std::size_t len) const {
        require(off, len, "name");
        std::string out;
        for (std::size_t i = 0; i < len && data_[off + i] != 0; ++i) {
            out.push_back(static_cast<char>(data_[off + i]));
        }
        return out;
    }

    ByteView sub(std::uint64_t off, std::uint64_t len) const {
        require(off, len, "block");
        return ByteView(data_ + off, static_cast<std::size_t>(len), big_endian_);
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    bool big_endian_;
};

/// Распарсить "1.2.3"-подобное требование версии для сравнения (GLIBC_2.34 -> {2,34})
std::vector<unsigned long> version_key(const std::string& version);

/// Выбрать наибольшее требование версии
std::string highest_version(const std::vector<std::string>& versions);

/// Разрезать конкатенацию DER SEQUENCE (цепочка сертификатов) на элементы.
/// Хвост, не являющийся полным SEQUENCE, отбрасывается.
std::vector<std::vector<std::uint8_t>> split_der_sequences(const std::vector<std::uint8_t>& blob);

}  // namespace raven::format::detail

#endif  // RAVEN_FORMAT_BYTE_VIEW_HPP
