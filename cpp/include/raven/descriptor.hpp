// ==============================================================================
// raven/descriptor.hpp - Нормализованное описание бинарного контейнера
// ==============================================================================
//
// Назначение:
// - BinaryDescriptor: общий для ELF/PE/Mach-O результат парсинга
// - Секции/сегменты, импорты, сертификаты, подписи, контрольные суммы,
//   флаги усиления защиты, версии, лицензии
//
// Строится один раз на запуск, дальше только читается (в том числе
// параллельно из нескольких проверок и из экстрактора SBOM).
//
// ==============================================================================

#ifndef RAVEN_DESCRIPTOR_HPP
#define RAVEN_DESCRIPTOR_HPP

#include <raven/format.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace raven {

// ----------------------------------------------------------------------------
// Базовые типы
// ----------------------------------------------------------------------------

enum class Endianness { Little, Big };

enum class ImageKind { Executable, SharedLibrary, Object, Other };

const char* image_kind_to_string(ImageKind kind);

/// Полуоткрытый диапазон байт файла [offset, offset + size)
struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t size = 0;

    std::uint64_t end() const { return offset + size; }
    bool empty() const { return size == 0; }
    bool overlaps(const ByteRange& other) const {
        return !empty() && !other.empty() && offset < other.end() && other.offset < end();
    }
    bool contains(std::uint64_t pos) const { return pos >= offset && pos < end(); }
};

// ----------------------------------------------------------------------------
// Секции и сегменты
// ----------------------------------------------------------------------------

struct Section {
    std::string name;
    std::uint64_t offset = 0;        // смещение в файле
    std::uint64_t file_size = 0;     // байт в файле (0 для NOBITS / zerofill)
    std::uint64_t address = 0;       // виртуальный адрес
    std::uint64_t virtual_size = 0;  // размер в памяти
    std::uint64_t flags = 0;         // сырые флаги формата
    bool readable = false;
    bool writable = false;
    bool executable = false;

    ByteRange file_range() const { return {offset, file_size}; }
};

struct Segment {
    std::string name;  // "PT_LOAD", "PT_GNU_STACK", "__TEXT", ...
    std::uint64_t offset = 0;
    std::uint64_t file_size = 0;
    std::uint64_t address = 0;
    std::uint64_t memory_size = 0;
    std::uint64_t flags = 0;
    bool loadable = false;
    bool readable = false;
    bool writable = false;
    bool executable = false;

    ByteRange file_range() const { return {offset, file_size}; }
};

// ----------------------------------------------------------------------------
// Импорты
// ----------------------------------------------------------------------------

struct ImportedLibrary {
    std::string name;

    /// Самое старшее требование версии ("GLIBC_2.34", "1.2.3" для dylib)
    std::string version_hint;

    /// Все требования версий (ELF .gnu.version_r, Mach-O compat/current)
    std::vector<std::string> version_requirements;
};

// ----------------------------------------------------------------------------
// Сертификаты и подписи
// ----------------------------------------------------------------------------

struct Certificate {
    std::vector<std::uint8_t> der;
    std::string subject;
    std::string issuer;
    std::string serial;
    std::int64_t not_before = 0;  // unix seconds
    std::int64_t not_after = 0;   // unix seconds
};

enum class SignatureKind {
    Raw,            // .raven.sig: подпись файла без исключённых диапазонов
    Authenticode,   // PE WIN_CERTIFICATE, PKCS#7 SignedData
    CodeSignature,  // Mach-O LC_CODE_SIGNATURE, CMS над CodeDirectory
    AdHoc           // Mach-O без CMS: подписанта нет
};

const char* signature_kind_to_string(SignatureKind kind);

struct SignatureBlob {
    SignatureKind kind = SignatureKind::Raw;
    std::vector<std::uint8_t> data;

    /// Raw/Authenticode: диапазоны файла, не покрытые подписью
    std::vector<ByteRange> excluded;

    /// CodeSignature: подписанный CodeDirectory
    std::vector<std::uint8_t> signed_content;
};

// ----------------------------------------------------------------------------
// Заявленные контрольные суммы
// ----------------------------------------------------------------------------

enum class ChecksumKind {
    Sha256File,     // .raven.checksum: SHA-256 файла без собственного диапазона
    PeImage,        // IMAGE_OPTIONAL_HEADER.CheckSum
    CodePageHashes  // Mach-O CodeDirectory: хеши страниц кода
};

struct DeclaredChecksum {
    ChecksumKind kind = ChecksumKind::Sha256File;
    std::string name;      // человекочитаемое имя для details
    std::string expected;  // hex (SHA-256) или 8 hex-цифр (PE)
    std::vector<ByteRange> excluded;

    // CodePageHashes
    std::string algorithm;  // "sha1" | "sha256"
    std::uint32_t page_size = 0;
    std::uint64_t code_limit = 0;
    std::vector<std::string> page_hashes;
};

// ----------------------------------------------------------------------------
// Усиление защиты
// ----------------------------------------------------------------------------

struct HardeningFacts {
    bool pie = false;              // PIE / ASLR (DYNAMIC_BASE, MH_PIE)
    bool nx_stack = false;         // неисполняемый стек / NX_COMPAT
    bool stack_protector = false;  // __stack_chk_fail / /GS cookie
    bool relro = false;            // ELF PT_GNU_RELRO
    bool bind_now = false;         // ELF DF_BIND_NOW / DF_1_NOW
    bool cfg = false;              // PE GUARD_CF
    bool high_entropy_va = false;  // PE HIGH_ENTROPY_VA
};

// ----------------------------------------------------------------------------
// Метаданные
// ----------------------------------------------------------------------------

struct VersionField {
    std::string source;  // "manifest.version", "VS_FIXEDFILEINFO.FileVersion", ...
    std::string value;
};

/// Компонент, объявленный в манифесте бинарника (requires=name@version:deps)
struct DeclaredComponent {
    std::string name;
    std::string version;
    std::vector<std::string> depends;
};

// ----------------------------------------------------------------------------
// BinaryDescriptor
// ----------------------------------------------------------------------------

struct BinaryDescriptor {
    format::FormatKind format = format::FormatKind::Unknown;
    std::string format_variant;  // "ELF64", "PE32+", "Mach-O 64"
    std::string architecture;    // "x86_64", "aarch64", "i386", ... или "unknown"
    unsigned bits = 0;           // 32 | 64
    Endianness endianness = Endianness::Little;
    ImageKind image_kind = ImageKind::Other;
    std::uint64_t entry_point = 0;
    std::string interpreter;  // ELF PT_INTERP

    std::vector<Section> sections;
    std::vector<Segment> segments;
    std::vector<ImportedLibrary> imports;

    std::vector<Certificate> certificates;
    std::vector<SignatureBlob> signatures;
    std::vector<DeclaredChecksum> checksums;

    HardeningFacts hardening;

    std::vector<VersionField> versions;
    std::vector<std::string> licenses;
    std::vector<std::string> crypto_identifiers;
    std::vector<DeclaredComponent> declared_components;

    /// Несоответствия заголовка, не мешающие разбору (e_ident version и т.п.)
    std::vector<std::string> header_anomalies;

    std::string content_hash;  // SHA-256 hex всего файла
    std::uint64_t file_size = 0;

    const Section* find_section(const std::string& name) const;
    const Segment* find_segment(const std::string& name) const;
};

}  // namespace raven

#endif  // RAVEN_DESCRIPTOR_HPP
