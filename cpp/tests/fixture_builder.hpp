// ==============================================================================
// fixture_builder.hpp - Синтетические ELF / PE / Mach-O для тестов
// ==============================================================================
//
// Билдеры собирают минимальные, но структурно корректные образы в памяти:
// ровно то, что читают парсеры raven, без реального машинного кода.
// TestKey - ключ Ed25519 и самоподписанный сертификат (OpenSSL).
//
// ==============================================================================

#ifndef RAVEN_TESTS_FIXTURE_BUILDER_HPP
#define RAVEN_TESTS_FIXTURE_BUILDER_HPP

#include <raven/artifact.hpp>
#include <raven/descriptor.hpp>

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace raven::test {

using Bytes = std::vector<std::uint8_t>;

// ----------------------------------------------------------------------------
// Ключи и сертификаты
// ----------------------------------------------------------------------------

struct TestCertificate {
    Bytes der;
    std::string pem;
};

class TestKey {
public:
    /// Новый ключ Ed25519
    /// @throws std::runtime_error если OpenSSL не смог сгенерировать ключ
    TestKey();

    /// PEM "PUBLIC KEY"
    std::string public_pem() const;

    /// Подпись Ed25519 над сообщением
    Bytes sign(const Bytes& message) const;

    /// Самоподписанный сертификат (CA:TRUE) с заданным сроком действия
    TestCertificate self_signed(const std::string& common_name, std::int64_t not_before,
                                std::int64_t not_after) const;

private:
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

std::int64_t unix_now();

// ----------------------------------------------------------------------------
// Образ
// ----------------------------------------------------------------------------

struct Image {
    Bytes bytes;

    /// Слоты .raven.sig / .raven.checksum (ELF)
    std::optional<ByteRange> signature_slot;
    std::optional<ByteRange> checksum_slot;

    /// Смещение CodeDirectory (Mach-O с code_signature)
    std::optional<std::size_t> code_directory;
};

// ----------------------------------------------------------------------------
// ELF64 little-endian
// ----------------------------------------------------------------------------

struct ElfOptions {
    std::uint16_t type = 2;  // ET_EXEC; 3 - ET_DYN с DF_1_PIE
    std::uint16_t machine = 62;
    std::uint64_t entry = 0x401000;
    bool gnu_stack = false;        // PT_GNU_STACK без PF_X
    bool stack_protector = false;  // .symtab с __stack_chk_fail
    std::vector<std::string> needed;
    /// .gnu.version_r: библиотека -> требуемые версии
    std::map<std::string, std::vector<std::string>> version_requirements;
    std::string manifest;  // .raven.meta
    std::string rodata;    // произвольные строки
    Bytes certificate_der;
    bool signature_slot = false;
    bool checksum_slot = false;
};

Image build_elf(const ElfOptions& options);

/// ELF со всеми признаками усиления защиты и манифестом
ElfOptions hardened_elf_options();

/// Подписать (.raven.sig) и вписать контрольную сумму (.raven.checksum).
/// Подпись покрывает файл без обоих слотов, сумма - файл без своего слота.
void seal_elf(Image& image, const TestKey* key);

// ----------------------------------------------------------------------------
// PE32+
// ----------------------------------------------------------------------------

struct PeOptions {
    std::uint16_t dll_characteristics = 0x0160;  // HIGH_ENTROPY_VA | DYNAMIC_BASE | NX_COMPAT
    bool security_cookie = true;
    bool dll = false;
    std::vector<std::string> imports;
    std::string manifest;  // .rmeta
    bool with_checksum = true;
};

Image build_pe(const PeOptions& options);

/// Контрольная сумма образа PE, независимая реализация для тестов
std::uint32_t reference_pe_checksum(const Bytes& bytes, std::size_t checksum_offset);

/// Смещение поля CheckSum в образах build_pe
constexpr std::size_t PE_CHECKSUM_OFFSET = 0x58 + 64;

// ----------------------------------------------------------------------------
// Mach-O 64 little-endian
// ----------------------------------------------------------------------------

struct MachOptions {
    bool pie = true;
    bool stack_protector = true;
    bool allow_stack_execution = false;
    std::vector<std::string> dylibs;
    std::string manifest;            // __TEXT,__raven_meta
    std::string bundle_version;      // __TEXT,__info_plist, CFBundleShortVersionString
    bool code_signature = false;     // ad-hoc подпись с хешами страниц
    std::uint8_t page_shift = 8;
};

Image build_macho(const MachOptions& options);

// ----------------------------------------------------------------------------
// Artifact из памяти
// ----------------------------------------------------------------------------

std::shared_ptr<const Artifact> make_memory_artifact(Bytes bytes,
                                                     const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const Bytes& bytes) const;
    std::filesystem::path write(const std::string& name, const std::string& text) const;

private:
    std::filesystem::path path_;
};

}  // namespace raven::test

#endif  // RAVEN_TESTS_FIXTURE_BUILDER_HPP
