// ==============================================================================
// raven/crypto.hpp - Криптографические примитивы (OpenSSL)
// ==============================================================================
//
// Назначение:
// - SHA-256 / SHA-1 дайджесты потока файла с исключёнными диапазонами
// - Разбор X.509 (субъект, издатель, срок действия)
// - Проверка цепочки сертификатов на заданный момент времени
// - Проверка подписей: сырая (EVP), Authenticode (PKCS#7), CMS (Mach-O)
// - Контрольная сумма PE (IMAGE_OPTIONAL_HEADER.CheckSum)
//
// Ядро использует эти функции как готовые возможности библиотеки и не
// реализует криптографию самостоятельно. Ни одна функция не бросает
// исключений наружу: ошибки OpenSSL возвращаются в результатах.
//
// ==============================================================================

#ifndef RAVEN_CRYPTO_HPP
#define RAVEN_CRYPTO_HPP

#include <raven/descriptor.hpp>
#include <raven/source.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace raven::crypto {

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct DigestResult {
    bool ok = false;
    std::string hex;    // дайджест в нижнем регистре
    std::string error;  // текст ошибки чтения / OpenSSL

    explicit operator bool() const { return ok; }
};

struct VerifyResult {
    bool ok = false;
    std::string message;  // что проверено или почему не прошло

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Дайджесты
// ----------------------------------------------------------------------------

/// Hex-представление байт
std::string to_hex(const std::uint8_t* data, std::size_t size);
std::string to_hex(const std::vector<std::uint8_t>& data);

/// Дайджест буфера в памяти. algorithm: "sha256" | "sha1"
DigestResult digest_bytes(const std::uint8_t* data, std::size_t size,
                          const std::string& algorithm = "sha256");

/// Дайджест источника целиком, пропуская байты из excluded
DigestResult digest_source(const io::ByteSource& source, const std::string& algorithm = "sha256",
                           const std::vector<ByteRange>& excluded = {});

/// Дайджест диапазона [offset, offset + size) источника
DigestResult digest_range(const io::ByteSource& source, std::uint64_t offset, std::uint64_t size,
                          const std::string& algorithm);

/// Собрать содержимое источника без excluded диапазонов в память
bool collect_without(const io::ByteSource& source, const std::vector<ByteRange>& excluded,
                     std::vector<std::uint8_t>& out);

// ----------------------------------------------------------------------------
// Сертификаты
// ----------------------------------------------------------------------------

/// Разобрать DER X.509. nullopt если это не сертификат.
std::optional<Certificate> describe_certificate(const std::vector<std::uint8_t>& der);

/// Все сертификаты PEM-текста (якоря доверия из политики)
std::vector<Certificate> certificates_from_pem(const std::string& pem);

/// Сертификаты из PKCS#7 SignedData (Authenticode)
std::vector<Certificate> certificates_from_pkcs7(const std::vector<std::uint8_t>& der);

/// Сертификаты из CMS SignedData (Mach-O code signature)
std::vector<Certificate> certificates_from_cms(const std::vector<std::uint8_t>& der);

/// Проверить цепочку: chain[0] - конечный сертификат, остальные - промежуточные.
/// Проверка выполняется на момент at_time (unix seconds).
VerifyResult verify_chain(const std::vector<Certificate>& chain,
                          const std::vector<std::string>& trust_anchor_pems, std::int64_t at_time);

// ----------------------------------------------------------------------------
// Подписи
// ----------------------------------------------------------------------------

/// Сырая подпись над содержимым источника без excluded диапазонов.
/// Ключи: PEM открытых ключей и/или сертификатов; подходит любой.
/// Ed25519/Ed448 проверяются в один проход, остальные ключи - SHA-256.
VerifyResult verify_raw_signature(const std::vector<std::uint8_t>& signature,
                                  const io::ByteSource& source,
                                  const std::vector<ByteRange>& excluded,
                                  const std::vector<std::string>& trusted_key_pems);

/// Authenticode: PKCS#7 SignedData с SpcIndirectDataContent.
/// Проверяет подпись над содержимым, цепочку до якорей и дайджест образа.
VerifyResult verify_authenticode(const std::vector<std::uint8_t>& pkcs7_der,
                                 const io::ByteSource& source,
                                 const std::vector<ByteRange>& excluded,
                                 const std::vector<std::string>& trust_anchor_pems,
                                 std::int64_t at_time);

/// Отсоединённая CMS-подпись над content (CodeDirectory Mach-O)
VerifyResult verify_cms_detached(const std::vector<std::uint8_t>& cms_der,
                                 const std::vector<std::uint8_t>& content,
                                 const std::vector<std::string>& trust_anchor_pems,
                                 std::int64_t at_time);

// ----------------------------------------------------------------------------
// PE
// ----------------------------------------------------------------------------

/// Контрольная сумма образа PE; поле CheckSum (4 байта по checksum_offset)
/// считается нулевым. nullopt при ошибке чтения.
std::optional<std::uint32_t> pe_image_checksum(const io::ByteSource& source,
                                               std::uint64_t checksum_offset);

}  // namespace raven::crypto

#endif  // RAVEN_CRYPTO_HPP
