// ==============================================================================
// raven/checks.hpp - Встроенные проверки соответствия
// ==============================================================================
//
// Структура бинарника:
//   file-signature, binary-metadata, dependency-analysis, binary-format
// Криптография:
//   certificate-validation, signature-verification, hash-integrity,
//   encryption-standard
// Безопасность и метаданные:
//   security-flags, version-information, license-compliance
//
// ==============================================================================

#ifndef RAVEN_CHECKS_HPP
#define RAVEN_CHECKS_HPP

#include <raven/check.hpp>

namespace raven::check {

// ----------------------------------------------------------------------------
// Структура бинарника
// ----------------------------------------------------------------------------

/// Сигнатура распознана, заголовок цел, расширение и ожидаемый формат совпадают.
/// Работает и без дескриптора: сама сообщает, почему разбор не удался.
class FileSignatureCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "file-signature"; }
    std::string description() const override {
        return "Binary signature identifies a supported executable format";
    }
    bool requires_descriptor() const override { return false; }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class BinaryMetadataCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "binary-metadata"; }
    std::string description() const override {
        return "Architecture, entry point and code section are present";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class DependencyAnalysisCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "dependency-analysis"; }
    std::string description() const override {
        return "Imported libraries are allowed and carry version requirements";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

/// Секции и сегменты лежат внутри файла и не перекрываются
class BinaryFormatCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "binary-format"; }
    std::string description() const override {
        return "Sections and segments are within file bounds and do not overlap";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

// ----------------------------------------------------------------------------
// Криптография
// ----------------------------------------------------------------------------

class CertificateValidationCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "certificate-validation"; }
    std::string description() const override {
        return "Embedded certificate chain verifies against trust anchors";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class SignatureVerificationCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "signature-verification"; }
    std::string description() const override {
        return "Embedded signature verifies over the signed content";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

/// Без дескриптора: для нераспознанного содержимого сообщает хеш файла,
/// для распознанного, но битого формата - провал (суммы не прочитать)
class HashIntegrityCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "hash-integrity"; }
    std::string description() const override {
        return "Declared checksums match the file content";
    }
    bool requires_descriptor() const override { return false; }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class EncryptionStandardCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "encryption-standard"; }
    std::string description() const override {
        return "Referenced cryptographic algorithms are approved";
    }
    bool requires_descriptor() const override { return false; }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

// ----------------------------------------------------------------------------
// Безопасность и метаданные
// ----------------------------------------------------------------------------

class SecurityFlagsCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "security-flags"; }
    std::string description() const override {
        return "PIE/ASLR, non-executable stack and stack protection are enabled";
    }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class VersionInformationCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "version-information"; }
    std::string description() const override {
        return "Version information is present and consistent";
    }
    bool requires_descriptor() const override { return false; }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

class LicenseComplianceCheck final : public ComplianceCheck {
public:
    std::string id() const override { return "license-compliance"; }
    std::string description() const override {
        return "Declared licenses are valid SPDX expressions and not denied";
    }
    bool requires_descriptor() const override { return false; }
    CheckOutcome execute(const CheckContext& ctx) const override;
};

}  // namespace raven::check

#endif  // RAVEN_CHECKS_HPP
