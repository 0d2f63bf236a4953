// ==============================================================================
// registry.cpp - Реестр проверок
// ==============================================================================

#include <raven/checks.hpp>
#include <raven/registry.hpp>

#include <algorithm>
#include <stdexcept>

namespace raven::check {

const char* check_status_to_string(CheckStatus status) {
    switch (status) {
    case CheckStatus::Pass:
        return "pass";
    case CheckStatus::Fail:
        return "fail";
    default:
        return "unknown";
    }
}

RegisterResult CheckRegistry::add(std::unique_ptr<ComplianceCheck> check) {
    RegisterResult result;
    if (!check) {
        result.error = RegistryErrorKind::InvalidCheck;
        result.message = "null check";
        return result;
    }

    const std::string id = check->id();
    if (id.empty()) {
        result.error = RegistryErrorKind::InvalidCheck;
        result.message = "check id is empty";
        return result;
    }
    if (find(id) != nullptr) {
        result.error = RegistryErrorKind::DuplicateCheckID;
        result.message = "check '" + id + "' is already registered";
        return result;
    }

    checks_.push_back(std::move(check));
    result.ok = true;
    return result;
}

const ComplianceCheck* CheckRegistry::find(const std::string& id) const {
    auto it = std::find_if(checks_.begin(), checks_.end(),
                           [&](const std::unique_ptr<ComplianceCheck>& c) { return c->id() == id; });
    return it != checks_.end() ? it->get() : nullptr;
}

std::vector<std::string> CheckRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(checks_.size());
    for (const auto& c : checks_) {
        out.push_back(c->id());
    }
    return out;
}

namespace {

/// Встроенные проверки: отказ add() означает ошибку сборки набора
void add_builtin(CheckRegistry& registry, std::unique_ptr<ComplianceCheck> check) {
    const auto added = registry.add(std::move(check));
    if (!added) {
        throw std::logic_error("built-in check registration failed: " + added.message);
    }
}

}  // namespace

CheckRegistry make_default_registry() {
    CheckRegistry registry;
    add_builtin(registry, std::make_unique<FileSignatureCheck>());
    add_builtin(registry, std::make_unique<BinaryMetadataCheck>());
    add_builtin(registry, std::make_unique<DependencyAnalysisCheck>());
    add_builtin(registry, std::make_unique<BinaryFormatCheck>());
    add_builtin(registry, std::make_unique<CertificateValidationCheck>());
    add_builtin(registry, std::make_unique<SignatureVerificationCheck>());
    add_builtin(registry, std::make_unique<HashIntegrityCheck>());
    add_builtin(registry, std::make_unique<EncryptionStandardCheck>());
    add_builtin(registry, std::make_unique<SecurityFlagsCheck>());
    add_builtin(registry, std::make_unique<VersionInformationCheck>());
    add_builtin(registry, std::make_unique<LicenseComplianceCheck>());
    return registry;
}

}  // namespace raven::check
