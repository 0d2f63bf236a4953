// ==============================================================================
// raven/registry.hpp - Реестр проверок
// ==============================================================================
//
// Назначение:
// - Владение экземплярами проверок
// - Уникальность идентификаторов (DuplicateCheckID)
// - Стабильный порядок регистрации
//
// Реестр создаётся на каждый запуск (make_default_registry()) и не является
// глобальным: параллельные запуски изолированы.
//
// ==============================================================================

#ifndef RAVEN_REGISTRY_HPP
#define RAVEN_REGISTRY_HPP

#include <raven/check.hpp>

#include <memory>
#include <string>
#include <vector>

namespace raven::check {

enum class RegistryErrorKind { DuplicateCheckID, InvalidCheck };

struct RegisterResult {
    bool ok = false;
    RegistryErrorKind error = RegistryErrorKind::DuplicateCheckID;
    std::string message;

    explicit operator bool() const { return ok; }
};

class CheckRegistry {
public:
    CheckRegistry() = default;

    CheckRegistry(const CheckRegistry&) = delete;
    CheckRegistry& operator=(const CheckRegistry&) = delete;
    CheckRegistry(CheckRegistry&&) = default;
    CheckRegistry& operator=(CheckRegistry&&) = default;

    /// Зарегистрировать проверку. При совпадении id реестр не меняется.
    RegisterResult add(std::unique_ptr<ComplianceCheck> check);

    std::size_t size() const { return checks_.size(); }
    bool empty() const { return checks_.empty(); }

    /// Проверка по индексу регистрации
    const ComplianceCheck& at(std::size_t index) const { return *checks_.at(index); }

    /// Проверка по id или nullptr
    const ComplianceCheck* find(const std::string& id) const;

    /// Идентификаторы в порядке регистрации
    std::vector<std::string> ids() const;

private:
    std::vector<std::unique_ptr<ComplianceCheck>> checks_;
};

/// Реестр со всеми одиннадцатью проверками в каноническом порядке
CheckRegistry make_default_registry();

}  // namespace raven::check

#endif  // RAVEN_REGISTRY_HPP
