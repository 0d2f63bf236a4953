// ==============================================================================
// raven/value.hpp - Дерево значений для метаданных проверок
// ==============================================================================
//
// Назначение:
// - Структурированные метаданные CheckResult (строки, числа, списки, объекты)
// - Детерминированная сериализация в RapidJSON (ключи объекта упорядочены)
//
// ==============================================================================

#ifndef RAVEN_VALUE_HPP
#define RAVEN_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 даёт ложные -Wnull-dereference на std::get<variant> при -O2+.
// См. https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace raven {

class Value;

using ValueArray = std::vector<Value>;

/// Объект с упорядоченными ключами: одинаковые метаданные дают одинаковый JSON
using ValueObject = std::map<std::string, Value>;

class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    /// Массив строк (списки библиотек, лицензий, алгоритмов)
    static Value make_string_array(const std::vector<std::string>& items);

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Доступ (UB если тип не совпадает - сначала is_*())
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Массив / объект
    // -------------------------------------------------------------------------

    /// Добавить элемент (только если is_array())
    void push_back(Value v);

    /// Установить поле (только если is_object())
    void set(const std::string& key, Value v);

    /// Поле объекта или nullptr
    const Value* get(const std::string& key) const;

    std::size_t size() const;

    /// Пустой ли контейнер (Null тоже считается пустым)
    bool empty() const;

    // -------------------------------------------------------------------------
    // RapidJSON
    // -------------------------------------------------------------------------

    /// @throws std::runtime_error для NaN/Inf
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Короткое однострочное представление для текстового отчёта
    std::string to_display_string() const;
};

}  // namespace raven

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // RAVEN_VALUE_HPP
