// ==============================================================================
// value.cpp - Дерево значений для метаданных проверок
// ==============================================================================

#include <raven/value.hpp>

#include <cmath>
#include <stdexcept>

namespace raven {

Value Value::make_string_array(const std::vector<std::string>& items) {
    Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return Value(std::move(arr));
}

void Value::push_back(Value v) {
    if (auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_)) {
        (*ptr)->push_back(std::move(v));
    }
}

void Value::set(const std::string& key, Value v) {
    if (auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_)) {
        (**ptr)[key] = std::move(v);
    }
}

const Value* Value::get(const std::string& key) const {
    if (const auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_)) {
        auto it = (*ptr)->find(key);
        if (it != (*ptr)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::size_t Value::size() const {
    if (is_array()) {
        return as_array().size();
    }
    if (is_object()) {
        return as_object().size();
    }
    return 0;
}

bool Value::empty() const {
    return is_null() || ((is_array() || is_object()) && size() == 0);
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
    } else if (is_bool()) {
        out.SetBool(as_bool());
    } else if (is_int()) {
        out.SetInt64(as_int());
    } else if (is_uint()) {
        out.SetUint64(as_uint());
    } else if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
    } else if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
    } else {
        out.SetObject();
        for (const auto& [key, val] : as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
    }
}

std::string Value::to_display_string() const {
    if (is_null()) {
        return "null";
    }
    if (is_bool()) {
        return as_bool() ? "true" : "false";
    }
    if (is_int()) {
        return std::to_string(as_int());
    }
    if (is_uint()) {
        return std::to_string(as_uint());
    }
    if (is_double()) {
        return std::to_string(as_double());
    }
    if (is_string()) {
        return as_string();
    }
    if (is_array()) {
        std::string s = "[";
        bool first = true;
        for (const auto& elem : as_array()) {
            if (!first) {
                s += ", ";
            }
            first = false;
            s += elem.to_display_string();
        }
        return s + "]";
    }
    std::string s = "{";
    bool first = true;
    for (const auto& [key, val] : as_object()) {
        if (!first) {
            s += ", ";
        }
        first = false;
        s += key + ": " + val.to_display_string();
    }
    return s + "}";
}

}  // namespace raven
