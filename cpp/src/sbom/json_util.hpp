// ==============================================================================
// json_util.hpp - RapidJSON помощники кодировщиков SBOM (внутренний заголовок)
// ==============================================================================

#ifndef RAVEN_SBOM_JSON_UTIL_HPP
#define RAVEN_SBOM_JSON_UTIL_HPP

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace raven::sbom::detail {

/// Ошибка структуры входного документа (декодеры)
class DecodeFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline rapidjson::Value str(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

inline std::string serialize(const rapidjson::Document& doc, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

/// Разобрать JSON; синтаксическая ошибка -> DecodeFailure
inline void parse_json(std::string_view json, rapidjson::Document& doc) {
    doc.Parse<rapidjson::kParseIterativeFlag>(json.data(), json.size());
    if (doc.HasParseError()) {
        throw DecodeFailure("invalid JSON at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw DecodeFailure("document root is not an object");
    }
}

/// Строковое поле объекта или "" если его нет
inline std::string optional_string(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        return {};
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

/// Обязательное строковое поле
inline std::string required_string(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        throw DecodeFailure(std::string("expected an object with '") + key + "'");
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        throw DecodeFailure(std::string("missing string field '") + key + "'");
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

/// Поле-массив или nullptr
inline const rapidjson::Value* optional_array(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return nullptr;
    }
    if (!it->value.IsArray()) {
        throw DecodeFailure(std::string("field '") + key + "' is not an array");
    }
    return &it->value;
}

}  // namespace raven::sbom::detail

#endif  // RAVEN_SBOM_JSON_UTIL_HPP
