// ==============================================================================
// cyclonedx.cpp - CycloneDX 1.5 JSON
// ==============================================================================
//
// Корень - metadata.component, библиотеки - components[], связи -
// dependencies[] по bom-ref ("name@version"). serialNumber - UUID от
// компактного документа без serialNumber, поэтому одинаковый вход даёт
// одинаковый документ.
//
// ==============================================================================

#include <raven/sbom.hpp>

#include "json_util.hpp"

#include <unordered_map>

namespace raven::sbom {

namespace {

constexpr const char* SPEC_VERSION = "1.5";

std::string bom_ref(const Component& c) {
    return c.version.empty() ? c.name : c.name + "@" + c.version;
}

rapidjson::Value component_json(const Component& c, rapidjson::Document::AllocatorType& alloc) {
    using detail::str;
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("type", rapidjson::StringRef(component_type_to_string(c.type)), alloc);
    obj.AddMember("bom-ref", str(bom_ref(c), alloc), alloc);
    obj.AddMember("name", str(c.name, alloc), alloc);
    if (!c.version.empty()) {
        obj.AddMember("version", str(c.version, alloc), alloc);
    }
    if (!c.hashes.empty()) {
        rapidjson::Value hashes(rapidjson::kArrayType);
        for (const auto& [alg, content] : c.hashes) {
            rapidjson::Value h(rapidjson::kObjectType);
            h.AddMember("alg", str(alg, alloc), alloc);
            h.AddMember("content", str(content, alloc), alloc);
            hashes.PushBack(h, alloc);
        }
        obj.AddMember("hashes", hashes, alloc);
    }
    if (!c.licenses.empty()) {
        rapidjson::Value licenses(rapidjson::kArrayType);
        for (const auto& expr : c.licenses) {
            rapidjson::Value l(rapidjson::kObjectType);
            l.AddMember("expression", str(expr, alloc), alloc);
            licenses.PushBack(l, alloc);
        }
        obj.AddMember("licenses", licenses, alloc);
    }
    return obj;
}

void build(const Sbom& sbom, const std::string* serial, rapidjson::Document& doc) {
    using detail::str;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("bomFormat", "CycloneDX", alloc);
    doc.AddMember("specVersion", rapidjson::StringRef(SPEC_VERSION), alloc);
    if (serial != nullptr) {
        doc.AddMember("serialNumber", str("urn:uuid:" + *serial, alloc), alloc);
    }
    doc.AddMember("version", 1, alloc);

    rapidjson::Value tool(rapidjson::kObjectType);
    tool.AddMember("vendor", str(sbom.metadata.tool_vendor, alloc), alloc);
    tool.AddMember("name", str(sbom.metadata.tool_name, alloc), alloc);
    tool.AddMember("version", str(sbom.metadata.tool_version, alloc), alloc);
    rapidjson::Value tools(rapidjson::kArrayType);
    tools.PushBack(tool, alloc);

    rapidjson::Value metadata(rapidjson::kObjectType);
    metadata.AddMember("timestamp", str(sbom.metadata.timestamp, alloc), alloc);
    metadata.AddMember("tools", tools, alloc);
    metadata.AddMember("component", component_json(sbom.components.front(), alloc), alloc);
    doc.AddMember("metadata", metadata, alloc);

    std::unordered_map<std::string, std::string> refs;
    for (const auto& c : sbom.components) {
        refs.emplace(c.name, bom_ref(c));
    }

    rapidjson::Value components(rapidjson::kArrayType);
    for (std::size_t i = 1; i < sbom.components.size(); ++i) {
        components.PushBack(component_json(sbom.components[i], alloc), alloc);
    }
    doc.AddMember("components", components, alloc);

    rapidjson::Value dependencies(rapidjson::kArrayType);
    for (const auto& c : sbom.components) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("ref", str(refs.at(c.name), alloc), alloc);
        rapidjson::Value depends_on(rapidjson::kArrayType);
        for (const auto& dep : c.depends) {
            depends_on.PushBack(str(refs.at(dep), alloc), alloc);
        }
        entry.AddMember("dependsOn", depends_on, alloc);
        dependencies.PushBack(entry, alloc);
    }
    doc.AddMember("dependencies", dependencies, alloc);
}

/// Компонент без зависимостей; возвращает его bom-ref
Component read_component(const rapidjson::Value& obj, ComponentType fallback, std::string& ref) {
    if (!obj.IsObject()) {
        throw detail::DecodeFailure("component is not an object");
    }
    Component c;
    const std::string type = detail::optional_string(obj, "type");
    c.type = type == "application" ? ComponentType::Application
             : type.empty()        ? fallback
                                   : ComponentType::Library;
    c.name = detail::required_string(obj, "name");
    c.version = detail::optional_string(obj, "version");
    ref = detail::optional_string(obj, "bom-ref");
    if (ref.empty()) {
        ref = bom_ref(c);
    }

    if (const auto* hashes = detail::optional_array(obj, "hashes")) {
        for (const auto& h : hashes->GetArray()) {
            c.hashes[detail::required_string(h, "alg")] = detail::required_string(h, "content");
        }
    }
    if (const auto* licenses = detail::optional_array(obj, "licenses")) {
        for (const auto& l : licenses->GetArray()) {
            std::string expr = detail::optional_string(l, "expression");
            if (expr.empty() && l.IsObject()) {
                auto lic = l.FindMember("license");
                if (lic != l.MemberEnd() && lic->value.IsObject()) {
                    expr = detail::optional_string(lic->value, "id");
                    if (expr.empty()) {
                        expr = detail::optional_string(lic->value, "name");
                    }
                }
            }
            if (!expr.empty()) {
                c.licenses.push_back(std::move(expr));
            }
        }
    }
    return c;
}

}  // namespace

EncodeResult encode_cyclonedx(const Sbom& sbom) {
    EncodeResult result;
    const std::string problem = validate(sbom);
    if (!problem.empty()) {
        result.message = problem;
        return result;
    }

    rapidjson::Document unsigned_doc;
    build(sbom, nullptr, unsigned_doc);
    const std::string serial = content_uuid(detail::serialize(unsigned_doc, false));

    rapidjson::Document doc;
    build(sbom, &serial, doc);
    result.document = detail::serialize(doc, true);
    result.ok = true;
    return result;
}

DecodeResult decode_cyclonedx(std::string_view json) {
    DecodeResult result;
    try {
        rapidjson::Document doc;
        detail::parse_json(json, doc);

        if (detail::required_string(doc, "bomFormat") != "CycloneDX") {
            throw detail::DecodeFailure("bomFormat is not CycloneDX");
        }
        Sbom& sbom = result.sbom;
        sbom.format = SbomFormat::CycloneDX;
        sbom.spec_version = detail::required_string(doc, "specVersion");

        auto meta_it = doc.FindMember("metadata");
        if (meta_it == doc.MemberEnd() || !meta_it->value.IsObject()) {
            throw detail::DecodeFailure("missing metadata");
        }
        const rapidjson::Value& meta = meta_it->value;
        sbom.metadata.timestamp = detail::optional_string(meta, "timestamp");

        auto tools_it = meta.FindMember("tools");
        if (tools_it != meta.MemberEnd()) {
            const rapidjson::Value* first = nullptr;
            if (tools_it->value.IsArray() && !tools_it->value.Empty()) {
                first = &tools_it->value[0];
            } else if (tools_it->value.IsObject()) {
                // Форма 1.5: tools.components[]
                const auto* comps = detail::optional_array(tools_it->value, "components");
                if (comps != nullptr && !comps->Empty()) {
                    first = &(*comps)[0];
                }
            }
            if (first != nullptr && first->IsObject()) {
                sbom.metadata.tool_vendor = detail::optional_string(*first, "vendor");
                if (sbom.metadata.tool_vendor.empty()) {
                    sbom.metadata.tool_vendor = detail::optional_string(*first, "publisher");
                }
                sbom.metadata.tool_name = detail::optional_string(*first, "name");
                sbom.metadata.tool_version = detail::optional_string(*first, "version");
            }
        }

        auto root_it = meta.FindMember("component");
        if (root_it == meta.MemberEnd()) {
            throw detail::DecodeFailure("missing metadata.component");
        }

        std::unordered_map<std::string, std::size_t> by_ref;
        std::string ref;
        sbom.components.push_back(read_component(root_it->value, ComponentType::Application, ref));
        sbom.components.front().type = ComponentType::Application;
        by_ref.emplace(ref, 0);

        if (const auto* comps = detail::optional_array(doc, "components")) {
            for (const auto& obj : comps->GetArray()) {
                sbom.components.push_back(read_component(obj, ComponentType::Library, ref));
                by_ref.emplace(ref, sbom.components.size() - 1);
            }
        }

        if (const auto* deps = detail::optional_array(doc, "dependencies")) {
            for (const auto& entry : deps->GetArray()) {
                const std::string from = detail::required_string(entry, "ref");
                auto it = by_ref.find(from);
                if (it == by_ref.end()) {
                    throw detail::DecodeFailure("dependency on unknown ref '" + from + "'");
                }
                Component& c = sbom.components[it->second];
                if (const auto* on = detail::optional_array(entry, "dependsOn")) {
                    for (const auto& target : on->GetArray()) {
                        if (!target.IsString()) {
                            throw detail::DecodeFailure("dependsOn entry is not a string");
                        }
                        auto t = by_ref.find(target.GetString());
                        if (t == by_ref.end()) {
                            throw detail::DecodeFailure(std::string("unknown ref '") +
                                                        target.GetString() + "'");
                        }
                        c.depends.push_back(sbom.components[t->second].name);
                    }
                }
            }
        }

        result.ok = true;
    } catch (const detail::DecodeFailure& e) {
        result.message = e.what();
    }
    return result;
}

}  // namespace raven::sbom
