// ==============================================================================
// spdx.cpp - SPDX 2.3 JSON
// ==============================================================================
//
// Пакеты SPDXRef-Package-<n> в порядке компонентов; корень описывается
// документом (DESCRIBES), зависимости - DEPENDS_ON. Несколько лицензий
// компонента сводятся в licenseDeclared через AND; невалидное SPDX-выражение
// заменяется на NOASSERTION.
//
// ==============================================================================

#include <raven/sbom.hpp>

#include "checks/check_util.hpp"
#include "json_util.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace raven::sbom {

namespace {

constexpr const char* SPDX_VERSION = "SPDX-2.3";
constexpr const char* DOCUMENT_ID = "SPDXRef-DOCUMENT";
constexpr const char* NOASSERTION = "NOASSERTION";
constexpr const char* NAMESPACE_BASE = "https://spdx.org/spdxdocs/";

std::string package_id(std::size_t index) {
    return "SPDXRef-Package-" + std::to_string(index);
}

/// "SHA-256" -> "SHA256" (словарь SPDX)
std::string spdx_algorithm(const std::string& alg) {
    std::string out;
    for (char c : alg) {
        if (c != '-') {
            out.push_back(c);
        }
    }
    return out;
}

/// "SHA256" -> "SHA-256"
std::string model_algorithm(const std::string& alg) {
    if (alg.size() > 3 && alg.compare(0, 3, "SHA") == 0 && alg[3] != '-' && alg != "SHA1") {
        return "SHA-" + alg.substr(3);
    }
    if (alg == "SHA1") {
        return "SHA-1";
    }
    return alg;
}

std::string declared_license(const std::vector<std::string>& licenses) {
    const bool valid =
        std::all_of(licenses.begin(), licenses.end(), [](const std::string& license) {
            return static_cast<bool>(check::detail::parse_spdx_expression(license));
        });
    if (licenses.empty() || !valid) {
        return NOASSERTION;
    }
    if (licenses.size() == 1) {
        return licenses.front();
    }
    std::string out;
    for (std::size_t i = 0; i < licenses.size(); ++i) {
        if (i > 0) {
            out += " AND ";
        }
        out += "(" + licenses[i] + ")";
    }
    return out;
}

void build(const Sbom& sbom, const std::string* document_namespace, rapidjson::Document& doc) {
    using detail::str;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    const Component& root = sbom.components.front();

    doc.AddMember("spdxVersion", rapidjson::StringRef(SPDX_VERSION), alloc);
    doc.AddMember("dataLicense", "CC0-1.0", alloc);
    doc.AddMember("SPDXID", rapidjson::StringRef(DOCUMENT_ID), alloc);
    doc.AddMember("name", str(root.name, alloc), alloc);
    if (document_namespace != nullptr) {
        doc.AddMember("documentNamespace", str(*document_namespace, alloc), alloc);
    }

    rapidjson::Value creators(rapidjson::kArrayType);
    std::string tool = "Tool: " + sbom.metadata.tool_name;
    if (!sbom.metadata.tool_version.empty()) {
        tool += "-" + sbom.metadata.tool_version;
    }
    creators.PushBack(str(tool, alloc), alloc);
    if (!sbom.metadata.tool_vendor.empty()) {
        creators.PushBack(str("Organization: " + sbom.metadata.tool_vendor, alloc), alloc);
    }
    rapidjson::Value creation(rapidjson::kObjectType);
    creation.AddMember("created", str(sbom.metadata.timestamp, alloc), alloc);
    creation.AddMember("creators", creators, alloc);
    doc.AddMember("creationInfo", creation, alloc);

    std::unordered_map<std::string, std::string> ids;
    for (std::size_t i = 0; i < sbom.components.size(); ++i) {
        ids.emplace(sbom.components[i].name, package_id(i));
    }

    rapidjson::Value packages(rapidjson::kArrayType);
    for (std::size_t i = 0; i < sbom.components.size(); ++i) {
        const Component& c = sbom.components[i];
        rapidjson::Value pkg(rapidjson::kObjectType);
        pkg.AddMember("SPDXID", str(package_id(i), alloc), alloc);
        pkg.AddMember("name", str(c.name, alloc), alloc);
        if (!c.version.empty()) {
            pkg.AddMember("versionInfo", str(c.version, alloc), alloc);
        }
        pkg.AddMember("downloadLocation", rapidjson::StringRef(NOASSERTION), alloc);
        pkg.AddMember("filesAnalyzed", false, alloc);
        if (!c.hashes.empty()) {
            rapidjson::Value checksums(rapidjson::kArrayType);
            for (const auto& [alg, value] : c.hashes) {
                rapidjson::Value sum(rapidjson::kObjectType);
                sum.AddMember("algorithm", str(spdx_algorithm(alg), alloc), alloc);
                sum.AddMember("checksumValue", str(value, alloc), alloc);
                checksums.PushBack(sum, alloc);
            }
            pkg.AddMember("checksums", checksums, alloc);
        }
        pkg.AddMember("licenseConcluded", rapidjson::StringRef(NOASSERTION), alloc);
        pkg.AddMember("licenseDeclared", str(declared_license(c.licenses), alloc), alloc);
        pkg.AddMember("copyrightText", rapidjson::StringRef(NOASSERTION), alloc);
        pkg.AddMember("primaryPackagePurpose",
                      rapidjson::StringRef(c.type == ComponentType::Application ? "APPLICATION"
                                                                                 : "LIBRARY"),
                      alloc);
        packages.PushBack(pkg, alloc);
    }
    doc.AddMember("packages", packages, alloc);

    rapidjson::Value relationships(rapidjson::kArrayType);
    rapidjson::Value describes(rapidjson::kObjectType);
    describes.AddMember("spdxElementId", rapidjson::StringRef(DOCUMENT_ID), alloc);
    describes.AddMember("relationshipType", "DESCRIBES", alloc);
    describes.AddMember("relatedSpdxElement", str(package_id(0), alloc), alloc);
    relationships.PushBack(describes, alloc);
    for (const auto& c : sbom.components) {
        for (const auto& dep : c.depends) {
            rapidjson::Value rel(rapidjson::kObjectType);
            rel.AddMember("spdxElementId", str(ids.at(c.name), alloc), alloc);
            rel.AddMember("relationshipType", "DEPENDS_ON", alloc);
            rel.AddMember("relatedSpdxElement", str(ids.at(dep), alloc), alloc);
            relationships.PushBack(rel, alloc);
        }
    }
    doc.AddMember("relationships", relationships, alloc);
}

/// "Tool: raven-linter-0.1.0" -> имя и версия
void split_tool(const std::string& creator, SbomMetadata& meta) {
    const std::string text = creator.substr(6);
    const auto dash = text.rfind('-');
    if (dash != std::string::npos && dash + 1 < text.size() &&
        std::isdigit(static_cast<unsigned char>(text[dash + 1]))) {
        meta.tool_name = text.substr(0, dash);
        meta.tool_version = text.substr(dash + 1);
    } else {
        meta.tool_name = text;
        meta.tool_version.clear();
    }
}

}  // namespace

EncodeResult encode_spdx(const Sbom& sbom) {
    EncodeResult result;
    const std::string problem = validate(sbom);
    if (!problem.empty()) {
        result.message = problem;
        return result;
    }

    rapidjson::Document unnamed;
    build(sbom, nullptr, unnamed);
    const std::string ns = NAMESPACE_BASE + sbom.components.front().name + "-" +
                           content_uuid(detail::serialize(unnamed, false));

    rapidjson::Document doc;
    build(sbom, &ns, doc);
    result.document = detail::serialize(doc, true);
    result.ok = true;
    return result;
}

EncodeResult encode(const Sbom& sbom) {
    switch (sbom.format) {
    case SbomFormat::CycloneDX:
        return encode_cyclonedx(sbom);
    case SbomFormat::Spdx:
    default:
        return encode_spdx(sbom);
    }
}

DecodeResult decode_spdx(std::string_view json) {
    DecodeResult result;
    try {
        rapidjson::Document doc;
        detail::parse_json(json, doc);

        Sbom& sbom = result.sbom;
        sbom.format = SbomFormat::Spdx;
        sbom.spec_version = detail::required_string(doc, "spdxVersion");
        if (sbom.spec_version.compare(0, 5, "SPDX-") != 0) {
            throw detail::DecodeFailure("spdxVersion '" + sbom.spec_version + "' is not SPDX");
        }

        auto creation = doc.FindMember("creationInfo");
        if (creation != doc.MemberEnd() && creation->value.IsObject()) {
            sbom.metadata.timestamp = detail::optional_string(creation->value, "created");
            sbom.metadata.tool_vendor.clear();
            if (const auto* creators = detail::optional_array(creation->value, "creators")) {
                for (const auto& item : creators->GetArray()) {
                    if (!item.IsString()) {
                        continue;
                    }
                    const std::string creator(item.GetString(), item.GetStringLength());
                    if (creator.compare(0, 6, "Tool: ") == 0) {
                        split_tool(creator, sbom.metadata);
                    } else if (creator.compare(0, 14, "Organization: ") == 0) {
                        sbom.metadata.tool_vendor = creator.substr(14);
                    }
                }
            }
        }

        const auto* packages = detail::optional_array(doc, "packages");
        if (packages == nullptr) {
            throw detail::DecodeFailure("missing packages");
        }

        std::unordered_map<std::string, std::size_t> by_id;
        for (const auto& pkg : packages->GetArray()) {
            Component c;
            const std::string id = detail::required_string(pkg, "SPDXID");
            c.name = detail::required_string(pkg, "name");
            c.version = detail::optional_string(pkg, "versionInfo");
            c.type = detail::optional_string(pkg, "primaryPackagePurpose") == "APPLICATION"
                         ? ComponentType::Application
                         : ComponentType::Library;
            if (const auto* checksums = detail::optional_array(pkg, "checksums")) {
                for (const auto& sum : checksums->GetArray()) {
                    c.hashes[model_algorithm(detail::required_string(sum, "algorithm"))] =
                        detail::required_string(sum, "checksumValue");
                }
            }
            const std::string license = detail::optional_string(pkg, "licenseDeclared");
            if (!license.empty() && license != NOASSERTION && license != "NONE") {
                c.licenses.push_back(license);
            }
            by_id.emplace(id, sbom.components.size());
            sbom.components.push_back(std::move(c));
        }

        std::string described;
        if (const auto* relationships = detail::optional_array(doc, "relationships")) {
            for (const auto& rel : relationships->GetArray()) {
                const std::string type = detail::required_string(rel, "relationshipType");
                const std::string from = detail::required_string(rel, "spdxElementId");
                const std::string to = detail::required_string(rel, "relatedSpdxElement");
                if (type == "DESCRIBES" && from == DOCUMENT_ID) {
                    described = to;
                    continue;
                }
                if (type != "DEPENDS_ON") {
                    continue;
                }
                auto f = by_id.find(from);
                auto t = by_id.find(to);
                if (f == by_id.end() || t == by_id.end()) {
                    throw detail::DecodeFailure("relationship references unknown element");
                }
                sbom.components[f->second].depends.push_back(sbom.components[t->second].name);
            }
        }

        // Описываемый пакет - корень, он должен идти первым
        if (!described.empty()) {
            auto it = by_id.find(described);
            if (it != by_id.end() && it->second != 0) {
                std::swap(sbom.components[0], sbom.components[it->second]);
            }
        }
        if (!sbom.components.empty()) {
            sbom.components.front().type = ComponentType::Application;
        }

        result.ok = true;
    } catch (const detail::DecodeFailure& e) {
        result.message = e.what();
    }
    return result;
}

}  // namespace raven::sbom
