// ==============================================================================
// descriptor.cpp - BinaryDescriptor: строковые представления и поиск
// ==============================================================================

#include <raven/descriptor.hpp>

namespace raven {

const char* image_kind_to_string(ImageKind kind) {
    switch (kind) {
    case ImageKind::Executable:
        return "executable";
    case ImageKind::SharedLibrary:
        return "shared-library";
    case ImageKind::Object:
        return "object";
    case ImageKind::Other:
    default:
        return "other";
    }
}

const char* signature_kind_to_string(SignatureKind kind) {
    switch (kind) {
    case SignatureKind::Raw:
        return "raw";
    case SignatureKind::Authenticode:
        return "authenticode";
    case SignatureKind::CodeSignature:
        return "code-signature";
    case SignatureKind::AdHoc:
    default:
        return "ad-hoc";
    }
}

const Section* BinaryDescriptor::find_section(const std::string& name) const {
    for (const auto& section : sections) {
        if (section.name == name) {
            return &section;
        }
    }
    return nullptr;
}

const Segment* BinaryDescriptor::find_segment(const std::string& name) const {
    for (const auto& segment : segments) {
        if (segment.name == name) {
            return &segment;
        }
    }
    return nullptr;
}

}  // namespace raven
