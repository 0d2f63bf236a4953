// ==============================================================================
// macho.cpp - Парсер Mach-O (thin, 32/64 бит, оба порядка байт)
// ==============================================================================
//
// Извлекается:
// - mach_header(_64): cputype, filetype, flags (MH_PIE, MH_ALLOW_STACK_EXECUTION)
// - LC_SEGMENT(_64) с секциями, LC_LOAD_DYLIB и родственные команды
// - LC_MAIN / LC_UNIXTHREAD (точка входа)
// - LC_SYMTAB: неопределённые ___stack_chk_fail / ___stack_chk_guard
// - LC_CODE_SIGNATURE: SuperBlob -> CodeDirectory (хеши страниц) + CMS
// - __info_plist (XML, pugixml) и __raven_meta
//
// Fat/universal контейнеры (CAFEBABE) не разбираются: UnsupportedVariant.
//
// Формат: <mach-o/loader.h>, Apple Code Signing (cs_blobs.h)
//
// ==============================================================================

#include <raven/crypto.hpp>
#include <raven/parser.hpp>

#include "byte_view.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <cstring>

namespace raven::format {

namespace {

using detail::ByteView;
using detail::malformed;
using detail::ParseFailure;
using detail::read_block;

// ----------------------------------------------------------------------------
// Константы Mach-O
// ----------------------------------------------------------------------------

constexpr std::uint32_t MH_MAGIC = 0xFEEDFACE;
constexpr std::uint32_t MH_CIGAM = 0xCEFAEDFE;
constexpr std::uint32_t MH_MAGIC_64 = 0xFEEDFACF;
constexpr std::uint32_t MH_CIGAM_64 = 0xCFFAEDFE;
constexpr std::uint32_t FAT_MAGIC = 0xCAFEBABE;
constexpr std::uint32_t FAT_CIGAM = 0xBEBAFECA;

constexpr std::uint32_t MH_OBJECT = 0x1;
constexpr std::uint32_t MH_EXECUTE = 0x2;
constexpr std::uint32_t MH_DYLIB = 0x6;
constexpr std::uint32_t MH_BUNDLE = 0x8;

constexpr std::uint32_t MH_ALLOW_STACK_EXECUTION = 0x20000;
constexpr std::uint32_t MH_PIE = 0x200000;

constexpr std::uint32_t LC_REQ_DYLD = 0x80000000;
constexpr std::uint32_t LC_SEGMENT = 0x1;
constexpr std::uint32_t LC_SYMTAB = 0x2;
constexpr std::uint32_t LC_UNIXTHREAD = 0x5;
constexpr std::uint32_t LC_LOAD_DYLIB = 0xC;
constexpr std::uint32_t LC_SEGMENT_64 = 0x19;
constexpr std::uint32_t LC_CODE_SIGNATURE = 0x1D;
constexpr std::uint32_t LC_LAZY_LOAD_DYLIB = 0x20;
constexpr std::uint32_t LC_LOAD_WEAK_DYLIB = 0x18 | LC_REQ_DYLD;
constexpr std::uint32_t LC_REEXPORT_DYLIB = 0x1F | LC_REQ_DYLD;
constexpr std::uint32_t LC_LOAD_UPWARD_DYLIB = 0x23 | LC_REQ_DYLD;
constexpr std::uint32_t LC_MAIN = 0x28 | LC_REQ_DYLD;

constexpr std::uint32_t VM_PROT_READ = 0x1;
constexpr std::uint32_t VM_PROT_WRITE = 0x2;
constexpr std::uint32_t VM_PROT_EXECUTE = 0x4;

constexpr std::uint32_t SECTION_TYPE = 0x000000FF;
constexpr std::uint32_t S_ZEROFILL = 0x1;
constexpr std::uint32_t S_GB_ZEROFILL = 0xC;
constexpr std::uint32_t S_THREAD_LOCAL_ZEROFILL = 0x12;
constexpr std::uint32_t S_ATTR_PURE_INSTRUCTIONS = 0x80000000;
constexpr std::uint32_t S_ATTR_SOME_INSTRUCTIONS = 0x00000400;

constexpr std::uint8_t N_EXT = 0x01;
constexpr std::uint8_t N_TYPE = 0x0E;
constexpr std::uint8_t N_UNDF = 0x0;

// Code signing (все поля big-endian)
constexpr std::uint32_t CSMAGIC_EMBEDDED_SIGNATURE = 0xFADE0CC0;
constexpr std::uint32_t CSMAGIC_CODEDIRECTORY = 0xFADE0C02;
constexpr std::uint32_t CSMAGIC_BLOBWRAPPER = 0xFADE0B01;
constexpr std::uint32_t CSSLOT_CODEDIRECTORY = 0;
constexpr std::uint32_t CSSLOT_SIGNATURESLOT = 0x10000;

constexpr std::uint8_t CS_HASHTYPE_SHA1 = 1;
constexpr std::uint8_t CS_HASHTYPE_SHA256 = 2;
constexpr std::uint8_t CS_HASHTYPE_SHA256_TRUNCATED = 3;

constexpr std::size_t MAX_LOAD_COMMANDS = 65536;
constexpr std::size_t MAX_BLOB_INDEX = 64;

std::string cpu_name(std::uint32_t cputype) {
    switch (cputype) {
    case 7:
        return "i386";
    case 0x01000007:
        return "x86_64";
    case 12:
        return "arm";
    case 0x0100000C:
        return "arm64";
    case 0x0200000C:
        return "arm64_32";
    case 18:
        return "ppc";
    case 0x01000012:
        return "ppc64";
    default:
        return "unknown";
    }
}

/// dylib версия xxxx.yy.zz
std::string dylib_version(std::uint32_t v) {
    return std::to_string(v >> 16) + "." + std::to_string((v >> 8) & 0xFF) + "." +
           std::to_string(v & 0xFF);
}

// ----------------------------------------------------------------------------
// MachOParser
// ----------------------------------------------------------------------------

class MachOParser {
public:
    explicit MachOParser(const io::ByteSource& source) : source_(source) {}

    BinaryDescriptor parse() {
        parse_header();
        parse_load_commands();
        parse_symbols();
        parse_code_signature();
        parse_embedded_metadata();
        return std::move(d_);
    }

private:
    // -------------------------------------------------------------------------
    // Заголовок
    // -------------------------------------------------------------------------

    void parse_header() {
        const std::uint64_t total = source_.size();
        if (total < 4) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF, "file ends inside Mach-O magic");
        }
        const auto magic_block = read_block(source_, 0, 4, "Mach-O magic");
        const std::uint32_t magic = ByteView(magic_block, true).u32(0);

        switch (magic) {
        case MH_MAGIC:
            break;
        case MH_MAGIC_64:
            is64_ = true;
            break;
        case MH_CIGAM:
            big_endian_ = false;
            break;
        case MH_CIGAM_64:
            is64_ = true;
            big_endian_ = false;
            break;
        case FAT_MAGIC:
        case FAT_CIGAM:
            throw ParseFailure(ParseErrorKind::UnsupportedVariant,
                               "fat/universal Mach-O is not supported, extract a thin slice");
        default:
            malformed("unknown Mach-O magic");
        }
        if (magic == MH_MAGIC || magic == MH_MAGIC_64) {
            big_endian_ = true;
        }

        header_size_ = is64_ ? 32 : 28;
        if (total < header_size_) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF,
                               "file ends inside mach_header (" + std::to_string(total) + " of " +
                                   std::to_string(header_size_) + " bytes)");
        }
        const auto header = read_block(source_, 0, header_size_, "mach_header");
        const ByteView h(header, big_endian_);

        const std::uint32_t cputype = h.u32(4);
        const std::uint32_t filetype = h.u32(12);
        ncmds_ = h.u32(16);
        sizeofcmds_ = h.u32(20);
        flags_ = h.u32(24);

        d_.format = FormatKind::MachO;
        d_.format_variant = is64_ ? "Mach-O 64" : "Mach-O 32";
        d_.bits = is64_ ? 64 : 32;
        d_.endianness = big_endian_ ? Endianness::Big : Endianness::Little;
        d_.architecture = cpu_name(cputype);
        d_.file_size = total;

        switch (filetype) {
        case MH_OBJECT:
            d_.image_kind = ImageKind::Object;
            break;
        case MH_EXECUTE:
            d_.image_kind = ImageKind::Executable;
            break;
        case MH_DYLIB:
        case MH_BUNDLE:
            d_.image_kind = ImageKind::SharedLibrary;
            break;
        default:
            d_.image_kind = ImageKind::Other;
            break;
        }

        // Динамические библиотеки всегда перемещаемы
        d_.hardening.pie = (flags_ & MH_PIE) != 0 || filetype == MH_DYLIB || filetype == MH_BUNDLE;
        d_.hardening.nx_stack = (flags_ & MH_ALLOW_STACK_EXECUTION) == 0;
    }

    // -------------------------------------------------------------------------
    // Load commands
    // -------------------------------------------------------------------------

    void parse_load_commands() {
        if (ncmds_ > MAX_LOAD_COMMANDS) {
            malformed("ncmds " + std::to_string(ncmds_) + " is implausible");
        }
        commands_ = read_block(source_, header_size_, sizeofcmds_, "load commands");
        const ByteView view(commands_, big_endian_);

        std::uint64_t off = 0;
        for (std::uint32_t i = 0; i < ncmds_; ++i) {
            const std::uint32_t cmd = view.u32(off);
            const std::uint32_t cmdsize = view.u32(off + 4);
            if (cmdsize < 8) {
                malformed("load command " + std::to_string(i) + " has cmdsize " +
                          std::to_string(cmdsize));
            }
            const ByteView lc = view.sub(off, cmdsize);

            switch (cmd) {
            case LC_SEGMENT:
            case LC_SEGMENT_64:
                parse_segment(lc, cmd == LC_SEGMENT_64);
                break;
            case LC_LOAD_DYLIB:
            case LC_LOAD_WEAK_DYLIB:
            case LC_REEXPORT_DYLIB:
            case LC_LAZY_LOAD_DYLIB:
            case LC_LOAD_UPWARD_DYLIB:
                parse_dylib(lc);
                break;
            case LC_MAIN:
                d_.entry_point = lc.u64(8);
                has_entry_ = true;
                break;
            case LC_UNIXTHREAD:
                parse_unixthread(lc);
                break;
            case LC_SYMTAB:
                symoff_ = lc.u32(8);
                nsyms_ = lc.u32(12);
                stroff_ = lc.u32(16);
                strsize_ = lc.u32(20);
                has_symtab_ = true;
                break;
            case LC_CODE_SIGNATURE:
                signature_ = {lc.u32(8), lc.u32(12)};
                has_signature_ = true;
                break;
            default:
                break;
            }
            off += cmdsize;
        }
    }

    void parse_segment(const ByteView& lc, bool is64) {
        Segment seg;
        seg.name = lc.fixed_str(8, 16);
        std::uint32_t initprot = 0;
        std::uint32_t nsects = 0;
        std::uint64_t sect_off = 0;
        if (is64) {
            seg.address = lc.u64(24);
            seg.memory_size = lc.u64(32);
            seg.offset = lc.u64(40);
            seg.file_size = lc.u64(48);
            initprot = lc.u32(60);
            nsects = lc.u32(64);
            sect_off = 72;
        } else {
            seg.address = lc.u32(24);
            seg.memory_size = lc.u32(28);
            seg.offset = lc.u32(32);
            seg.file_size = lc.u32(36);
            initprot = lc.u32(44);
            nsects = lc.u32(48);
            sect_off = 56;
        }
        seg.flags = initprot;
        seg.loadable = true;
        seg.readable = (initprot & VM_PROT_READ) != 0;
        seg.writable = (initprot & VM_PROT_WRITE) != 0;
        seg.executable = (initprot & VM_PROT_EXECUTE) != 0;

        const std::uint64_t sect_size = is64 ? 80 : 68;
        for (std::uint32_t i = 0; i < nsects; ++i) {
            const ByteView s = lc.sub(sect_off + i * sect_size, sect_size);
            Section section;
            section.name = s.fixed_str(16, 16) + "," + s.fixed_str(0, 16);
            std::uint32_t flags = 0;
            if (is64) {
                section.address = s.u64(32);
                section.virtual_size = s.u64(40);
                section.offset = s.u32(48);
                flags = s.u32(64);
            } else {
                section.address = s.u32(32);
                section.virtual_size = s.u32(36);
                section.offset = s.u32(40);
                flags = s.u32(56);
            }
            const std::uint32_t type = flags & SECTION_TYPE;
            const bool zerofill =
                type == S_ZEROFILL || type == S_GB_ZEROFILL || type == S_THREAD_LOCAL_ZEROFILL;
            section.file_size = zerofill ? 0 : section.virtual_size;
            section.flags = flags;
            section.readable = seg.readable;
            section.writable = seg.writable;
            section.executable =
                (flags & (S_ATTR_PURE_INSTRUCTIONS | S_ATTR_SOME_INSTRUCTIONS)) != 0;
            d_.sections.push_back(std::move(section));
        }

        d_.segments.push_back(std::move(seg));
    }

    void parse_dylib(const ByteView& lc) {
        const std::uint32_t name_off = lc.u32(8);
        const std::uint32_t current = lc.u32(16);
        const std::uint32_t compat = lc.u32(20);

        ImportedLibrary lib;
        lib.name = lc.cstr(name_off, 1024);
        if (lib.name.empty()) {
            malformed("dylib command with empty name");
        }
        if (compat != 0) {
            lib.version_requirements.push_back(dylib_version(compat));
        }
        if (current != 0) {
            lib.version_hint = dylib_version(current);
        } else if (compat != 0) {
            lib.version_hint = dylib_version(compat);
        }
        d_.imports.push_back(std::move(lib));
    }

    void parse_unixthread(const ByteView& lc) {
        const std::uint32_t flavor = lc.u32(8);
        const std::uint64_t state = 16;
        const std::string& arch = d_.architecture;
        if (arch == "x86_64" && flavor == 4) {
            d_.entry_point = lc.u64(state + 16 * 8);  // rip
        } else if (arch == "i386" && flavor == 1) {
            d_.entry_point = lc.u32(state + 10 * 4);  // eip
        } else if (arch == "arm64" && flavor == 6) {
            d_.entry_point = lc.u64(state + 32 * 8);  // pc
        } else if (arch == "arm" && flavor == 1) {
            d_.entry_point = lc.u32(state + 15 * 4);  // r15
        } else {
            d_.header_anomalies.push_back("LC_UNIXTHREAD flavor " + std::to_string(flavor) +
                                          " not decoded for " + arch);
            return;
        }
        has_entry_ = true;
    }

    // -------------------------------------------------------------------------
    // LC_SYMTAB
    // -------------------------------------------------------------------------

    void parse_symbols() {
        if (!has_symtab_ || nsyms_ == 0) {
            return;
        }
        const std::uint64_t entsize = is64_ ? 16 : 12;
        const auto table = read_block(source_, symoff_, nsyms_ * entsize, "symbol table");
        const auto strings = read_block(source_, stroff_, strsize_, "string table");
        const ByteView view(table, big_endian_);
        const ByteView str_view(strings);

        for (std::uint64_t i = 0; i < nsyms_; ++i) {
            const std::uint64_t off = i * entsize;
            const std::uint32_t strx = view.u32(off);
            const std::uint8_t type = view.u8(off + 4);
            if ((type & N_TYPE) != N_UNDF || (type & N_EXT) == 0 || strx == 0) {
                continue;
            }
            const std::string name = str_view.cstr(strx, 256);
            if (name == "___stack_chk_fail" || name == "___stack_chk_guard") {
                d_.hardening.stack_protector = true;
                return;
            }
        }
    }

    // -------------------------------------------------------------------------
    // LC_CODE_SIGNATURE
    // -------------------------------------------------------------------------

    void parse_code_signature() {
        if (!has_signature_) {
            return;
        }
        const auto blob = read_block(source_, signature_.offset, signature_.size,
                                     "code signature");
        const ByteView sb(blob, true);
        if (sb.u32(0) != CSMAGIC_EMBEDDED_SIGNATURE) {
            malformed("LC_CODE_SIGNATURE does not point at an embedded signature SuperBlob");
        }
        const std::uint32_t count = sb.u32(8);
        if (count > MAX_BLOB_INDEX) {
            malformed("SuperBlob index count " + std::to_string(count) + " is implausible");
        }

        std::vector<std::uint8_t> code_directory;
        std::vector<std::uint8_t> cms;
        for (std::uint32_t i = 0; i < count; ++i) {
            const std::uint32_t type = sb.u32(12 + i * 8);
            const std::uint32_t offset = sb.u32(12 + i * 8 + 4);
            const std::uint32_t magic = sb.u32(offset);
            const std::uint32_t length = sb.u32(offset + 4);
            const ByteView inner = sb.sub(offset, length);

            if (type == CSSLOT_CODEDIRECTORY && magic == CSMAGIC_CODEDIRECTORY) {
                code_directory.assign(inner.data(), inner.data() + inner.size());
                parse_code_directory(inner);
            } else if (type == CSSLOT_SIGNATURESLOT && magic == CSMAGIC_BLOBWRAPPER && length > 8) {
                cms.assign(inner.data() + 8, inner.data() + inner.size());
            }
        }

        if (code_directory.empty()) {
            malformed("code signature without CodeDirectory");
        }

        SignatureBlob signature;
        signature.signed_content = std::move(code_directory);
        if (cms.empty()) {
            signature.kind = SignatureKind::AdHoc;
        } else {
            signature.kind = SignatureKind::CodeSignature;
            for (auto& cert : crypto::certificates_from_cms(cms)) {
                d_.certificates.push_back(std::move(cert));
            }
            signature.data = std::move(cms);
        }
        d_.signatures.push_back(std::move(signature));
    }

    void parse_code_directory(const ByteView& cd) {
        const std::uint32_t hash_offset = cd.u32(16);
        const std::uint32_t n_code_slots = cd.u32(28);
        const std::uint32_t code_limit = cd.u32(32);
        const std::uint8_t hash_size = cd.u8(36);
        const std::uint8_t hash_type = cd.u8(37);
        const std::uint8_t page_shift = cd.u8(39);

        DeclaredChecksum checksum;
        checksum.kind = ChecksumKind::CodePageHashes;
        checksum.name = "CodeDirectory page hashes";
        bool size_ok = false;
        switch (hash_type) {
        case CS_HASHTYPE_SHA1:
            checksum.algorithm = "sha1";
            size_ok = hash_size == 20;
            break;
        case CS_HASHTYPE_SHA256:
            checksum.algorithm = "sha256";
            size_ok = hash_size == 32;
            break;
        case CS_HASHTYPE_SHA256_TRUNCATED:
            checksum.algorithm = "sha256";
            size_ok = hash_size >= 20 && hash_size <= 32;
            break;
        default:
            d_.header_anomalies.push_back("CodeDirectory hash type " + std::to_string(hash_type) +
                                          " is not supported");
            return;
        }
        if (!size_ok) {
            malformed("CodeDirectory hash size " + std::to_string(hash_size) +
                      " does not match hash type " + std::to_string(hash_type));
        }
        if (page_shift == 0 || page_shift > 24) {
            malformed("CodeDirectory page size 2^" + std::to_string(page_shift) +
                      " is implausible");
        }
        checksum.page_size = 1u << page_shift;
        checksum.code_limit = code_limit;

        const std::uint64_t expected_slots =
            (static_cast<std::uint64_t>(code_limit) + checksum.page_size - 1) / checksum.page_size;
        if (n_code_slots != expected_slots) {
            malformed("CodeDirectory has " + std::to_string(n_code_slots) +
                      " code slots for codeLimit " + std::to_string(code_limit));
        }

        const ByteView hashes = cd.sub(hash_offset, static_cast<std::uint64_t>(n_code_slots) * hash_size);
        for (std::uint32_t i = 0; i < n_code_slots; ++i) {
            checksum.page_hashes.push_back(
                crypto::to_hex(hashes.data() + static_cast<std::size_t>(i) * hash_size, hash_size));
        }
        d_.checksums.push_back(std::move(checksum));
    }

    // -------------------------------------------------------------------------
    // __info_plist, __raven_meta
    // -------------------------------------------------------------------------

    void parse_embedded_metadata() {
        for (const auto& section : d_.sections) {
            const auto comma = section.name.find(',');
            const std::string sect =
                comma == std::string::npos ? section.name : section.name.substr(comma + 1);
            if (section.file_size == 0) {
                continue;
            }
            if (sect == "__info_plist") {
                const auto block =
                    read_block(source_, section.offset, section.file_size, "__info_plist");
                parse_info_plist(block);
            } else if (sect == "__raven_meta") {
                const auto block =
                    read_block(source_, section.offset, section.file_size, "__raven_meta");
                apply_manifest(ByteView(block).cstr(0, block.size()), d_);
            }
        }

        if (d_.image_kind == ImageKind::Executable && !has_entry_) {
            d_.header_anomalies.push_back("executable without LC_MAIN or LC_UNIXTHREAD");
        }
    }

    void parse_info_plist(const std::vector<std::uint8_t>& block) {
        if (block.size() >= 6 && std::memcmp(block.data(), "bplist", 6) == 0) {
            d_.header_anomalies.push_back("binary Info.plist is not decoded");
            return;
        }
        pugi::xml_document doc;
        const pugi::xml_parse_result parsed = doc.load_buffer(block.data(), block.size());
        if (!parsed) {
            d_.header_anomalies.push_back(std::string("Info.plist is not valid XML: ") +
                                          parsed.description());
            return;
        }

        const pugi::xml_node dict = doc.child("plist").child("dict");
        for (pugi::xml_node key = dict.child("key"); key; key = key.next_sibling("key")) {
            const std::string name = key.child_value();
            const pugi::xml_node value = key.next_sibling();
            if (std::strcmp(value.name(), "string") != 0) {
                continue;
            }
            if (name == "CFBundleShortVersionString" || name == "CFBundleVersion") {
                d_.versions.push_back({"Info.plist." + name, value.child_value()});
            }
        }
    }

    const io::ByteSource& source_;
    BinaryDescriptor d_;

    bool is64_ = false;
    bool big_endian_ = true;
    std::uint64_t header_size_ = 0;
    std::uint32_t ncmds_ = 0;
    std::uint32_t sizeofcmds_ = 0;
    std::uint32_t flags_ = 0;
    std::vector<std::uint8_t> commands_;

    bool has_entry_ = false;

    bool has_symtab_ = false;
    std::uint64_t symoff_ = 0;
    std::uint64_t nsyms_ = 0;
    std::uint64_t stroff_ = 0;
    std::uint64_t strsize_ = 0;

    bool has_signature_ = false;
    ByteRange signature_;
};

}  // namespace

ParseResult parse_macho(const io::ByteSource& source) {
    ParseResult result;
    try {
        result.descriptor = MachOParser(source).parse();
        result.ok = true;
    } catch (const ParseFailure& e) {
        result.error.kind = e.kind();
        result.error.message = e.what();
    } catch (const std::exception& e) {
        result.error.kind = ParseErrorKind::MalformedHeader;
        result.error.message = std::string("Mach-O parse failed: ") + e.what();
    }
    return result;
}

}  // namespace raven::format
