// ==============================================================================
// pe.cpp - Парсер PE (PE32 / PE32+)
// ==============================================================================
//
// Извлекается:
// - DOS/COFF/Optional заголовки, таблица секций
// - импорт (имена DLL)
// - security directory: WIN_CERTIFICATE -> PKCS#7 (Authenticode)
// - load config: SecurityCookie (/GS)
// - CheckSum и DllCharacteristics
// - VS_VERSIONINFO (VS_FIXEDFILEINFO) из ресурсов
// - секция .rmeta с манифестом raven
//
// Формат: Microsoft PE/COFF Specification
//
// ==============================================================================

#include <raven/crypto.hpp>
#include <raven/parser.hpp>

#include "byte_view.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>

namespace raven::format {

namespace {

using detail::ByteView;
using detail::malformed;
using detail::ParseFailure;
using detail::read_block;

// ----------------------------------------------------------------------------
// Константы PE
// ----------------------------------------------------------------------------

constexpr std::uint64_t DOS_HEADER_SIZE = 64;
constexpr std::uint64_t COFF_HEADER_SIZE = 20;
constexpr std::uint64_t SECTION_HEADER_SIZE = 40;

constexpr std::uint16_t PE32_MAGIC = 0x10B;
constexpr std::uint16_t PE32PLUS_MAGIC = 0x20B;
constexpr std::uint16_t ROM_MAGIC = 0x107;

constexpr std::uint16_t IMAGE_FILE_EXECUTABLE_IMAGE = 0x0002;
constexpr std::uint16_t IMAGE_FILE_DLL = 0x2000;

constexpr std::uint16_t DLLCHAR_HIGH_ENTROPY_VA = 0x0020;
constexpr std::uint16_t DLLCHAR_DYNAMIC_BASE = 0x0040;
constexpr std::uint16_t DLLCHAR_NX_COMPAT = 0x0100;
constexpr std::uint16_t DLLCHAR_GUARD_CF = 0x4000;

constexpr std::uint32_t SCN_CNT_CODE = 0x00000020;
constexpr std::uint32_t SCN_CNT_UNINITIALIZED_DATA = 0x00000080;
constexpr std::uint32_t SCN_MEM_EXECUTE = 0x20000000;
constexpr std::uint32_t SCN_MEM_READ = 0x40000000;
constexpr std::uint32_t SCN_MEM_WRITE = 0x80000000;

constexpr std::size_t DIR_IMPORT = 1;
constexpr std::size_t DIR_RESOURCE = 2;
constexpr std::size_t DIR_SECURITY = 4;
constexpr std::size_t DIR_LOAD_CONFIG = 10;

constexpr std::uint16_t WIN_CERT_TYPE_PKCS_SIGNED_DATA = 0x0002;
constexpr std::uint32_t RT_VERSION = 16;
constexpr std::uint32_t VS_FFI_SIGNATURE = 0xFEEF04BD;

/// Ограничение обхода таблиц (импорт, ресурсы, сертификаты)
constexpr std::size_t MAX_TABLE_ENTRIES = 4096;

std::string machine_name(std::uint16_t machine) {
    switch (machine) {
    case 0x014C:
        return "i386";
    case 0x8664:
        return "x86_64";
    case 0x01C0:
    case 0x01C4:
        return "arm";
    case 0xAA64:
        return "aarch64";
    case 0x0200:
        return "ia64";
    default:
        return "unknown";
    }
}

struct DataDirectory {
    std::uint32_t rva = 0;  // для security directory - смещение в файле
    std::uint32_t size = 0;
};

struct RawSection {
    std::uint32_t virtual_address = 0;
    std::uint32_t virtual_size = 0;
    std::uint32_t raw_size = 0;
    std::uint32_t raw_pointer = 0;
};

std::string hex32(std::uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", value);
    return buf;
}

std::string fixed_version(std::uint32_t ms, std::uint32_t ls) {
    return std::to_string(ms >> 16) + "." + std::to_string(ms & 0xFFFF) + "." +
           std::to_string(ls >> 16) + "." + std::to_string(ls & 0xFFFF);
}

// ----------------------------------------------------------------------------
// PeParser
// ----------------------------------------------------------------------------

class PeParser {
public:
    explicit PeParser(const io::ByteSource& source) : source_(source) {}

    BinaryDescriptor parse() {
        parse_headers();
        parse_sections();
        parse_imports();
        parse_security();
        parse_load_config();
        parse_version_resource();
        parse_manifest();
        return std::move(d_);
    }

private:
    // -------------------------------------------------------------------------
    // Заголовки
    // -------------------------------------------------------------------------

    void parse_headers() {
        const std::uint64_t total = source_.size();
        if (total < DOS_HEADER_SIZE) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF,
                               "file ends inside DOS header (" + std::to_string(total) + " bytes)");
        }
        const auto dos = read_block(source_, 0, DOS_HEADER_SIZE, "DOS header");
        const ByteView dos_view(dos);
        if (dos_view.u16(0) != 0x5A4D) {
            malformed("missing MZ signature");
        }
        const std::uint64_t lfanew = dos_view.u32(0x3C);
        if (lfanew >= total) {
            malformed("e_lfanew " + std::to_string(lfanew) + " points past end of file");
        }
        if (lfanew + 4 + COFF_HEADER_SIZE > total) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF, "file ends inside COFF header");
        }

        const auto nt = read_block(source_, lfanew, 4 + COFF_HEADER_SIZE, "COFF header");
        const ByteView nt_view(nt);
        if (nt_view.u32(0) != 0x00004550) {
            malformed("missing PE\\0\\0 signature at e_lfanew");
        }
        const ByteView coff = nt_view.sub(4, COFF_HEADER_SIZE);
        const std::uint16_t machine = coff.u16(0);
        section_count_ = coff.u16(2);
        const std::uint16_t optional_size = coff.u16(16);
        const std::uint16_t characteristics = coff.u16(18);

        optional_offset_ = lfanew + 4 + COFF_HEADER_SIZE;
        if (optional_size < 2) {
            malformed("SizeOfOptionalHeader " + std::to_string(optional_size) + " is too small");
        }
        optional_ = read_block(source_, optional_offset_, optional_size, "optional header");
        const ByteView opt(optional_);

        const std::uint16_t magic = opt.u16(0);
        if (magic == ROM_MAGIC) {
            throw ParseFailure(ParseErrorKind::UnsupportedVariant, "ROM image optional header");
        }
        if (magic != PE32_MAGIC && magic != PE32PLUS_MAGIC) {
            malformed("unknown optional header magic 0x" + hex32(magic));
        }
        is64_ = magic == PE32PLUS_MAGIC;

        d_.format = FormatKind::Pe;
        d_.format_variant = is64_ ? "PE32+" : "PE32";
        d_.bits = is64_ ? 64 : 32;
        d_.endianness = Endianness::Little;
        d_.architecture = machine_name(machine);
        d_.file_size = total;
        d_.entry_point = opt.u32(16);

        if (characteristics & IMAGE_FILE_DLL) {
            d_.image_kind = ImageKind::SharedLibrary;
        } else if (characteristics & IMAGE_FILE_EXECUTABLE_IMAGE) {
            d_.image_kind = ImageKind::Executable;
        } else {
            d_.image_kind = ImageKind::Object;
        }

        size_of_headers_ = opt.u32(60);
        const std::uint32_t checksum = opt.u32(64);
        const std::uint16_t dll_characteristics = opt.u16(70);

        d_.hardening.pie = (dll_characteristics & DLLCHAR_DYNAMIC_BASE) != 0;
        d_.hardening.nx_stack = (dll_characteristics & DLLCHAR_NX_COMPAT) != 0;
        d_.hardening.cfg = (dll_characteristics & DLLCHAR_GUARD_CF) != 0;
        d_.hardening.high_entropy_va = (dll_characteristics & DLLCHAR_HIGH_ENTROPY_VA) != 0;

        checksum_range_ = {optional_offset_ + 64, 4};
        if (checksum != 0) {
            DeclaredChecksum declared;
            declared.kind = ChecksumKind::PeImage;
            declared.name = "IMAGE_OPTIONAL_HEADER.CheckSum";
            declared.algorithm = "pe-checksum";
            declared.expected = hex32(checksum);
            declared.excluded.push_back(checksum_range_);
            d_.checksums.push_back(std::move(declared));
        }

        const std::uint64_t dir_count_offset = is64_ ? 108 : 92;
        const std::uint64_t dir_offset = dir_count_offset + 4;
        const std::uint32_t dir_count = opt.u32(dir_count_offset);
        const std::uint64_t available = (opt.size() - std::min<std::uint64_t>(opt.size(), dir_offset)) / 8;
        if (dir_count > available) {
            d_.header_anomalies.push_back("NumberOfRvaAndSizes " + std::to_string(dir_count) +
                                          " exceeds optional header");
        }
        const std::uint64_t usable = std::min<std::uint64_t>(dir_count, available);
        dirs_offset_ = dir_offset;
        for (std::uint64_t i = 0; i < usable && i < 16; ++i) {
            dirs_[i].rva = opt.u32(dir_offset + i * 8);
            dirs_[i].size = opt.u32(dir_offset + i * 8 + 4);
        }
    }

    // -------------------------------------------------------------------------
    // Секции
    // -------------------------------------------------------------------------

    void parse_sections() {
        const std::uint64_t table_offset = optional_offset_ + optional_.size();
        const auto table = read_block(source_, table_offset, section_count_ * SECTION_HEADER_SIZE,
                                      "section table");
        const ByteView view(table);

        for (std::uint16_t i = 0; i < section_count_; ++i) {
            const ByteView sh = view.sub(i * SECTION_HEADER_SIZE, SECTION_HEADER_SIZE);
            RawSection raw;
            raw.virtual_size = sh.u32(8);
            raw.virtual_address = sh.u32(12);
            raw.raw_size = sh.u32(16);
            raw.raw_pointer = sh.u32(20);
            const std::uint32_t flags = sh.u32(36);

            Section section;
            section.name = sh.fixed_str(0, 8);
            section.address = raw.virtual_address;
            section.virtual_size = raw.virtual_size;
            section.offset = raw.raw_pointer;
            section.file_size = (flags & SCN_CNT_UNINITIALIZED_DATA) && raw.raw_pointer == 0
                                    ? 0
                                    : raw.raw_size;
            section.flags = flags;
            section.readable = (flags & SCN_MEM_READ) != 0;
            section.writable = (flags & SCN_MEM_WRITE) != 0;
            section.executable = (flags & (SCN_MEM_EXECUTE | SCN_CNT_CODE)) != 0;

            raw_.push_back(raw);
            d_.sections.push_back(std::move(section));
        }
    }

    std::optional<std::uint64_t> rva_to_offset(std::uint32_t rva) const {
        if (rva < size_of_headers_) {
            return rva;
        }
        for (const auto& s : raw_) {
            const std::uint32_t span = std::max(s.virtual_size, s.raw_size);
            if (rva >= s.virtual_address && rva - s.virtual_address < span) {
                const std::uint32_t delta = rva - s.virtual_address;
                if (delta >= s.raw_size) {
                    return std::nullopt;
                }
                return static_cast<std::uint64_t>(s.raw_pointer) + delta;
            }
        }
        return std::nullopt;
    }

    std::uint64_t require_rva(std::uint32_t rva, const char* what) const {
        auto off = rva_to_offset(rva);
        if (!off) {
            malformed(std::string(what) + " RVA 0x" + hex32(rva) + " is not backed by the file");
        }
        return *off;
    }

    /// Блок по RVA; длина обрезается по концу файла
    std::vector<std::uint8_t> read_rva(std::uint32_t rva, std::uint64_t size,
                                       const char* what) const {
        const std::uint64_t off = require_rva(rva, what);
        if (off >= source_.size()) {
            malformed(std::string(what) + " starts past end of file");
        }
        const std::uint64_t len = std::min<std::uint64_t>(size, source_.size() - off);
        return read_block(source_, off, len, what);
    }

    // -------------------------------------------------------------------------
    // Импорт
    // -------------------------------------------------------------------------

    void parse_imports() {
        const DataDirectory& dir = dirs_[DIR_IMPORT];
        if (dir.rva == 0 || dir.size == 0) {
            return;
        }
        const auto table = read_rva(dir.rva, std::max<std::uint32_t>(dir.size, 20),
                                    "import directory");
        const ByteView view(table);

        for (std::size_t i = 0; i < MAX_TABLE_ENTRIES && (i + 1) * 20 <= view.size(); ++i) {
            const ByteView desc = view.sub(i * 20, 20);
            const std::uint32_t name_rva = desc.u32(12);
            if (name_rva == 0 && desc.u32(0) == 0 && desc.u32(16) == 0) {
                break;
            }
            const auto name_block = read_rva(name_rva, 256, "import name");
            ImportedLibrary lib;
            lib.name = ByteView(name_block).cstr(0, 256);
            if (!lib.name.empty()) {
                d_.imports.push_back(std::move(lib));
            }
        }
    }

    // -------------------------------------------------------------------------
    // Security directory (Authenticode)
    // -------------------------------------------------------------------------

    void parse_security() {
        const DataDirectory& dir = dirs_[DIR_SECURITY];
        if (dir.rva == 0 || dir.size == 0) {
            return;
        }
        // Для security directory поле содержит смещение в файле, а не RVA
        const auto table = read_block(source_, dir.rva, dir.size, "certificate table");
        const ByteView view(table);

        const ByteRange table_range{dir.rva, dir.size};
        const ByteRange dir_entry{optional_offset_ + dirs_offset_ + DIR_SECURITY * 8, 8};

        std::uint64_t off = 0;
        for (std::size_t n = 0; n < MAX_TABLE_ENTRIES && off + 8 <= view.size(); ++n) {
            const std::uint32_t length = view.u32(off);
            const std::uint16_t type = view.u16(off + 6);
            if (length < 8 || off + length > view.size()) {
                malformed("WIN_CERTIFICATE length " + std::to_string(length) +
                          " exceeds certificate table");
            }
            if (type == WIN_CERT_TYPE_PKCS_SIGNED_DATA) {
                SignatureBlob blob;
                blob.kind = SignatureKind::Authenticode;
                blob.data.assign(table.begin() + static_cast<std::ptrdiff_t>(off + 8),
                                 table.begin() + static_cast<std::ptrdiff_t>(off + length));
                blob.excluded = {checksum_range_, dir_entry, table_range};

                for (auto& cert : crypto::certificates_from_pkcs7(blob.data)) {
                    d_.certificates.push_back(std::move(cert));
                }
                d_.signatures.push_back(std::move(blob));
            }
            off += (static_cast<std::uint64_t>(length) + 7) & ~static_cast<std::uint64_t>(7);
        }
    }

    // -------------------------------------------------------------------------
    // Load config (/GS)
    // -------------------------------------------------------------------------

    void parse_load_config() {
        const DataDirectory& dir = dirs_[DIR_LOAD_CONFIG];
        if (dir.rva == 0 || dir.size == 0) {
            return;
        }
        const auto block = read_rva(dir.rva, dir.size, "load config directory");
        const ByteView view(block);
        if (view.size() < 4) {
            return;
        }
        const std::uint64_t declared = std::min<std::uint64_t>(view.u32(0), view.size());
        const std::uint64_t cookie_offset = is64_ ? 0x58 : 0x3C;
        const std::uint64_t cookie_size = is64_ ? 8 : 4;
        if (declared >= cookie_offset + cookie_size) {
            d_.hardening.stack_protector = view.word(cookie_offset, is64_) != 0;
        }
    }

    // -------------------------------------------------------------------------
    // VS_VERSIONINFO
    // -------------------------------------------------------------------------

    /// Первый дочерний элемент каталога ресурсов (по id, если задан)
    std::optional<std::uint32_t> resource_child(const ByteView& rsrc, std::uint32_t dir_offset,
                                                std::optional<std::uint32_t> id) const {
        const std::uint16_t named = rsrc.u16(dir_offset + 12);
        const std::uint16_t ids = rsrc.u16(dir_offset + 14);
        const std::size_t count = std::min<std::size_t>(named + ids, MAX_TABLE_ENTRIES);
        for (std::size_t i = 0; i < count; ++i) {
            const std::uint64_t entry = dir_offset + 16 + i * 8;
            const std::uint32_t name = rsrc.u32(entry);
            const std::uint32_t target = rsrc.u32(entry + 4);
            if (!id || (!(name & 0x80000000u) && name == *id)) {
                return target;
            }
        }
        return std::nullopt;
    }

    void parse_version_resource() {
        const DataDirectory& dir = dirs_[DIR_RESOURCE];
        if (dir.rva == 0 || dir.size == 0) {
            return;
        }
        const auto block = read_rva(dir.rva, dir.size, "resource directory");
        const ByteView rsrc(block);

        // type (RT_VERSION) -> name -> language -> IMAGE_RESOURCE_DATA_ENTRY
        auto type = resource_child(rsrc, 0, RT_VERSION);
        if (!type || !(*type & 0x80000000u)) {
            return;
        }
        auto name = resource_child(rsrc, *type & 0x7FFFFFFFu, std::nullopt);
        if (!name || !(*name & 0x80000000u)) {
            return;
        }
        auto lang = resource_child(rsrc, *name & 0x7FFFFFFFu, std::nullopt);
        if (!lang || (*lang & 0x80000000u)) {
            return;
        }
        const std::uint32_t data_rva = rsrc.u32(*lang);
        const std::uint32_t data_size = rsrc.u32(*lang + 4);
        const auto info = read_rva(data_rva, data_size, "VS_VERSIONINFO");
        const ByteView view(info);

        // VS_FIXEDFILEINFO выровнен на 4 после ключа "VS_VERSION_INFO"
        for (std::uint64_t off = 0; off + 24 <= view.size() && off < 128; off += 4) {
            if (view.u32(off) != VS_FFI_SIGNATURE) {
                continue;
            }
            const std::uint32_t file_ms = view.u32(off + 8);
            const std::uint32_t file_ls = view.u32(off + 12);
            const std::uint32_t product_ms = view.u32(off + 16);
            const std::uint32_t product_ls = view.u32(off + 20);
            d_.versions.push_back(
                {"VS_FIXEDFILEINFO.FileVersion", fixed_version(file_ms, file_ls)});
            d_.versions.push_back(
                {"VS_FIXEDFILEINFO.ProductVersion", fixed_version(product_ms, product_ls)});
            return;
        }
        d_.header_anomalies.push_back("VS_VERSIONINFO without VS_FIXEDFILEINFO");
    }

    // -------------------------------------------------------------------------
    // .rmeta
    // -------------------------------------------------------------------------

    void parse_manifest() {
        const Section* meta = d_.find_section(".rmeta");
        if (meta == nullptr || meta->file_size == 0) {
            return;
        }
        // SizeOfRawData выровнен на FileAlignment: хвост - нули
        const auto block = read_block(source_, meta->offset, meta->file_size, ".rmeta");
        const std::string text = ByteView(block).cstr(0, block.size());
        apply_manifest(text, d_);
    }

    const io::ByteSource& source_;
    BinaryDescriptor d_;

    bool is64_ = false;
    std::uint16_t section_count_ = 0;
    std::uint64_t optional_offset_ = 0;
    std::uint64_t dirs_offset_ = 0;
    std::uint32_t size_of_headers_ = 0;
    std::vector<std::uint8_t> optional_;
    DataDirectory dirs_[16];
    ByteRange checksum_range_;
    std::vector<RawSection> raw_;
};

}  // namespace

ParseResult parse_pe(const io::ByteSource& source) {
    ParseResult result;
    try {
        result.descriptor = PeParser(source).parse();
        result.ok = true;
    } catch (const ParseFailure& e) {
        result.error.kind = e.kind();
        result.error.message = e.what();
    } catch (const std::exception& e) {
        result.error.kind = ParseErrorKind::MalformedHeader;
        result.error.message = std::string("PE parse failed: ") + e.what();
    }
    return result;
}

}  // namespace raven::format
