// ==============================================================================
// elf.cpp - Парсер ELF (32/64 бит, LE/BE)
// ==============================================================================
//
// Извлекается:
// - заголовок (класс, порядок байт, e_type, e_machine, e_entry)
// - program headers: PT_LOAD, PT_INTERP, PT_DYNAMIC, PT_GNU_STACK, PT_GNU_RELRO
// - section headers с именами из .shstrtab
// - .dynamic: DT_NEEDED, DT_FLAGS, DT_FLAGS_1
// - .gnu.version_r: требования версий по библиотекам (GLIBC_2.34 ...)
// - .dynsym/.symtab: __stack_chk_fail / __stack_chk_guard
// - секции raven: .raven.meta, .raven.cert, .raven.sig, .raven.checksum
//
// Формат: System V ABI, Linux Standard Base (gnu.version_r)
//
// ==============================================================================

#include <raven/crypto.hpp>
#include <raven/parser.hpp>

#include "byte_view.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>
#include <optional>

namespace raven::format {

namespace {

using detail::ByteView;
using detail::malformed;
using detail::ParseFailure;
using detail::read_block;

// ----------------------------------------------------------------------------
// Константы ELF
// ----------------------------------------------------------------------------

constexpr std::size_t EI_NIDENT = 16;
constexpr std::uint8_t ELFCLASS32 = 1;
constexpr std::uint8_t ELFCLASS64 = 2;
constexpr std::uint8_t ELFDATA2LSB = 1;
constexpr std::uint8_t ELFDATA2MSB = 2;

constexpr std::uint16_t ET_REL = 1;
constexpr std::uint16_t ET_EXEC = 2;
constexpr std::uint16_t ET_DYN = 3;

constexpr std::uint32_t PT_LOAD = 1;
constexpr std::uint32_t PT_DYNAMIC = 2;
constexpr std::uint32_t PT_INTERP = 3;
constexpr std::uint32_t PT_NOTE = 4;
constexpr std::uint32_t PT_PHDR = 6;
constexpr std::uint32_t PT_TLS = 7;
constexpr std::uint32_t PT_GNU_EH_FRAME = 0x6474E550;
constexpr std::uint32_t PT_GNU_STACK = 0x6474E551;
constexpr std::uint32_t PT_GNU_RELRO = 0x6474E552;
constexpr std::uint32_t PT_GNU_PROPERTY = 0x6474E553;

constexpr std::uint32_t PF_X = 0x1;
constexpr std::uint32_t PF_W = 0x2;
constexpr std::uint32_t PF_R = 0x4;

constexpr std::uint32_t SHT_SYMTAB = 2;
constexpr std::uint32_t SHT_NOBITS = 8;
constexpr std::uint32_t SHT_DYNSYM = 11;
constexpr std::uint32_t SHT_GNU_VERNEED = 0x6FFFFFFE;

constexpr std::uint64_t SHF_WRITE = 0x1;
constexpr std::uint64_t SHF_ALLOC = 0x2;
constexpr std::uint64_t SHF_EXECINSTR = 0x4;

constexpr std::uint16_t SHN_XINDEX = 0xFFFF;

constexpr std::int64_t DT_NULL = 0;
constexpr std::int64_t DT_NEEDED = 1;
constexpr std::int64_t DT_STRTAB = 5;
constexpr std::int64_t DT_STRSZ = 10;
constexpr std::int64_t DT_BIND_NOW = 24;
constexpr std::int64_t DT_FLAGS = 30;
constexpr std::int64_t DT_FLAGS_1 = 0x6FFFFFFB;

constexpr std::uint64_t DF_BIND_NOW = 0x8;
constexpr std::uint64_t DF_1_NOW = 0x1;
constexpr std::uint64_t DF_1_PIE = 0x08000000;

/// Максимум записей, которые мы готовы обходить в одной цепочке verneed/vernaux
constexpr std::size_t MAX_VERNEED_ENTRIES = 4096;

std::string machine_name(std::uint16_t machine) {
    switch (machine) {
    case 2:
        return "sparc";
    case 3:
        return "i386";
    case 8:
        return "mips";
    case 20:
        return "ppc";
    case 21:
        return "ppc64";
    case 22:
        return "s390";
    case 40:
        return "arm";
    case 43:
        return "sparcv9";
    case 62:
        return "x86_64";
    case 183:
        return "aarch64";
    case 243:
        return "riscv";
    case 258:
        return "loongarch";
    default:
        return "unknown";
    }
}

std::string segment_name(std::uint32_t type) {
    switch (type) {
    case 0:
        return "PT_NULL";
    case PT_LOAD:
        return "PT_LOAD";
    case PT_DYNAMIC:
        return "PT_DYNAMIC";
    case PT_INTERP:
        return "PT_INTERP";
    case PT_NOTE:
        return "PT_NOTE";
    case PT_PHDR:
        return "PT_PHDR";
    case PT_TLS:
        return "PT_TLS";
    case PT_GNU_EH_FRAME:
        return "PT_GNU_EH_FRAME";
    case PT_GNU_STACK:
        return "PT_GNU_STACK";
    case PT_GNU_RELRO:
        return "PT_GNU_RELRO";
    case PT_GNU_PROPERTY:
        return "PT_GNU_PROPERTY";
    default: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "PT_0x%08x", type);
        return buf;
    }
    }
}

std::string to_lower_trimmed(const std::vector<std::uint8_t>& block) {
    std::string out;
    for (std::uint8_t b : block) {
        if (!std::isspace(b) && b != 0) {
            out.push_back(static_cast<char>(std::tolower(b)));
        }
    }
    return out;
}

struct RawSection {
    std::uint32_t name = 0;
    std::uint32_t type = 0;
    std::uint64_t flags = 0;
    std::uint64_t addr = 0;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    std::uint32_t link = 0;
    std::uint32_t info = 0;
    std::uint64_t entsize = 0;
};

// ----------------------------------------------------------------------------
// ElfParser
// ----------------------------------------------------------------------------

class ElfParser {
public:
    explicit ElfParser(const io::ByteSource& source) : source_(source) {}

    BinaryDescriptor parse() {
        parse_header();
        parse_program_headers();
        parse_section_headers();
        parse_dynamic();
        parse_version_requirements();
        parse_symbols();
        parse_raven_sections();
        finish();
        return std::move(d_);
    }

private:
    // -------------------------------------------------------------------------
    // Заголовок
    // -------------------------------------------------------------------------

    void parse_header() {
        const std::uint64_t total = source_.size();
        if (total < EI_NIDENT) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF,
                               "file ends inside ELF identification (" + std::to_string(total) +
                                   " bytes)");
        }
        const auto ident = read_block(source_, 0, EI_NIDENT, "ELF identification");

        if (ident[4] == ELFCLASS64) {
            is64_ = true;
        } else if (ident[4] != ELFCLASS32) {
            malformed("invalid ELF class " + std::to_string(ident[4]));
        }
        if (ident[5] == ELFDATA2MSB) {
            big_endian_ = true;
        } else if (ident[5] != ELFDATA2LSB) {
            malformed("invalid ELF data encoding " + std::to_string(ident[5]));
        }
        if (ident[6] != 1) {
            d_.header_anomalies.push_back("EI_VERSION is " + std::to_string(ident[6]) +
                                          ", expected 1");
        }

        const std::uint64_t ehsize = is64_ ? 64 : 52;
        if (total < ehsize) {
            throw ParseFailure(ParseErrorKind::UnexpectedEOF,
                               "file ends inside ELF header (" + std::to_string(total) + " of " +
                                   std::to_string(ehsize) + " bytes)");
        }
        header_ = read_block(source_, 0, ehsize, "ELF header");
        const ByteView h(header_, big_endian_);

        type_ = h.u16(16);
        const std::uint16_t machine = h.u16(18);
        if (h.u32(20) != 1) {
            d_.header_anomalies.push_back("e_version is " + std::to_string(h.u32(20)) +
                                          ", expected 1");
        }

        if (is64_) {
            d_.entry_point = h.u64(24);
            phoff_ = h.u64(32);
            shoff_ = h.u64(40);
            phentsize_ = h.u16(54);
            phnum_ = h.u16(56);
            shentsize_ = h.u16(58);
            shnum_ = h.u16(60);
            shstrndx_ = h.u16(62);
        } else {
            d_.entry_point = h.u32(24);
            phoff_ = h.u32(28);
            shoff_ = h.u32(32);
            phentsize_ = h.u16(42);
            phnum_ = h.u16(44);
            shentsize_ = h.u16(46);
            shnum_ = h.u16(48);
            shstrndx_ = h.u16(50);
        }
        const std::uint16_t declared_ehsize = h.u16(is64_ ? 52 : 40);
        if (declared_ehsize != ehsize) {
            d_.header_anomalies.push_back("e_ehsize is " + std::to_string(declared_ehsize) +
                                          ", expected " + std::to_string(ehsize));
        }

        d_.format = FormatKind::Elf;
        d_.format_variant = is64_ ? "ELF64" : "ELF32";
        d_.bits = is64_ ? 64 : 32;
        d_.endianness = big_endian_ ? Endianness::Big : Endianness::Little;
        d_.architecture = machine_name(machine);
        d_.file_size = total;
    }

    // -------------------------------------------------------------------------
    // Program headers
    // -------------------------------------------------------------------------

    void parse_program_headers() {
        if (phnum_ == 0) {
            return;
        }
        const std::uint16_t min_size = is64_ ? 56 : 32;
        if (phentsize_ < min_size) {
            malformed("e_phentsize " + std::to_string(phentsize_) + " is smaller than " +
                      std::to_string(min_size));
        }
        const auto table = read_block(source_, phoff_,
                                      static_cast<std::uint64_t>(phnum_) * phentsize_,
                                      "program header table");
        const ByteView view(table, big_endian_);

        for (std::uint16_t i = 0; i < phnum_; ++i) {
            const ByteView ph = view.sub(static_cast<std::uint64_t>(i) * phentsize_, phentsize_);
            Segment seg;
            const std::uint32_t type = ph.u32(0);
            if (is64_) {
                seg.flags = ph.u32(4);
                seg.offset = ph.u64(8);
                seg.address = ph.u64(16);
                seg.file_size = ph.u64(32);
                seg.memory_size = ph.u64(40);
            } else {
                seg.offset = ph.u32(4);
                seg.address = ph.u32(8);
                seg.file_size = ph.u32(16);
                seg.memory_size = ph.u32(20);
                seg.flags = ph.u32(24);
            }
            seg.name = segment_name(type);
            seg.loadable = type == PT_LOAD;
            seg.readable = (seg.flags & PF_R) != 0;
            seg.writable = (seg.flags & PF_W) != 0;
            seg.executable = (seg.flags & PF_X) != 0;

            switch (type) {
            case PT_INTERP: {
                const auto interp = read_block(source_, seg.offset, seg.file_size, "PT_INTERP");
                d_.interpreter = ByteView(interp).cstr(0);
                break;
            }
            case PT_DYNAMIC:
                dynamic_ = seg;
                has_dynamic_ = true;
                break;
            case PT_GNU_STACK:
                has_gnu_stack_ = true;
                d_.hardening.nx_stack = !seg.executable;
                break;
            case PT_GNU_RELRO:
                d_.hardening.relro = true;
                break;
            default:
                break;
            }
            d_.segments.push_back(std::move(seg));
        }
    }

    // -------------------------------------------------------------------------
    // Section headers
    // -------------------------------------------------------------------------

    RawSection read_raw_section(const ByteView& sh) const {
        RawSection s;
        s.name = sh.u32(0);
        s.type = sh.u32(4);
        if (is64_) {
            s.flags = sh.u64(8);
            s.addr = sh.u64(16);
            s.offset = sh.u64(24);
            s.size = sh.u64(32);
            s.link = sh.u32(40);
            s.info = sh.u32(44);
            s.entsize = sh.u64(56);
        } else {
            s.flags = sh.u32(8);
            s.addr = sh.u32(12);
            s.offset = sh.u32(16);
            s.size = sh.u32(20);
            s.link = sh.u32(24);
            s.info = sh.u32(28);
            s.entsize = sh.u32(36);
        }
        return s;
    }

    void parse_section_headers() {
        if (shoff_ == 0) {
            return;
        }
        const std::uint16_t min_size = is64_ ? 64 : 40;
        if (shentsize_ < min_size) {
            malformed("e_shentsize " + std::to_string(shentsize_) + " is smaller than " +
                      std::to_string(min_size));
        }

        std::uint64_t count = shnum_;
        std::uint64_t strndx = shstrndx_;
        if (count == 0 || strndx == SHN_XINDEX) {
            // Расширенная нумерация: реальные значения в нулевой записи
            const auto first = read_block(source_, shoff_, shentsize_, "section header 0");
            const RawSection zero = read_raw_section(ByteView(first, big_endian_));
            if (count == 0) {
                count = zero.size;
            }
            if (strndx == SHN_XINDEX) {
                strndx = zero.link;
            }
        }
        if (count == 0) {
            return;
        }
        if (count > source_.size() / shentsize_) {
            malformed("section count " + std::to_string(count) + " exceeds file size");
        }

        const auto table = read_block(source_, shoff_, count * shentsize_, "section header table");
        const ByteView view(table, big_endian_);
        raw_.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i) {
            raw_.push_back(read_raw_section(view.sub(i * shentsize_, shentsize_)));
        }

        std::vector<std::uint8_t> names;
        if (strndx != 0) {
            if (strndx >= raw_.size()) {
                malformed("e_shstrndx " + std::to_string(strndx) + " exceeds section count " +
                          std::to_string(raw_.size()));
            }
            const RawSection& strtab = raw_[static_cast<std::size_t>(strndx)];
            names = read_block(source_, strtab.offset, strtab.size, "section name table");
        }
        const ByteView name_view(names);

        for (const auto& raw : raw_) {
            Section section;
            section.name = names.empty() ? std::string() : name_view.cstr(raw.name, 256);
            section.offset = raw.offset;
            section.file_size = raw.type == SHT_NOBITS ? 0 : raw.size;
            section.address = raw.addr;
            section.virtual_size = raw.size;
            section.flags = raw.flags;
            section.readable = (raw.flags & SHF_ALLOC) != 0;
            section.writable = (raw.flags & SHF_WRITE) != 0;
            section.executable = (raw.flags & SHF_EXECINSTR) != 0;
            d_.sections.push_back(std::move(section));
        }
    }

    // -------------------------------------------------------------------------
    // .dynamic
    // -------------------------------------------------------------------------

    /// Виртуальный адрес -> смещение в файле через PT_LOAD
    std::optional<std::uint64_t> vaddr_to_offset(std::uint64_t vaddr) const {
        for (const auto& seg : d_.segments) {
            if (seg.loadable && vaddr >= seg.address && vaddr - seg.address < seg.file_size) {
                return seg.offset + (vaddr - seg.address);
            }
        }
        return std::nullopt;
    }

    void parse_dynamic() {
        Segment dyn = dynamic_;
        if (!has_dynamic_) {
            const Section* section = d_.find_section(".dynamic");
            if (section == nullptr) {
                return;
            }
            dyn.offset = section->offset;
            dyn.file_size = section->file_size;
        }

        const auto table = read_block(source_, dyn.offset, dyn.file_size, ".dynamic");
        const ByteView view(table, big_endian_);
        const std::uint64_t entry = is64_ ? 16 : 8;

        std::vector<std::uint64_t> needed;
        std::uint64_t strtab_addr = 0;
        std::uint64_t strtab_size = 0;
        std::uint64_t flags = 0;
        std::uint64_t flags_1 = 0;

        for (std::uint64_t off = 0; off + entry <= view.size(); off += entry) {
            const auto tag = static_cast<std::int64_t>(view.word(off, is64_));
            const std::uint64_t val = view.word(off + entry / 2, is64_);
            if (tag == DT_NULL) {
                break;
            }
            switch (tag) {
            case DT_NEEDED:
                needed.push_back(val);
                break;
            case DT_STRTAB:
                strtab_addr = val;
                break;
            case DT_STRSZ:
                strtab_size = val;
                break;
            case DT_BIND_NOW:
                d_.hardening.bind_now = true;
                break;
            case DT_FLAGS:
                flags = val;
                break;
            case DT_FLAGS_1:
                flags_1 = val;
                break;
            default:
                break;
            }
        }

        if ((flags & DF_BIND_NOW) != 0 || (flags_1 & DF_1_NOW) != 0) {
            d_.hardening.bind_now = true;
        }
        pie_flag_ = (flags_1 & DF_1_PIE) != 0;

        if (needed.empty()) {
            return;
        }

        std::vector<std::uint8_t> strings;
        if (const Section* dynstr = d_.find_section(".dynstr")) {
            strings = read_block(source_, dynstr->offset, dynstr->file_size, ".dynstr");
        } else if (auto off = vaddr_to_offset(strtab_addr)) {
            strings = read_block(source_, *off, strtab_size, "DT_STRTAB");
        } else {
            malformed("DT_STRTAB address is not mapped by any PT_LOAD segment");
        }

        const ByteView str_view(strings);
        for (std::uint64_t name_off : needed) {
            ImportedLibrary lib;
            lib.name = str_view.cstr(name_off, 1024);
            if (!lib.name.empty()) {
                d_.imports.push_back(std::move(lib));
            }
        }
    }

    // -------------------------------------------------------------------------
    // .gnu.version_r
    // -------------------------------------------------------------------------

    void parse_version_requirements() {
        for (const auto& raw : raw_) {
            if (raw.type != SHT_GNU_VERNEED) {
                continue;
            }
            if (raw.link >= raw_.size()) {
                malformed(".gnu.version_r sh_link " + std::to_string(raw.link) +
                          " is not a section");
            }
            const RawSection& strtab = raw_[raw.link];
            const auto strings =
                read_block(source_, strtab.offset, strtab.size, "version string table");
            const auto table = read_block(source_, raw.offset, raw.size, ".gnu.version_r");
            const ByteView view(table, big_endian_);
            const ByteView str_view(strings);

            std::map<std::string, std::vector<std::string>> by_file;
            std::uint64_t off = 0;
            const std::size_t limit = std::min<std::size_t>(raw.info, MAX_VERNEED_ENTRIES);
            for (std::size_t n = 0; n < limit; ++n) {
                const std::uint16_t cnt = view.u16(off + 2);
                const std::string file = str_view.cstr(view.u32(off + 4), 1024);
                const std::uint32_t aux = view.u32(off + 8);
                const std::uint32_t next = view.u32(off + 12);

                std::uint64_t aux_off = off + aux;
                for (std::uint16_t a = 0; a < cnt && a < MAX_VERNEED_ENTRIES; ++a) {
                    by_file[file].push_back(str_view.cstr(view.u32(aux_off + 8), 256));
                    const std::uint32_t aux_next = view.u32(aux_off + 12);
                    if (aux_next == 0) {
                        break;
                    }
                    aux_off += aux_next;
                }
                if (next == 0) {
                    break;
                }
                off += next;
            }

            for (auto& lib : d_.imports) {
                auto it = by_file.find(lib.name);
                if (it == by_file.end()) {
                    continue;
                }
                lib.version_requirements = it->second;
                lib.version_hint = detail::highest_version(it->second);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Таблицы символов
    // -------------------------------------------------------------------------

    void parse_symbols() {
        for (const auto& raw : raw_) {
            if (raw.type != SHT_DYNSYM && raw.type != SHT_SYMTAB) {
                continue;
            }
            if (raw.link >= raw_.size()) {
                malformed("symbol table sh_link " + std::to_string(raw.link) +
                          " is not a section");
            }
            const std::uint64_t entsize = is64_ ? 24 : 16;
            const RawSection& strtab = raw_[raw.link];
            const auto strings =
                read_block(source_, strtab.offset, strtab.size, "symbol string table");
            const auto table = read_block(source_, raw.offset, raw.size, "symbol table");
            const ByteView view(table, big_endian_);
            const ByteView str_view(strings);

            for (std::uint64_t off = 0; off + entsize <= view.size(); off += entsize) {
                const std::uint32_t name = view.u32(off);
                if (name == 0) {
                    continue;
                }
                const std::string sym = str_view.cstr(name, 256);
                if (sym == "__stack_chk_fail" || sym == "__stack_chk_guard") {
                    d_.hardening.stack_protector = true;
                    return;
                }
            }
        }
    }

    // -------------------------------------------------------------------------
    // Секции raven
    // -------------------------------------------------------------------------

    void parse_raven_sections() {
        if (const Section* meta = d_.find_section(".raven.meta")) {
            const auto block = read_block(source_, meta->offset, meta->file_size, ".raven.meta");
            apply_manifest(std::string_view(reinterpret_cast<const char*>(block.data()),
                                            block.size()),
                           d_);
        }

        if (const Section* cert = d_.find_section(".raven.cert")) {
            const auto block = read_block(source_, cert->offset, cert->file_size, ".raven.cert");
            for (const auto& der : detail::split_der_sequences(block)) {
                if (auto parsed = crypto::describe_certificate(der)) {
                    d_.certificates.push_back(std::move(*parsed));
                }
            }
            if (d_.certificates.empty()) {
                d_.header_anomalies.push_back(".raven.cert holds no parseable certificate");
            }
        }

        const Section* sig = d_.find_section(".raven.sig");
        const Section* sum = d_.find_section(".raven.checksum");

        if (sig != nullptr) {
            SignatureBlob blob;
            blob.kind = SignatureKind::Raw;
            blob.data = read_block(source_, sig->offset, sig->file_size, ".raven.sig");
            blob.excluded.push_back(sig->file_range());
            if (sum != nullptr) {
                blob.excluded.push_back(sum->file_range());
            }
            d_.signatures.push_back(std::move(blob));
        }

        if (sum != nullptr) {
            DeclaredChecksum checksum;
            checksum.kind = ChecksumKind::Sha256File;
            checksum.name = ".raven.checksum";
            checksum.algorithm = "sha256";
            checksum.expected = to_lower_trimmed(
                read_block(source_, sum->offset, sum->file_size, ".raven.checksum"));
            checksum.excluded.push_back(sum->file_range());
            d_.checksums.push_back(std::move(checksum));
        }
    }

    // -------------------------------------------------------------------------
    // Итог
    // -------------------------------------------------------------------------

    void finish() {
        switch (type_) {
        case ET_REL:
            d_.image_kind = ImageKind::Object;
            break;
        case ET_EXEC:
            d_.image_kind = ImageKind::Executable;
            break;
        case ET_DYN:
            d_.image_kind = (!d_.interpreter.empty() || pie_flag_) ? ImageKind::Executable
                                                                   : ImageKind::SharedLibrary;
            break;
        default:
            d_.image_kind = ImageKind::Other;
            break;
        }

        // ET_DYN загружается по произвольному адресу: PIE-исполняемый или DSO
        d_.hardening.pie = type_ == ET_DYN;
        if (!has_gnu_stack_) {
            d_.hardening.nx_stack = false;
        }
    }

    const io::ByteSource& source_;
    BinaryDescriptor d_;

    std::vector<std::uint8_t> header_;
    bool is64_ = false;
    bool big_endian_ = false;
    std::uint16_t type_ = 0;
    std::uint64_t phoff_ = 0;
    std::uint64_t shoff_ = 0;
    std::uint16_t phentsize_ = 0;
    std::uint16_t phnum_ = 0;
    std::uint16_t shentsize_ = 0;
    std::uint16_t shnum_ = 0;
    std::uint16_t shstrndx_ = 0;

    std::vector<RawSection> raw_;
    Segment dynamic_;
    bool has_dynamic_ = false;
    bool has_gnu_stack_ = false;
    bool pie_flag_ = false;
};

}  // namespace

ParseResult parse_elf(const io::ByteSource& source) {
    ParseResult result;
    try {
        result.descriptor = ElfParser(source).parse();
        result.ok = true;
    } catch (const ParseFailure& e) {
        result.error.kind = e.kind();
        result.error.message = e.what();
    } catch (const std::exception& e) {
        result.error.kind = ParseErrorKind::MalformedHeader;
        result.error.message = std::string("ELF parse failed: ") + e.what();
    }
    return result;
}

}  // namespace raven::format
