// ==============================================================================
// fixture_builder.cpp - Синтетические бинарники и ключи для тестов
// ==============================================================================

#include "fixture_builder.hpp"

#include <raven/platform.hpp>

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <stdexcept>

namespace raven::test {

namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

// ----------------------------------------------------------------------------
// Запись little/big-endian полей
// ----------------------------------------------------------------------------

class Buffer {
public:
    explicit Buffer(Bytes& bytes) : bytes_(bytes) {}

    void ensure(std::size_t size) {
        if (bytes_.size() < size) {
            bytes_.resize(size, 0);
        }
    }

    void u8(std::size_t off, std::uint8_t v) {
        ensure(off + 1);
        bytes_[off] = v;
    }

    void u16(std::size_t off, std::uint16_t v) {
        ensure(off + 2);
        bytes_[off] = static_cast<std::uint8_t>(v);
        bytes_[off + 1] = static_cast<std::uint8_t>(v >> 8);
    }

    void u32(std::size_t off, std::uint32_t v) {
        ensure(off + 4);
        for (std::size_t i = 0; i < 4; ++i) {
            bytes_[off + i] = static_cast<std::uint8_t>(v >> (8 * i));
        }
    }

    void u64(std::size_t off, std::uint64_t v) {
        ensure(off + 8);
        for (std::size_t i = 0; i < 8; ++i) {
            bytes_[off + i] = static_cast<std::uint8_t>(v >> (8 * i));
        }
    }

    void be32(std::size_t off, std::uint32_t v) {
        ensure(off + 4);
        for (std::size_t i = 0; i < 4; ++i) {
            bytes_[off + i] = static_cast<std::uint8_t>(v >> (8 * (3 - i)));
        }
    }

    void put(std::size_t off, const void* data, std::size_t size) {
        ensure(off + size);
        const auto* p = static_cast<const std::uint8_t*>(data);
        std::copy(p, p + size, bytes_.begin() + static_cast<std::ptrdiff_t>(off));
    }

    void put(std::size_t off, const std::string& text) { put(off, text.data(), text.size()); }

    void put(std::size_t off, const Bytes& data) { put(off, data.data(), data.size()); }

    /// Дописать в конец с выравниванием; вернуть смещение
    std::size_t append(const void* data, std::size_t size, std::size_t alignment) {
        const std::size_t off = align(bytes_.size(), alignment);
        put(off, data, size);
        return off;
    }

    std::size_t append(const std::string& text, std::size_t alignment) {
        return append(text.data(), text.size(), alignment);
    }

    std::size_t append(const Bytes& data, std::size_t alignment) {
        return append(data.data(), data.size(), alignment);
    }

    std::size_t size() const { return bytes_.size(); }

    static std::size_t align(std::size_t value, std::size_t alignment) {
        return (value + alignment - 1) / alignment * alignment;
    }

private:
    Bytes& bytes_;
};

/// Таблица строк с нулевым байтом в начале и повторным использованием
class StringTable {
public:
    StringTable() : data_(1, '\0') {}

    std::uint32_t add(const std::string& s) {
        auto it = offsets_.find(s);
        if (it != offsets_.end()) {
            return it->second;
        }
        const auto off = static_cast<std::uint32_t>(data_.size());
        data_ += s;
        data_.push_back('\0');
        offsets_.emplace(s, off);
        return off;
    }

    const std::string& data() const { return data_; }

private:
    std::string data_;
    std::map<std::string, std::uint32_t> offsets_;
};

std::string hex(const std::uint8_t* data, std::size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

Bytes sha256(const Bytes& data) {
    Bytes md(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    md.resize(len);
    return md;
}

Bytes without(const Bytes& bytes, std::vector<ByteRange> excluded) {
    std::sort(excluded.begin(), excluded.end(),
              [](const ByteRange& a, const ByteRange& b) { return a.offset < b.offset; });
    Bytes out;
    std::uint64_t pos = 0;
    for (const auto& r : excluded) {
        if (r.offset > pos) {
            out.insert(out.end(), bytes.begin() + static_cast<std::ptrdiff_t>(pos),
                       bytes.begin() + static_cast<std::ptrdiff_t>(r.offset));
        }
        pos = std::max(pos, r.end());
    }
    if (pos < bytes.size()) {
        out.insert(out.end(), bytes.begin() + static_cast<std::ptrdiff_t>(pos), bytes.end());
    }
    return out;
}

std::string bio_text(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    return len > 0 ? std::string(data, static_cast<std::size_t>(len)) : std::string();
}

}  // namespace

// ----------------------------------------------------------------------------
// TestKey
// ----------------------------------------------------------------------------

TestKey::TestKey() : key_(nullptr, &EVP_PKEY_free) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
    EVP_PKEY* raw = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw std::runtime_error("Ed25519 key generation failed");
    }
    key_.reset(raw);
}

std::string TestKey::public_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_PUBKEY failed");
    }
    return bio_text(bio.get());
}

Bytes TestKey::sign(const Bytes& message) const {
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    std::size_t len = 0;
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), nullptr, &len, message.data(), message.size()) != 1) {
        throw std::runtime_error("EVP_DigestSignInit failed");
    }
    Bytes signature(len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &len, message.data(), message.size()) != 1) {
        throw std::runtime_error("EVP_DigestSign failed");
    }
    signature.resize(len);
    return signature;
}

TestCertificate TestKey::self_signed(const std::string& common_name, std::int64_t not_before,
                                     std::int64_t not_after) const {
    X509Ptr x509(X509_new(), &X509_free);
    if (!x509) {
        throw std::runtime_error("X509_new failed");
    }
    X509_set_version(x509.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 0x2A);
    ASN1_TIME_set(X509_getm_notBefore(x509.get()), static_cast<time_t>(not_before));
    ASN1_TIME_set(X509_getm_notAfter(x509.get()), static_cast<time_t>(not_after));
    X509_set_pubkey(x509.get(), key_.get());

    X509_NAME* name = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1,
                               0);
    X509_set_issuer_name(x509.get(), name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, x509.get(), x509.get(), nullptr, nullptr, 0);
    X509_EXTENSION* ext =
        X509V3_EXT_conf_nid(nullptr, &v3, NID_basic_constraints, "critical,CA:TRUE");
    if (ext == nullptr) {
        throw std::runtime_error("basicConstraints extension failed");
    }
    X509_add_ext(x509.get(), ext, -1);
    X509_EXTENSION_free(ext);

    // Ed25519: дайджест не задаётся
    if (X509_sign(x509.get(), key_.get(), nullptr) <= 0) {
        throw std::runtime_error("X509_sign failed");
    }

    TestCertificate cert;
    const int len = i2d_X509(x509.get(), nullptr);
    if (len <= 0) {
        throw std::runtime_error("i2d_X509 failed");
    }
    cert.der.resize(static_cast<std::size_t>(len));
    unsigned char* out = cert.der.data();
    i2d_X509(x509.get(), &out);

    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || PEM_write_bio_X509(bio.get(), x509.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_X509 failed");
    }
    cert.pem = bio_text(bio.get());
    return cert;
}

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ----------------------------------------------------------------------------
// ELF64
// ----------------------------------------------------------------------------

namespace {

constexpr std::uint32_t SHT_PROGBITS = 1;
constexpr std::uint32_t SHT_SYMTAB = 2;
constexpr std::uint32_t SHT_STRTAB = 3;
constexpr std::uint32_t SHT_DYNAMIC = 6;
constexpr std::uint32_t SHT_GNU_VERNEED = 0x6FFFFFFE;

constexpr std::uint64_t SHF_WRITE = 0x1;
constexpr std::uint64_t SHF_ALLOC = 0x2;
constexpr std::uint64_t SHF_EXECINSTR = 0x4;

struct ElfSection {
    std::string name;
    std::uint32_t type = SHT_PROGBITS;
    std::uint64_t flags = 0;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    std::uint32_t link = 0;
    std::uint32_t info = 0;
    std::uint64_t entsize = 0;
};

}  // namespace

Image build_elf(const ElfOptions& options) {
    Image image;
    Buffer out(image.bytes);

    const std::uint64_t base = options.type == 3 ? 0 : 0x400000;
    const std::uint16_t phnum = options.gnu_stack ? 2 : 1;
    out.ensure(64 + 56 * phnum);

    std::vector<ElfSection> sections(1);  // SHN_UNDEF
    auto add = [&](ElfSection s) {
        sections.push_back(std::move(s));
        return static_cast<std::uint32_t>(sections.size() - 1);
    };

    // .text: ret-инструкции
    {
        const Bytes code(64, 0xC3);
        ElfSection s{".text", SHT_PROGBITS, SHF_ALLOC | SHF_EXECINSTR};
        s.offset = out.append(code, 16);
        s.size = code.size();
        add(s);
    }

    if (!options.rodata.empty()) {
        ElfSection s{".rodata", SHT_PROGBITS, SHF_ALLOC};
        s.offset = out.append(options.rodata, 8);
        s.size = options.rodata.size();
        add(s);
    }

    const bool dynamic = !options.needed.empty() || !options.version_requirements.empty() ||
                         options.type == 3;
    if (dynamic) {
        StringTable dynstr;
        Bytes dyn;
        Buffer dyn_out(dyn);
        std::size_t pos = 0;
        auto tag = [&](std::uint64_t t, std::uint64_t v) {
            dyn_out.u64(pos, t);
            dyn_out.u64(pos + 8, v);
            pos += 16;
        };
        for (const auto& lib : options.needed) {
            tag(1, dynstr.add(lib));  // DT_NEEDED
        }
        if (options.type == 3) {
            tag(0x6FFFFFFB, 0x08000000);  // DT_FLAGS_1 = DF_1_PIE
        }
        tag(0, 0);

        // .gnu.version_r: verneed + vernaux записи
        Bytes verneed;
        Buffer ver_out(verneed);
        std::size_t ver_pos = 0;
        std::size_t index = 0;
        std::uint16_t other = 2;
        for (const auto& [lib, versions] : options.version_requirements) {
            const bool last = ++index == options.version_requirements.size();
            const auto cnt = static_cast<std::uint16_t>(versions.size());
            ver_out.u16(ver_pos, 1);
            ver_out.u16(ver_pos + 2, cnt);
            ver_out.u32(ver_pos + 4, dynstr.add(lib));
            ver_out.u32(ver_pos + 8, 16);
            ver_out.u32(ver_pos + 12, last ? 0 : static_cast<std::uint32_t>(16 + 16 * cnt));
            std::size_t aux = ver_pos + 16;
            for (std::size_t i = 0; i < versions.size(); ++i) {
                ver_out.u32(aux, 0);
                ver_out.u16(aux + 4, 0);
                ver_out.u16(aux + 6, other++);
                ver_out.u32(aux + 8, dynstr.add(versions[i]));
                ver_out.u32(aux + 12, i + 1 == versions.size() ? 0 : 16);
                aux += 16;
            }
            ver_pos = aux;
        }

        ElfSection str{".dynstr", SHT_STRTAB, SHF_ALLOC};
        str.offset = out.append(dynstr.data(), 8);
        str.size = dynstr.data().size();
        const std::uint32_t dynstr_index = add(str);

        ElfSection d{".dynamic", SHT_DYNAMIC, SHF_ALLOC | SHF_WRITE};
        d.offset = out.append(dyn, 8);
        d.size = dyn.size();
        d.link = dynstr_index;
        d.entsize = 16;
        add(d);

        if (!verneed.empty()) {
            ElfSection v{".gnu.version_r", SHT_GNU_VERNEED, SHF_ALLOC};
            v.offset = out.append(verneed, 8);
            v.size = verneed.size();
            v.link = dynstr_index;
            v.info = static_cast<std::uint32_t>(options.version_requirements.size());
            add(v);
        }
    }

    if (options.stack_protector) {
        StringTable strtab;
        Bytes symtab(24, 0);  // нулевой символ
        Buffer sym_out(symtab);
        sym_out.u32(24, strtab.add("__stack_chk_fail"));
        sym_out.u8(28, 0x12);  // STB_GLOBAL | STT_FUNC
        sym_out.u64(24 + 16, 0);

        ElfSection str{".strtab", SHT_STRTAB};
        str.offset = out.append(strtab.data(), 8);
        str.size = strtab.data().size();
        const std::uint32_t strtab_index = add(str);

        ElfSection sym{".symtab", SHT_SYMTAB};
        sym.offset = out.append(symtab, 8);
        sym.size = symtab.size();
        sym.link = strtab_index;
        sym.info = 1;
        sym.entsize = 24;
        add(sym);
    }

    if (!options.manifest.empty()) {
        ElfSection s{".raven.meta"};
        s.offset = out.append(options.manifest, 8);
        s.size = options.manifest.size();
        add(s);
    }

    if (!options.certificate_der.empty()) {
        ElfSection s{".raven.cert"};
        s.offset = out.append(options.certificate_der, 8);
        s.size = options.certificate_der.size();
        add(s);
    }

    if (options.signature_slot) {
        ElfSection s{".raven.sig"};
        s.offset = out.append(Bytes(64, 0), 8);
        s.size = 64;
        add(s);
        image.signature_slot = ByteRange{s.offset, s.size};
    }

    if (options.checksum_slot) {
        ElfSection s{".raven.checksum"};
        s.offset = out.append(std::string(64, '0'), 8);
        s.size = 64;
        add(s);
        image.checksum_slot = ByteRange{s.offset, s.size};
    }

    // .shstrtab последней
    StringTable shstrtab;
    std::vector<std::uint32_t> name_offsets(sections.size() + 1, 0);
    for (std::size_t i = 1; i < sections.size(); ++i) {
        name_offsets[i] = shstrtab.add(sections[i].name);
    }
    name_offsets[sections.size()] = shstrtab.add(".shstrtab");
    {
        ElfSection s{".shstrtab", SHT_STRTAB};
        s.offset = out.append(shstrtab.data(), 8);
        s.size = shstrtab.data().size();
        add(s);
    }

    // Таблица заголовков секций
    const std::size_t shoff = Buffer::align(out.size(), 8);
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const ElfSection& s = sections[i];
        const std::size_t sh = shoff + i * 64;
        out.ensure(sh + 64);
        if (i == 0) {
            continue;
        }
        out.u32(sh, name_offsets[i]);
        out.u32(sh + 4, s.type);
        out.u64(sh + 8, s.flags);
        out.u64(sh + 16, (s.flags & SHF_ALLOC) != 0 ? base + s.offset : 0);
        out.u64(sh + 24, s.offset);
        out.u64(sh + 32, s.size);
        out.u32(sh + 40, s.link);
        out.u32(sh + 44, s.info);
        out.u64(sh + 48, 1);
        out.u64(sh + 56, s.entsize);
    }
    const std::uint64_t total = out.size();

    // Заголовок
    const std::uint8_t ident[16] = {0x7F, 'E', 'L', 'F', 2, 1, 1, 0};
    out.put(0, ident, sizeof(ident));
    out.u16(16, options.type);
    out.u16(18, options.machine);
    out.u32(20, 1);
    out.u64(24, options.entry);
    out.u64(32, 64);
    out.u64(40, shoff);
    out.u32(48, 0);
    out.u16(52, 64);
    out.u16(54, 56);
    out.u16(56, phnum);
    out.u16(58, 64);
    out.u16(60, static_cast<std::uint16_t>(sections.size()));
    out.u16(62, static_cast<std::uint16_t>(sections.size() - 1));

    // PT_LOAD на весь файл
    out.u32(64, 1);
    out.u32(64 + 4, 0x5);  // R | X
    out.u64(64 + 8, 0);
    out.u64(64 + 16, base);
    out.u64(64 + 24, base);
    out.u64(64 + 32, total);
    out.u64(64 + 40, total);
    out.u64(64 + 48, 0x1000);

    if (options.gnu_stack) {
        const std::size_t ph = 64 + 56;
        out.u32(ph, 0x6474E551);
        out.u32(ph + 4, 0x6);  // R | W
        out.u64(ph + 48, 16);
    }
    return image;
}

ElfOptions hardened_elf_options() {
    ElfOptions options;
    options.type = 3;
    options.entry = 0x1040;
    options.gnu_stack = true;
    options.stack_protector = true;
    options.needed = {"libc.so.6"};
    options.version_requirements = {{"libc.so.6", {"GLIBC_2.17", "GLIBC_2.34"}}};
    options.manifest = "version=1.2.3\nlicense=MIT\ncrypto=AES-256-GCM,SHA-256\n";
    return options;
}

void seal_elf(Image& image, const TestKey* key) {
    Buffer out(image.bytes);
    if (key != nullptr && image.signature_slot) {
        std::vector<ByteRange> excluded{*image.signature_slot};
        if (image.checksum_slot) {
            excluded.push_back(*image.checksum_slot);
        }
        const Bytes signature = key->sign(without(image.bytes, excluded));
        if (signature.size() != image.signature_slot->size) {
            throw std::runtime_error("signature does not fit .raven.sig");
        }
        out.put(image.signature_slot->offset, signature);
    }
    if (image.checksum_slot) {
        const Bytes digest = sha256(without(image.bytes, {*image.checksum_slot}));
        out.put(image.checksum_slot->offset, hex(digest.data(), digest.size()));
    }
}

// ----------------------------------------------------------------------------
// PE32+
// ----------------------------------------------------------------------------

//  0x000  DOS header, e_lfanew = 0x40
//  0x040  "PE\0\0" + COFF
//  0x058  optional header (PE32+, 0xF0 байт)
//  0x148  таблица секций (3 x 40)
//  0x200  .text   (VA 0x1000)
//  0x400  .rdata  (VA 0x2000): load config @0x2000, импорт @0x2100, имена @0x2180
//  0x600  .rmeta  (VA 0x3000)
Image build_pe(const PeOptions& options) {
    if (options.imports.size() > 4) {
        throw std::invalid_argument("build_pe supports at most 4 imports");
    }
    Image image;
    Buffer out(image.bytes);
    out.ensure(0x800);

    out.u16(0, 0x5A4D);
    out.u32(0x3C, 0x40);
    out.u32(0x40, 0x00004550);

    const std::size_t coff = 0x44;
    std::uint16_t characteristics = 0x0022;  // EXECUTABLE_IMAGE | LARGE_ADDRESS_AWARE
    if (options.dll) {
        characteristics |= 0x2000;
    }
    out.u16(coff, 0x8664);
    out.u16(coff + 2, 3);
    out.u16(coff + 16, 0xF0);
    out.u16(coff + 18, characteristics);

    const std::size_t opt = 0x58;
    out.u16(opt, 0x20B);
    out.u32(opt + 16, 0x1000);       // AddressOfEntryPoint
    out.u64(opt + 24, 0x140000000);  // ImageBase
    out.u32(opt + 32, 0x1000);       // SectionAlignment
    out.u32(opt + 36, 0x200);        // FileAlignment
    out.u32(opt + 56, 0x4000);       // SizeOfImage
    out.u32(opt + 60, 0x200);        // SizeOfHeaders
    out.u16(opt + 68, 3);            // IMAGE_SUBSYSTEM_WINDOWS_CUI
    out.u16(opt + 70, options.dll_characteristics);
    out.u32(opt + 108, 16);

    const std::size_t dirs = opt + 112;
    if (!options.imports.empty()) {
        out.u32(dirs + 1 * 8, 0x2100);
        out.u32(dirs + 1 * 8 + 4, static_cast<std::uint32_t>(20 * (options.imports.size() + 1)));
    }
    if (options.security_cookie) {
        out.u32(dirs + 10 * 8, 0x2000);
        out.u32(dirs + 10 * 8 + 4, 0x100);
    }

    struct PeSection {
        const char* name;
        std::uint32_t va;
        std::uint32_t raw;
        std::uint32_t characteristics;
    };
    const PeSection table[] = {
        {".text", 0x1000, 0x200, 0x60000020},
        {".rdata", 0x2000, 0x400, 0x40000040},
        {".rmeta", 0x3000, 0x600, 0x40000040},
    };
    for (std::size_t i = 0; i < 3; ++i) {
        const std::size_t sh = opt + 0xF0 + i * 40;
        out.put(sh, table[i].name, std::char_traits<char>::length(table[i].name));
        out.u32(sh + 8, 0x200);
        out.u32(sh + 12, table[i].va);
        out.u32(sh + 16, 0x200);
        out.u32(sh + 20, table[i].raw);
        out.u32(sh + 36, table[i].characteristics);
    }

    // .text
    for (std::size_t i = 0; i < 16; ++i) {
        out.u8(0x200 + i, 0xC3);
    }

    // .rdata
    if (options.security_cookie) {
        out.u32(0x400, 0x100);
        out.u64(0x400 + 0x58, 0x2B992DDFA232ULL);
    }
    for (std::size_t i = 0; i < options.imports.size(); ++i) {
        const std::uint32_t name_rva = 0x2180 + static_cast<std::uint32_t>(i) * 32;
        out.u32(0x500 + i * 20 + 12, name_rva);
        out.u32(0x500 + i * 20 + 16, 0x2000);  // FirstThunk
        const std::string name = options.imports[i].substr(0, 31);
        out.put(0x580 + i * 32, name);
    }

    // .rmeta
    out.put(0x600, options.manifest.substr(0, 0x1FF));

    if (options.with_checksum) {
        out.u32(PE_CHECKSUM_OFFSET, reference_pe_checksum(image.bytes, PE_CHECKSUM_OFFSET));
    }
    return image;
}

std::uint32_t reference_pe_checksum(const Bytes& bytes, std::size_t checksum_offset) {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < bytes.size(); i += 2) {
        if (i == checksum_offset || i == checksum_offset + 2) {
            continue;
        }
        std::uint32_t word = bytes[i];
        if (i + 1 < bytes.size()) {
            word |= static_cast<std::uint32_t>(bytes[i + 1]) << 8;
        }
        sum += word;
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    sum = (sum & 0xFFFF) + (sum >> 16);
    return (sum & 0xFFFF) + static_cast<std::uint32_t>(bytes.size());
}

// ----------------------------------------------------------------------------
// Mach-O 64
// ----------------------------------------------------------------------------

namespace {

constexpr std::uint32_t LC_SYMTAB = 0x2;
constexpr std::uint32_t LC_LOAD_DYLIB = 0xC;
constexpr std::uint32_t LC_SEGMENT_64 = 0x19;
constexpr std::uint32_t LC_CODE_SIGNATURE = 0x1D;
constexpr std::uint32_t LC_MAIN = 0x80000028;

struct MachSection {
    std::string sectname;
    std::string content;
    std::uint32_t flags = 0;
    std::uint64_t offset = 0;
};

void put_name16(Buffer& out, std::size_t off, const std::string& name) {
    out.put(off, name.substr(0, 16));
}

}  // namespace

Image build_macho(const MachOptions& options) {
    std::vector<MachSection> sections;
    sections.push_back({"__text", std::string(64, '\xC3'), 0x80000400});
    if (!options.manifest.empty()) {
        sections.push_back({"__raven_meta", options.manifest, 0});
    }
    if (!options.bundle_version.empty()) {
        const std::string plist =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<plist version=\"1.0\"><dict>"
            "<key>CFBundleIdentifier</key><string>org.raven.fixture</string>"
            "<key>CFBundleShortVersionString</key><string>" +
            options.bundle_version + "</string></dict></plist>\n";
        sections.push_back({"__info_plist", plist, 0});
    }

    // Размер load commands
    const std::uint32_t text_cmd = 72 + 80 * static_cast<std::uint32_t>(sections.size());
    std::vector<std::uint32_t> dylib_cmds;
    for (const auto& lib : options.dylibs) {
        dylib_cmds.push_back(static_cast<std::uint32_t>(Buffer::align(24 + lib.size() + 1, 8)));
    }
    std::uint32_t sizeofcmds = text_cmd + 72 + 24;
    for (auto size : dylib_cmds) {
        sizeofcmds += size;
    }
    if (options.stack_protector) {
        sizeofcmds += 24;
    }
    if (options.code_signature) {
        sizeofcmds += 16;
    }
    const std::uint32_t ncmds = 3 + static_cast<std::uint32_t>(dylib_cmds.size()) +
                                (options.stack_protector ? 1 : 0) +
                                (options.code_signature ? 1 : 0);

    Image image;
    Buffer out(image.bytes);
    out.ensure(Buffer::align(32 + sizeofcmds, 16));

    // Содержимое __TEXT
    for (auto& s : sections) {
        s.offset = out.append(s.content, 16);
    }
    const std::uint64_t text_end = Buffer::align(out.size(), 16);
    out.ensure(text_end);

    // __LINKEDIT: символы, строки, подпись
    std::uint64_t symoff = 0;
    std::uint64_t stroff = 0;
    std::uint64_t strsize = 0;
    if (options.stack_protector) {
        StringTable strings;
        const std::uint32_t strx = strings.add("___stack_chk_fail");
        Bytes nlist(16, 0);
        Buffer n(nlist);
        n.u32(0, strx);
        n.u8(4, 0x01);  // N_UNDF | N_EXT
        symoff = out.append(nlist, 8);
        std::string padded = strings.data();
        padded.resize(Buffer::align(padded.size(), 8), '\0');
        stroff = out.append(padded, 8);
        strsize = padded.size();
    }

    const std::uint32_t page_size = 1u << options.page_shift;
    const std::string identifier = "org.raven.fixture";
    std::uint64_t sig_offset = 0;
    std::uint32_t sig_size = 0;
    std::uint32_t n_slots = 0;
    std::uint32_t hash_offset = 0;
    if (options.code_signature) {
        sig_offset = Buffer::align(out.size(), 16);
        n_slots = static_cast<std::uint32_t>((sig_offset + page_size - 1) / page_size);
        hash_offset = static_cast<std::uint32_t>(Buffer::align(44 + identifier.size() + 1, 4));
        const std::uint32_t cd_size = hash_offset + n_slots * 32;
        sig_size = 20 + cd_size;
        out.ensure(sig_offset + sig_size);
    }
    const std::uint64_t file_end = out.size();

    // Заголовок
    std::uint32_t flags = 0x00000085;  // NOUNDEFS | DYLDLINK | TWOLEVEL
    if (options.pie) {
        flags |= 0x00200000;
    }
    if (options.allow_stack_execution) {
        flags |= 0x00020000;
    }
    out.u32(0, 0xFEEDFACF);
    out.u32(4, 0x01000007);
    out.u32(8, 3);
    out.u32(12, 2);  // MH_EXECUTE
    out.u32(16, ncmds);
    out.u32(20, sizeofcmds);
    out.u32(24, flags);

    std::size_t lc = 32;

    // LC_SEGMENT_64 __TEXT
    out.u32(lc, LC_SEGMENT_64);
    out.u32(lc + 4, text_cmd);
    put_name16(out, lc + 8, "__TEXT");
    out.u64(lc + 24, 0x100000000ULL);
    out.u64(lc + 32, text_end);
    out.u64(lc + 40, 0);
    out.u64(lc + 48, text_end);
    out.u32(lc + 56, 5);
    out.u32(lc + 60, 5);  // R | X
    out.u32(lc + 64, static_cast<std::uint32_t>(sections.size()));
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const std::size_t s = lc + 72 + i * 80;
        put_name16(out, s, sections[i].sectname);
        put_name16(out, s + 16, "__TEXT");
        out.u64(s + 32, 0x100000000ULL + sections[i].offset);
        out.u64(s + 40, sections[i].content.size());
        out.u32(s + 48, static_cast<std::uint32_t>(sections[i].offset));
        out.u32(s + 52, 4);
        out.u32(s + 64, sections[i].flags);
    }
    lc += text_cmd;

    // LC_SEGMENT_64 __LINKEDIT
    out.u32(lc, LC_SEGMENT_64);
    out.u32(lc + 4, 72);
    put_name16(out, lc + 8, "__LINKEDIT");
    out.u64(lc + 24, 0x100000000ULL + text_end);
    out.u64(lc + 32, Buffer::align(file_end - text_end, 0x1000));
    out.u64(lc + 40, text_end);
    out.u64(lc + 48, file_end - text_end);
    out.u32(lc + 56, 1);
    out.u32(lc + 60, 1);  // R
    lc += 72;

    // LC_MAIN
    out.u32(lc, LC_MAIN);
    out.u32(lc + 4, 24);
    out.u64(lc + 8, sections.front().offset);
    lc += 24;

    for (std::size_t i = 0; i < options.dylibs.size(); ++i) {
        out.u32(lc, LC_LOAD_DYLIB);
        out.u32(lc + 4, dylib_cmds[i]);
        out.u32(lc + 8, 24);
        out.u32(lc + 12, 2);
        out.u32(lc + 16, 0x05000000);  // current 1280.0.0
        out.u32(lc + 20, 0x00010000);  // compatibility 1.0.0
        out.put(lc + 24, options.dylibs[i]);
        lc += dylib_cmds[i];
    }

    if (options.stack_protector) {
        out.u32(lc, LC_SYMTAB);
        out.u32(lc + 4, 24);
        out.u32(lc + 8, static_cast<std::uint32_t>(symoff));
        out.u32(lc + 12, 1);
        out.u32(lc + 16, static_cast<std::uint32_t>(stroff));
        out.u32(lc + 20, static_cast<std::uint32_t>(strsize));
        lc += 24;
    }

    if (options.code_signature) {
        out.u32(lc, LC_CODE_SIGNATURE);
        out.u32(lc + 4, 16);
        out.u32(lc + 8, static_cast<std::uint32_t>(sig_offset));
        out.u32(lc + 12, sig_size);
        lc += 16;

        // SuperBlob (big-endian) с одним CodeDirectory, без CMS
        const std::size_t cd = sig_offset + 20;
        image.code_directory = cd;
        out.be32(sig_offset, 0xFADE0CC0);
        out.be32(sig_offset + 4, sig_size);
        out.be32(sig_offset + 8, 1);
        out.be32(sig_offset + 12, 0);   // CSSLOT_CODEDIRECTORY
        out.be32(sig_offset + 16, 20);  // смещение CodeDirectory

        out.be32(cd, 0xFADE0C02);
        out.be32(cd + 4, sig_size - 20);
        out.be32(cd + 8, 0x20100);
        out.be32(cd + 12, 0x2);  // CS_ADHOC
        out.be32(cd + 16, hash_offset);
        out.be32(cd + 20, 44);
        out.be32(cd + 24, 0);
        out.be32(cd + 28, n_slots);
        out.be32(cd + 32, static_cast<std::uint32_t>(sig_offset));
        out.u8(cd + 36, 32);
        out.u8(cd + 37, 2);  // SHA-256
        out.u8(cd + 38, 0);
        out.u8(cd + 39, options.page_shift);
        out.put(cd + 44, identifier);

        for (std::uint32_t i = 0; i < n_slots; ++i) {
            const std::uint64_t begin = static_cast<std::uint64_t>(i) * page_size;
            const std::uint64_t end = std::min<std::uint64_t>(begin + page_size, sig_offset);
            const Bytes page(image.bytes.begin() + static_cast<std::ptrdiff_t>(begin),
                             image.bytes.begin() + static_cast<std::ptrdiff_t>(end));
            out.put(cd + hash_offset + i * 32, sha256(page));
        }
    }
    return image;
}

// ----------------------------------------------------------------------------
// Artifact
// ----------------------------------------------------------------------------

std::shared_ptr<const Artifact> make_memory_artifact(Bytes bytes,
                                                     const std::filesystem::path& path) {
    auto loaded = make_artifact(std::make_shared<io::MemorySource>(std::move(bytes)), path);
    if (!loaded) {
        throw std::runtime_error("make_artifact failed: " + loaded.error.format());
    }
    return loaded.artifact;
}

// ----------------------------------------------------------------------------
// TempDir
// ----------------------------------------------------------------------------

TempDir::TempDir() {
    // Уникальное имя берём у make_temp_file, файл заменяем каталогом
    path_ = platform::make_temp_file("raven-test-");
    std::filesystem::remove(path_);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write(const std::string& name, const Bytes& bytes) const {
    const std::filesystem::path path = path_ / name;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot create " + path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    return path;
}

std::filesystem::path TempDir::write(const std::string& name, const std::string& text) const {
    return write(name, Bytes(text.begin(), text.end()));
}

}  // namespace raven::test
