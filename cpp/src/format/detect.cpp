// ==============================================================================
// detect.cpp - Определение формата по сигнатуре
// ==============================================================================
//
// Сигнатуры:
// - ELF:    7F 45 4C 46
// - PE:     4D 5A ("MZ"), e_lfanew по смещению 0x3C -> "PE\0\0"
// - Mach-O: FEEDFACE / FEEDFACF (оба порядка байт), CAFEBABE (fat)
//
// ==============================================================================

#include <raven/format.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace raven::format {

namespace {

constexpr std::uint32_t MH_MAGIC = 0xFEEDFACE;
constexpr std::uint32_t MH_CIGAM = 0xCEFAEDFE;
constexpr std::uint32_t MH_MAGIC_64 = 0xFEEDFACF;
constexpr std::uint32_t MH_CIGAM_64 = 0xCFFAEDFE;
constexpr std::uint32_t FAT_MAGIC = 0xCAFEBABE;
constexpr std::uint32_t FAT_CIGAM = 0xBEBAFECA;

std::uint32_t read_u32_be(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint32_t read_u32_le(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

const char* format_kind_to_string(FormatKind kind) {
    switch (kind) {
    case FormatKind::Elf:
        return "ELF";
    case FormatKind::Pe:
        return "PE";
    case FormatKind::MachO:
        return "MachO";
    case FormatKind::Unknown:
    default:
        return "Unknown";
    }
}

std::optional<FormatKind> parse_format_kind(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "elf") {
        return FormatKind::Elf;
    }
    if (n == "pe" || n == "pe32" || n == "pe32+") {
        return FormatKind::Pe;
    }
    if (n == "macho" || n == "mach-o") {
        return FormatKind::MachO;
    }
    if (n == "unknown") {
        return FormatKind::Unknown;
    }
    return std::nullopt;
}

std::optional<FormatKind> format_from_extension(std::string_view ext_lower) {
    if (ext_lower == "exe" || ext_lower == "dll" || ext_lower == "sys" || ext_lower == "efi") {
        return FormatKind::Pe;
    }
    if (ext_lower == "so" || ext_lower == "elf") {
        return FormatKind::Elf;
    }
    if (ext_lower == "dylib" || ext_lower == "bundle") {
        return FormatKind::MachO;
    }
    return std::nullopt;
}

DetectResult detect_format(const std::uint8_t* data, std::size_t size) {
    DetectResult result;
    if (data == nullptr || size < MIN_SIGNATURE_LENGTH) {
        result.error = DetectErrorKind::Truncated;
        result.message = "need at least " + std::to_string(MIN_SIGNATURE_LENGTH) +
                         " bytes to classify, got " + std::to_string(size);
        return result;
    }

    result.ok = true;

    if (data[0] == 0x7F && data[1] == 'E' && data[2] == 'L' && data[3] == 'F') {
        result.kind = FormatKind::Elf;
        return result;
    }

    const std::uint32_t be = read_u32_be(data);
    if (be == MH_MAGIC || be == MH_CIGAM || be == MH_MAGIC_64 || be == MH_CIGAM_64 ||
        be == FAT_MAGIC || be == FAT_CIGAM) {
        // CAFEBABE также у Java class-файлов; отличаем по числу архитектур
        if (be == FAT_MAGIC && size >= 8 && read_u32_be(data + 4) >= 0x2D) {
            result.kind = FormatKind::Unknown;
            return result;
        }
        result.kind = FormatKind::MachO;
        return result;
    }

    if (data[0] == 'M' && data[1] == 'Z') {
        // Если e_lfanew и "PE\0\0" видны в окне - проверяем их. Иначе оставляем PE:
        // ошибку заголовка сообщит парсер.
        if (size >= 0x40) {
            const std::uint32_t lfanew = read_u32_le(data + 0x3C);
            if (static_cast<std::uint64_t>(lfanew) + 4 <= size) {
                const std::uint8_t* sig = data + lfanew;
                if (!(sig[0] == 'P' && sig[1] == 'E' && sig[2] == 0 && sig[3] == 0)) {
                    // Чистый DOS MZ без PE-заголовка
                    result.kind = FormatKind::Unknown;
                    return result;
                }
            }
        }
        result.kind = FormatKind::Pe;
        return result;
    }

    result.kind = FormatKind::Unknown;
    return result;
}

DetectResult detect_format(const io::ByteSource& source) {
    const std::uint64_t total = source.size();
    std::vector<std::uint8_t> head;
    const std::size_t window = static_cast<std::size_t>(std::min<std::uint64_t>(DETECT_WINDOW, total));
    if (!source.read(0, window, head)) {
        head.clear();
    }

    // Для MZ дочитываем 4 байта по e_lfanew, если они за пределами окна
    if (head.size() >= 0x40 && head[0] == 'M' && head[1] == 'Z') {
        const std::uint32_t lfanew = read_u32_le(head.data() + 0x3C);
        if (static_cast<std::uint64_t>(lfanew) + 4 > head.size() &&
            static_cast<std::uint64_t>(lfanew) + 4 <= total) {
            std::vector<std::uint8_t> sig;
            if (source.read(lfanew, 4, sig)) {
                if (!(sig[0] == 'P' && sig[1] == 'E' && sig[2] == 0 && sig[3] == 0)) {
                    DetectResult result;
                    result.ok = true;
                    result.kind = FormatKind::Unknown;
                    return result;
                }
            }
        }
    }

    return detect_format(head.data(), head.size());
}

}  // namespace raven::format
