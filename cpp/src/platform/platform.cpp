// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Пути храним как std::filesystem::path, наружу отдаём UTF-8.
// Вся работа с WinAPI / POSIX собрана здесь.
//
// ==============================================================================

#include "raven/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <stdlib.h>
#include <unistd.h>
#endif

namespace raven::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::string lower_extension(const std::filesystem::path& p) {
    std::string ext = path_to_utf8(p.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix) {
    std::error_code ec;
    const std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("temporary directory is unavailable: " + ec.message());
    }
#ifdef _WIN32
    // GetTempFileNameW берёт не больше трёх символов префикса
    const std::wstring wprefix = path_from_utf8(prefix.substr(0, 3)).native();
    wchar_t name[MAX_PATH + 1];
    if (GetTempFileNameW(dir.c_str(), wprefix.c_str(), 0, name) == 0) {
        throw std::runtime_error("cannot create temporary file in " + path_to_utf8(dir));
    }
    return std::filesystem::path(name);
#else
    std::string pattern = path_to_utf8(dir / std::string(prefix)) + "_XXXXXX";
    const int fd = mkstemp(pattern.data());
    if (fd == -1) {
        throw std::runtime_error("cannot create temporary file in " + path_to_utf8(dir));
    }
    close(fd);
    return std::filesystem::path(pattern);
#endif
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::string format_utc_rfc3339(std::int64_t unix_seconds) {
    const std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
#ifdef _WIN32
    if (gmtime_s(&tm, &t) != 0) {
        return {};
    }
#else
    if (gmtime_r(&t, &tm) == nullptr) {
        return {};
    }
#endif
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

}  // namespace raven::platform
