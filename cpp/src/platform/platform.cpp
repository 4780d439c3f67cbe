// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8
// Платформенная специфика изолирована здесь
//
// ==============================================================================

#include "repoguard/platform.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace repoguard::platform {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

fs::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return fs::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return fs::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return fs::path(u8str);
#endif
}

std::string path_to_utf8(const fs::path& p) {
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
// Права доступа
// ----------------------------------------------------------------------------

bool is_executable(const fs::path& p) {
#ifdef _WIN32
    (void)p;
    return false;
#else
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (ec) {
        return false;
    }
    const fs::perms any_exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (st.permissions() & any_exec) != fs::perms::none;
#endif
}

bool is_writable(const fs::path& p) {
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (ec) {
        return false;
    }
    // Снятый owner_write считается запретом и для root
    if ((st.permissions() & fs::perms::owner_write) == fs::perms::none) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(p.c_str(), W_OK) == 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

namespace {

std::string generate_random_suffix(size_t length = 8) {
    static const char chars[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += chars[dis(gen)];
    }
    return result;
}

#ifndef _WIN32
// mkstemp() в каталоге dir; возвращает открытый дескриптор
int open_temp_in(const fs::path& dir, std::string_view prefix, std::string& out_path) {
    std::string tmpl = (dir / (std::string(".") + std::string(prefix) + "_XXXXXX")).string();
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("failed to create temp file in '" + dir.string() +
                                 "': " + std::strerror(errno));
    }
    out_path = tmpl_buf.data();
    return fd;
}
#endif

}  // namespace

void replace_file_atomic(const fs::path& target, std::string_view bytes) {
    fs::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    fs::perms original_perms = fs::status(target, ec).permissions();
    if (ec) {
        throw std::runtime_error("failed to stat '" + path_to_utf8(target) + "': " + ec.message());
    }
    // rename() требует только права на каталог, поэтому запись в сам файл проверяется явно
    if (!is_writable(target)) {
        throw std::runtime_error("'" + path_to_utf8(target) + "' is not writable");
    }

#ifdef _WIN32
    fs::path tmp = dir / (".repoguard_" + generate_random_suffix() + ".tmp");
    {
        HANDLE h = CreateFileW(tmp.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_TEMPORARY, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            throw std::runtime_error("failed to create temp file in '" + path_to_utf8(dir) + "'");
        }
        CloseHandle(h);
    }
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw std::runtime_error("failed to write temp file for '" + path_to_utf8(target) + "'");
        }
    }
#else
    std::string tmp_str;
    int fd = open_temp_in(dir, "repoguard_" + generate_random_suffix(4), tmp_str);
    fs::path tmp(tmp_str);

    // Пишем всё содержимое, затем fsync: после rename файл либо старый, либо новый целиком
    const char* data = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            close(fd);
            fs::remove(tmp, ec);
            throw std::runtime_error("failed to write temp file for '" + target.string() +
                                     "': " + reason);
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    // Новый файл получает владельца исходного; не удалось - замена отменяется
    struct stat target_st {};
    if (::stat(target.c_str(), &target_st) != 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        fs::remove(tmp, ec);
        throw std::runtime_error("failed to stat '" + target.string() + "': " + reason);
    }
    if (target_st.st_uid != geteuid() || target_st.st_gid != getegid()) {
        if (fchown(fd, target_st.st_uid, target_st.st_gid) != 0) {
            std::string reason = std::strerror(errno);
            close(fd);
            fs::remove(tmp, ec);
            throw std::runtime_error("cannot preserve owner of '" + target.string() + "': " + reason);
        }
    }

    if (fsync(fd) != 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        fs::remove(tmp, ec);
        throw std::runtime_error("failed to sync temp file for '" + target.string() + "': " + reason);
    }
    close(fd);
#endif

    fs::permissions(tmp, original_perms, fs::perm_options::replace, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("failed to copy permissions to temp file for '" +
                                 path_to_utf8(target) + "': " + reason);
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("failed to replace '" + path_to_utf8(target) + "': " + reason);
    }
}

// ----------------------------------------------------------------------------
// Прерывание
// ----------------------------------------------------------------------------

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt_signal(int) {
    g_interrupted.store(true);
}

}  // namespace

void install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt_signal);
    std::signal(SIGTERM, on_interrupt_signal);
}

std::atomic<bool>& interrupt_flag() {
    return g_interrupted;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace repoguard::platform
