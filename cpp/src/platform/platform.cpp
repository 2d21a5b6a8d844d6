// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика (POSIX вызовы) изолирована здесь.
//
// ==============================================================================

#include "chatx/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace chatx::platform {

namespace {

std::string temp_root() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        return tmpdir;
    }
    return "/tmp";
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(std::string(u8str));
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

// ----------------------------------------------------------------------------
// Приватные каталоги
// ----------------------------------------------------------------------------

std::filesystem::path make_private_dir(std::string_view prefix,
                                       const std::filesystem::path& parent) {
    std::string root = parent.empty() ? temp_root() : path_to_utf8(parent);
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw std::runtime_error("Failed to create work directory " + root + ": " + ec.message());
    }

    std::string tmpl = root + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    // mkdtemp создаёт каталог с правами 0700
    if (mkdtemp(tmpl_buf.data()) == nullptr) {
        throw std::runtime_error("Failed to create private directory under " + root);
    }
    if (chmod(tmpl_buf.data(), S_IRWXU) != 0) {
        throw std::runtime_error("Failed to restrict permissions on " +
                                 std::string(tmpl_buf.data()));
    }

    return std::filesystem::path(tmpl_buf.data());
}

// ----------------------------------------------------------------------------
// Домашний каталог
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> home_dir() {
    if (auto home = get_env("HOME")) {
        return std::filesystem::path(*home);
    }
    const struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr && pw->pw_dir[0] != '\0') {
        return std::filesystem::path(pw->pw_dir);
    }
    return std::nullopt;
}

std::filesystem::path expand_home(std::string_view path, const std::filesystem::path& home) {
    if (path == "~") {
        return home;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home / path_from_utf8(path.substr(2));
    }
    return path_from_utf8(path);
}

std::string redact_path(std::string_view path, const std::filesystem::path& home) {
    std::string home_str = path_to_utf8(home);
    while (home_str.size() > 1 && home_str.back() == '/') {
        home_str.pop_back();
    }
    if (home_str.empty() || home_str == "/") {
        return std::string(path);
    }
    if (path == home_str) {
        return "~";
    }
    if (path.size() > home_str.size() && path.compare(0, home_str.size(), home_str) == 0 &&
        path[home_str.size()] == '/') {
        return "~" + std::string(path.substr(home_str.size()));
    }
    return std::string(path);
}

std::string redact_path(std::string_view path) {
    auto home = home_dir();
    if (!home) {
        return std::string(path);
    }
    return redact_path(path, *home);
}

// ----------------------------------------------------------------------------
// Прочее
// ----------------------------------------------------------------------------

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string os_name() {
#if defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace chatx::platform
