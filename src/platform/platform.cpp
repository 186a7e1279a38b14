// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "eveapi/platform.hpp"

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace eveapi::platform {

namespace {

constexpr std::string_view STDIN_NAME = "-";

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_stdin_path(const std::filesystem::path& p) {
    return path_to_utf8(p) == STDIN_NAME;
}

std::string display_path(const std::filesystem::path& p) {
    return is_stdin_path(p) ? std::string("<stdin>") : path_to_utf8(p);
}

// ----------------------------------------------------------------------------
// Терминал
// ----------------------------------------------------------------------------

bool is_tty(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// User-Agent
// ----------------------------------------------------------------------------

std::string os_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

std::string user_agent(std::string_view product) {
    std::string ua(product);
    ua += " (";
    ua += os_name();
    ua += ')';
    return ua;
}

}  // namespace eveapi::platform
