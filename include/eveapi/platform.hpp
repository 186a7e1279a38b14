// ==============================================================================
// eveapi/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Пути из аргументов командной строки (UTF-8) и обратно для сообщений
// - Имя "-" как стандартный ввод для convert/get
// - Определение TTY для цветного вывода Writer
// - Строка User-Agent с именем ОС
//
// ==============================================================================

#ifndef EVEAPI_PLATFORM_HPP
#define EVEAPI_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace eveapi::platform {

/// Аргумент командной строки (UTF-8) -> path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// Путь "-" обозначает stdin
bool is_stdin_path(const std::filesystem::path& p);

/// Имя входа для сообщений: "<stdin>" для "-", иначе UTF-8 путь
std::string display_path(const std::filesystem::path& p);

/// Поток подключён к терминалу
bool is_tty(std::FILE* stream);

/// "Linux", "macOS", "Windows" или "Unknown"
std::string os_name();

/// "<product> (<ОС>)"
std::string user_agent(std::string_view product);

}  // namespace eveapi::platform

#endif  // EVEAPI_PLATFORM_HPP
