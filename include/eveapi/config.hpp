// ==============================================================================
// eveapi/config.hpp - Конфигурация клиента (YAML)
// ==============================================================================
//
// Формат файла (все ключи опциональны, неизвестные игнорируются):
//
//   api_home: api.eve-central.com
//   use_https: true
//   timeout: 30
//   user_agent: eveapi-cpp/1.1
//
// Флаги командной строки перекрывают значения из файла.
//
// ==============================================================================

#ifndef EVEAPI_CONFIG_HPP
#define EVEAPI_CONFIG_HPP

#include <filesystem>
#include <string>

namespace eveapi::config {

/// Версия библиотеки и CLI
constexpr const char* VERSION = "1.1.0";

struct ClientConfig {
    std::string api_home;      // Хост API
    bool use_https = true;     // HTTPS вместо HTTP
    long timeout_seconds = 30; // 0 = без ограничения
    std::string user_agent;    // Заголовок User-Agent
};

/// Значения по умолчанию
ClientConfig default_config();

/// Результат загрузки конфигурации
struct ConfigResult {
    bool ok = false;
    ClientConfig config;
    std::string error;

    explicit operator bool() const { return ok; }

    /// "[!] failed to load config '<path>' - <error>\n"
    std::string format(const std::filesystem::path& path) const;
};

/// Загрузить конфигурацию из YAML файла поверх default_config()
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML текста поверх default_config()
ConfigResult parse_config(const std::string& yaml_text);

}  // namespace eveapi::config

#endif  // EVEAPI_CONFIG_HPP
