// ==============================================================================
// config.cpp - Загрузка конфигурации клиента (yaml-cpp)
// ==============================================================================

#include "eveapi/config.hpp"

#include "eveapi/method.hpp"
#include "eveapi/platform.hpp"

#include <fstream>
#include <functional>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace eveapi::config {

namespace {

/// Применить ключи YAML к конфигурации. Неверный тип -> исключение yaml-cpp.
void apply_yaml(const YAML::Node& root, ClientConfig& cfg) {
    if (!root || root.IsNull()) {
        // Пустой файл: остаются значения по умолчанию
        return;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a mapping");
    }

    if (root["api_home"]) {
        cfg.api_home = root["api_home"].as<std::string>();
        if (cfg.api_home.empty()) {
            throw std::runtime_error("'api_home' must not be empty");
        }
    }
    if (root["use_https"]) {
        cfg.use_https = root["use_https"].as<bool>();
    }
    if (root["timeout"]) {
        cfg.timeout_seconds = root["timeout"].as<long>();
        if (cfg.timeout_seconds < 0) {
            throw std::runtime_error("'timeout' must not be negative");
        }
    }
    if (root["user_agent"]) {
        cfg.user_agent = root["user_agent"].as<std::string>();
    }
}

ConfigResult parse_node(const std::function<YAML::Node()>& load) {
    ConfigResult result;
    result.config = default_config();

    try {
        apply_yaml(load(), result.config);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

}  // anonymous namespace

ClientConfig default_config() {
    ClientConfig cfg;
    cfg.api_home = EVE_API_URL;
    cfg.use_https = true;
    cfg.timeout_seconds = 30;
    cfg.user_agent = platform::user_agent(std::string("eveapi-cpp/") + VERSION);
    return cfg;
}

std::string ConfigResult::format(const std::filesystem::path& path) const {
    return "[!] failed to load config '" + platform::path_to_utf8(path) + "' - " + error + "\n";
}

ConfigResult load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ConfigResult result;
        result.config = default_config();
        result.error = "cannot open config file";
        return result;
    }
    return parse_node([&file]() { return YAML::Load(file); });
}

ConfigResult parse_config(const std::string& yaml_text) {
    return parse_node([&yaml_text]() { return YAML::Load(yaml_text); });
}

}  // namespace eveapi::config
