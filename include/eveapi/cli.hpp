// ==============================================================================
// eveapi/cli.hpp - Парсинг командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef EVEAPI_CLI_HPP
#define EVEAPI_CLI_HPP

#include <eveapi/method.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace eveapi::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// request - запрос к EVE API
struct RequestCommand {
    std::string method;                           // имя из каталога или "/group/Name"
    RequestParams params;                         // -p, --param KEY=VALUE
    std::optional<std::string> host;              // --host
    bool http = false;                            // --http
    std::optional<long> timeout;                  // --timeout
    std::optional<std::filesystem::path> config;  // --config
    bool json = false;                            // -j, --json
    bool pretty = false;                          // --pretty
    bool xml = false;                             // --xml
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// convert - конвертация сохранённых XML ответов
struct ConvertCommand {
    std::vector<std::filesystem::path> paths;
    bool json = false;
    bool pretty = false;
    std::optional<std::filesystem::path> output;
};

/// get - одно значение по пути через точку
struct GetCommand {
    std::filesystem::path path;
    std::string key_path;
};

/// methods - каталог методов
struct MethodsCommand {};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RequestCommand, ConvertCommand, GetCommand, MethodsCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Сообщение об ошибке использования с подсказкой
std::string render_usage_error(const std::string& error_msg, const char* usage);

/// Описание программы
constexpr const char* ABOUT = "Query the EVE Online XML API and convert responses to nested maps";

}  // namespace eveapi::cli

#endif  // EVEAPI_CLI_HPP
