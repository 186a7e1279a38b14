// ==============================================================================
// cli.cpp - Парсинг командной строки
// ==============================================================================
//
// Собственный парсер argv: подкоманда, затем её опции и позиционные аргументы.
// Ошибки использования возвращаются как CliDiagnostic с exit code 2.
//
// ==============================================================================

#include "eveapi/cli.hpp"

#include "eveapi/config.hpp"
#include "eveapi/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace eveapi::cli {

namespace {

constexpr const char* USAGE_MAIN = "Usage: eveapi [OPTIONS] <COMMAND>";
constexpr const char* USAGE_REQUEST = "Usage: eveapi request [OPTIONS] <METHOD>";
constexpr const char* USAGE_CONVERT = "Usage: eveapi convert [OPTIONS] <FILE>...";
constexpr const char* USAGE_GET = "Usage: eveapi get <FILE> <PATH>";
constexpr const char* USAGE_METHODS = "Usage: eveapi methods";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// "-v", "-vv", "-vvv"...
int count_verbose_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int count = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++count;
    }
    return count;
}

bool is_help_flag(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

/// Глобальные флаги допустимы и после подкоманды
bool consume_global_flag(const char* arg, GlobalOptions& global) {
    if (int v = count_verbose_flag(arg); v > 0) {
        global.verbose += v;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
        return true;
    }
    return false;
}

void fail(ParseResult& result, const std::string& message, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, usage);
}

/// Значение опции из следующего аргумента
bool take_value(int argc, char** argv, int& i, const char* option, const char* value_name,
                std::string& out, ParseResult& result, const char* usage) {
    if (i + 1 >= argc) {
        fail(result,
             std::string("error: a value is required for '") + option + " <" + value_name +
                 ">' but none was supplied",
             usage);
        return false;
    }
    ++i;
    out = argv[i];
    return true;
}

void unexpected_argument(ParseResult& result, const char* arg, const char* usage) {
    fail(result, std::string("error: unexpected argument '") + arg + "' found", usage);
}

bool parse_param(const std::string& text, RequestParams& params, ParseResult& result) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        fail(result,
             "error: invalid value '" + text + "' for '--param <KEY=VALUE>': expected KEY=VALUE",
             USAGE_REQUEST);
        return false;
    }
    params.insert_or_assign(text.substr(0, eq), text.substr(eq + 1));
    return true;
}

bool parse_timeout(const std::string& text, std::optional<long>& timeout, ParseResult& result) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end == nullptr || *end != '\0' || errno == ERANGE || value < 0) {
        fail(result,
             "error: invalid value '" + text +
                 "' for '--timeout <SECS>': expected a non-negative integer",
             USAGE_REQUEST);
        return false;
    }
    timeout = value;
    return true;
}

bool check_format_conflict(bool json, bool pretty, ParseResult& result, const char* usage) {
    if (json && pretty) {
        fail(result, "error: the argument '--json' cannot be used with '--pretty'", usage);
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Парсеры подкоманд
// ----------------------------------------------------------------------------

void parse_request(int argc, char** argv, int start, ParseResult& result) {
    RequestCommand cmd;
    bool have_method = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (is_help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"request"};
            return;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-p") || str_eq(arg, "--param")) {
            if (!take_value(argc, argv, i, "--param", "KEY=VALUE", value, result, USAGE_REQUEST) ||
                !parse_param(value, cmd.params, result)) {
                return;
            }
        } else if (str_eq(arg, "--host")) {
            if (!take_value(argc, argv, i, "--host", "HOST", value, result, USAGE_REQUEST)) {
                return;
            }
            cmd.host = value;
        } else if (str_eq(arg, "--http")) {
            cmd.http = true;
        } else if (str_eq(arg, "--timeout")) {
            if (!take_value(argc, argv, i, "--timeout", "SECS", value, result, USAGE_REQUEST) ||
                !parse_timeout(value, cmd.timeout, result)) {
                return;
            }
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (!take_value(argc, argv, i, "--config", "FILE", value, result, USAGE_REQUEST)) {
                return;
            }
            cmd.config = platform::path_from_utf8(value);
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--pretty")) {
            cmd.pretty = true;
        } else if (str_eq(arg, "--xml")) {
            cmd.xml = true;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (!take_value(argc, argv, i, "--output", "FILE", value, result, USAGE_REQUEST)) {
                return;
            }
            cmd.output = platform::path_from_utf8(value);
        } else if (arg[0] == '-') {
            unexpected_argument(result, arg, USAGE_REQUEST);
            return;
        } else if (!have_method) {
            cmd.method = arg;
            have_method = true;
        } else {
            unexpected_argument(result, arg, USAGE_REQUEST);
            return;
        }
    }

    if (!have_method) {
        fail(result,
             "error: the following required arguments were not provided:\n  <METHOD>",
             USAGE_REQUEST);
        return;
    }
    if (!check_format_conflict(cmd.json, cmd.pretty, result, USAGE_REQUEST)) {
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_convert(int argc, char** argv, int start, ParseResult& result) {
    ConvertCommand cmd;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (is_help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"convert"};
            return;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--pretty")) {
            cmd.pretty = true;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (!take_value(argc, argv, i, "--output", "FILE", value, result, USAGE_CONVERT)) {
                return;
            }
            cmd.output = platform::path_from_utf8(value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            unexpected_argument(result, arg, USAGE_CONVERT);
            return;
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    if (cmd.paths.empty()) {
        fail(result, "error: the following required arguments were not provided:\n  <FILE>...",
             USAGE_CONVERT);
        return;
    }
    if (!check_format_conflict(cmd.json, cmd.pretty, result, USAGE_CONVERT)) {
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_get(int argc, char** argv, int start, ParseResult& result) {
    std::vector<const char*> positional;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (is_help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"get"};
            return;
        } else if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            unexpected_argument(result, arg, USAGE_GET);
            return;
        }
        positional.push_back(arg);
    }

    if (positional.size() < 2) {
        fail(result,
             positional.empty()
                 ? "error: the following required arguments were not provided:\n  <FILE>\n  <PATH>"
                 : "error: the following required arguments were not provided:\n  <PATH>",
             USAGE_GET);
        return;
    }
    if (positional.size() > 2) {
        unexpected_argument(result, positional[2], USAGE_GET);
        return;
    }

    GetCommand cmd;
    cmd.path = platform::path_from_utf8(positional[0]);
    cmd.key_path = positional[1];
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_methods(int argc, char** argv, int start, ParseResult& result) {
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (is_help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"methods"};
            return;
        } else if (!consume_global_flag(arg, result.global)) {
            unexpected_argument(result, arg, USAGE_METHODS);
            return;
        }
    }
    result.ok = true;
    result.command = MethodsCommand{};
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("eveapi ") + config::VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: eveapi [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  request  Send a request to the EVE API and print the converted response\n"
               "  convert  Convert saved XML responses without network access\n"
               "  get      Print a single value from a saved XML response\n"
               "  methods  List known API methods\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -v...          Print verbose output\n"
               "  -q, --quiet    Suppress informational messages\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Check the server status:\n"
               "        ./eveapi request SERVER_STATUS\n"
               "\n"
               "    List characters of an account as JSON:\n"
               "        ./eveapi request ACCOUNT_CHARACTERS -p keyID=123 -p vCode=abc --pretty\n"
               "\n"
               "    Read one field from a saved response:\n"
               "        ./eveapi get status.xml eveapi.result.onlinePlayers.text\n";
    } else if (*command == "request") {
        return "Send a request to the EVE API and print the converted response\n"
               "\n"
               "Usage: eveapi request [OPTIONS] <METHOD>\n"
               "\n"
               "Arguments:\n"
               "  <METHOD>  Method name (SERVER_STATUS) or path (/server/ServerStatus)\n"
               "\n"
               "Options:\n"
               "  -p, --param <KEY=VALUE>  Request parameter (repeatable)\n"
               "      --host <HOST>        API host name\n"
               "      --http               Use plain HTTP instead of HTTPS\n"
               "      --timeout <SECS>     Request timeout in seconds (0 = no limit)\n"
               "  -c, --config <FILE>      Load client settings from a YAML file\n"
               "  -j, --json               Output as JSON\n"
               "      --pretty             Output as indented JSON\n"
               "      --xml                Also print the raw XML response\n"
               "  -o, --output <FILE>      Save output to a file\n"
               "  -h, --help               Print help\n";
    } else if (*command == "convert") {
        return "Convert saved XML responses without network access\n"
               "\n"
               "Usage: eveapi convert [OPTIONS] <FILE>...\n"
               "\n"
               "Arguments:\n"
               "  <FILE>...  XML responses to convert ('-' reads stdin)\n"
               "\n"
               "Options:\n"
               "  -j, --json           Output as JSON\n"
               "      --pretty         Output as indented JSON\n"
               "  -o, --output <FILE>  Save output to a file\n"
               "  -h, --help           Print help\n";
    } else if (*command == "get") {
        return "Print a single value from a saved XML response\n"
               "\n"
               "Usage: eveapi get <FILE> <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <FILE>  XML response to read\n"
               "  <PATH>  Dotted key path (eveapi.result.serverOpen.text)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "methods") {
        return "List known API methods\n"
               "\n"
               "Usage: eveapi methods\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (consume_global_flag(arg, result.global)) {
            continue;
        } else if (is_help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            unexpected_argument(result, arg, USAGE_MAIN);
            return result;
        }
        cmd_idx = i;
        break;
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "request")) {
        parse_request(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "convert")) {
        parse_convert(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "get")) {
        parse_get(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "methods")) {
        parse_methods(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        fail(result, std::string("error: unrecognized subcommand '") + cmd + "'", USAGE_MAIN);
    }

    return result;
}

}  // namespace eveapi::cli
