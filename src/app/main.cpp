// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "eveapi/cli.hpp"
#include "eveapi/client.hpp"
#include "eveapi/config.hpp"
#include "eveapi/method.hpp"
#include "eveapi/output.hpp"
#include "eveapi/platform.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace {

using namespace eveapi;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

output::Format select_format(bool json, bool pretty) {
    if (pretty) {
        return output::Format::Pretty;
    }
    return json ? output::Format::Json : output::Format::Flat;
}

/// Writer для результата: формат команды, при --output вывод в файл
std::unique_ptr<output::Writer> make_result_writer(
    const output::Writer& base, output::Format format,
    const std::optional<std::filesystem::path>& output_path) {
    output::OutputConfig cfg = base.config();
    cfg.format = format;
    cfg.output_path = output_path;
    return std::make_unique<output::Writer>(cfg);
}

/// Прочитать файл целиком ("-" = stdin)
std::optional<std::string> read_input(const std::filesystem::path& path) {
    if (platform::is_stdin_path(path)) {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Прочитать и конвертировать сохранённый ответ
std::optional<Value> load_response(const std::filesystem::path& path, output::Writer& writer) {
    const std::string path_str = platform::display_path(path);
    auto xml = read_input(path);
    if (!xml.has_value()) {
        writer.error("failed to read '" + path_str + "'");
        return std::nullopt;
    }

    writer.debug("Read " + std::to_string(xml->size()) + " bytes from " + path_str);

    ApiResult result = parse_response(*xml);
    if (!result) {
        writer.error(path_str + ": " + result.error->message);
        return std::nullopt;
    }
    return std::move(result.value);
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_request(const cli::RequestCommand& cmd, output::Writer& writer) {
    config::ClientConfig client_cfg = config::default_config();
    if (cmd.config.has_value()) {
        config::ConfigResult loaded = config::load_config(*cmd.config);
        if (!loaded) {
            writer.write(output::Stream::Stderr, loaded.format(*cmd.config));
            return 1;
        }
        client_cfg = std::move(loaded.config);
        writer.debug("Loaded config from " + platform::path_to_utf8(*cmd.config));
    }

    // Флаги командной строки перекрывают файл
    if (cmd.host.has_value()) {
        client_cfg.api_home = *cmd.host;
    }
    if (cmd.http) {
        client_cfg.use_https = false;
    }
    if (cmd.timeout.has_value()) {
        client_cfg.timeout_seconds = *cmd.timeout;
    }
    if (client_cfg.api_home.empty()) {
        writer.error("API host must not be empty");
        return 1;
    }

    Client client(client_cfg, &writer);
    auto method = client.method(cmd.method);
    if (!method.has_value()) {
        writer.error("unknown API method '" + cmd.method +
                     "' (see 'eveapi methods' or pass a path like /server/ServerStatus)");
        return 1;
    }

    auto out = make_result_writer(writer, select_format(cmd.json, cmd.pretty), cmd.output);
    if (cmd.output.has_value() && !out->has_output_file()) {
        writer.error("failed to open output file '" + platform::path_to_utf8(*cmd.output) + "'");
        return 1;
    }

    RequestOptions options;
    options.return_xml = cmd.xml;
    ApiResult result = client.send_request(*method, cmd.params, options);

    if (result.raw_xml.has_value()) {
        out->write(output::Stream::Stdout, *result.raw_xml);
        if (result.raw_xml->empty() || result.raw_xml->back() != '\n') {
            out->write(output::Stream::Stdout, "\n");
        }
    }

    if (!result) {
        writer.write(output::Stream::Stderr, result.error->format());
        return 1;
    }

    out->write_value(result.value);
    return 0;
}

int run_convert(const cli::ConvertCommand& cmd, output::Writer& writer) {
    auto out = make_result_writer(writer, select_format(cmd.json, cmd.pretty), cmd.output);
    if (cmd.output.has_value() && !out->has_output_file()) {
        writer.error("failed to open output file '" + platform::path_to_utf8(*cmd.output) + "'");
        return 1;
    }

    int exit_code = 0;
    for (const auto& path : cmd.paths) {
        if (cmd.paths.size() > 1) {
            writer.info("Converting " + platform::display_path(path));
        }
        auto value = load_response(path, writer);
        if (!value.has_value()) {
            exit_code = 1;
            continue;
        }
        out->write_value(*value);
    }
    return exit_code;
}

int run_get(const cli::GetCommand& cmd, output::Writer& writer) {
    auto value = load_response(cmd.path, writer);
    if (!value.has_value()) {
        return 1;
    }

    const Value* found = value->find(std::string_view(cmd.key_path));
    if (found == nullptr) {
        writer.error("path '" + cmd.key_path + "' not found");
        return 1;
    }

    if (const auto* leaf = found->get_string()) {
        writer.write_line(output::Stream::Stdout, *leaf);
    } else {
        writer.write_value(*found);
    }
    return 0;
}

int run_methods(output::Writer& writer) {
    output::Table table;
    table.set_headers({"NAME", "PATH"});
    for (const auto& entry : method_catalog()) {
        table.add_row({entry.name, entry.path});
    }
    table.print(writer);
    writer.info(std::to_string(table.row_count()) + " methods");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RequestCommand>) {
                return run_request(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::ConvertCommand>) {
                return run_convert(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::GetCommand>) {
                return run_get(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::MethodsCommand>) {
                return run_methods(writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения, формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
