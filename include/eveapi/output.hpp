// ==============================================================================
// eveapi/output.hpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами [+] [!] [x] [*] [~]
// - Вывод результата: плоский список путей / JSON / pretty JSON
// - Таблицы (каталог методов)
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef EVEAPI_OUTPUT_HPP
#define EVEAPI_OUTPUT_HPP

#include <eveapi/value.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eveapi::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода результата
// ----------------------------------------------------------------------------

enum class Format {
    Flat,   // path = "value", одна строка на лист
    Json,   // компактный JSON
    Pretty  // JSON с отступами
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;            // -q: подавить informational stderr
    int verbose = 0;               // -v: уровень подробности (0..2+)
    Format format = Format::Flat;  // Формат вывода результата

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Вывод результата
    // -------------------------------------------------------------------------

    /// Записать Value в формате config().format
    void write_value(const Value& value);

    /// Записать JSON значение
    void write_json(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Префикс сообщения, окрашенный при выводе в TTY
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w);

    /// Вывести таблицу в строку (Unicode box-drawing)
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(const char* left, const char* middle, const char* right) const;

    std::string format_row(const std::vector<std::string>& cells) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Плоское представление: по строке на лист, "a.b[\"c d\"].text = \"value\"\n".
/// Пустой объект выводится как "path = {}".
std::string format_flat(const Value& value);

/// Ключ пути: простой идентификатор через точку, иначе ["..."]
std::string format_path_segment(std::string_view key, bool first);

/// Строка в кавычках с JSON-экранированием
std::string quote_string(std::string_view s);

/// ANSI-последовательность цвета префикса ("" для Color::Default)
std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace eveapi::output

#endif  // EVEAPI_OUTPUT_HPP
