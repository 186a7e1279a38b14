// ==============================================================================
// output.cpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: вместо std::endl пишем "\n" явно.
//
// ==============================================================================

#include "eveapi/output.hpp"

#include "eveapi/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace eveapi::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters для таблиц (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

/// Ширина в символах (UTF-8 continuation bytes не считаются)
size_t display_width(const std::string& s) {
    size_t width = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

void flatten_into(const Value& value, std::string& path, std::string& out) {
    if (const auto* leaf = value.get_string()) {
        out += path;
        out += " = ";
        out += quote_string(*leaf);
        out += '\n';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        // Пустой rowset или пустой документ
        out += path.empty() ? std::string("{}") : path + " = {}";
        out += '\n';
        return;
    }

    const size_t base_len = path.size();
    for (const auto& [key, child] : obj) {
        path += format_path_segment(key, base_len == 0);
        flatten_into(child, path, out);
        path.erase(base_len);
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout перенаправляется в файл при --output
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при -q
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::write_value(const Value& value) {
    switch (config_.format) {
    case Format::Json: {
        rapidjson::Document doc = value.to_rapidjson_document();
        write_json(doc);
        write(Stream::Stdout, "\n");
        break;
    }
    case Format::Pretty: {
        rapidjson::Document doc = value.to_rapidjson_document();
        write_json_pretty(doc);
        break;
    }
    case Format::Flat:
        write(Stream::Stdout, format_flat(value));
        break;
    }
    flush();
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(const char* left, const char* middle, const char* right) const {
    const auto widths = column_widths();
    std::string line = left;

    for (size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел отступа с каждой стороны + содержимое
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }

    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    const auto widths = column_widths();
    std::string line = BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;

        size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }

        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    std::string result;

    // ┌───┬───┐
    result += format_line(BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';

        // ├───┼───┤
        result += format_line(BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    // └───┴───┘
    result += format_line(BOX_BL, BOX_BT, BOX_BR);
    result += '\n';

    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Плоский вывод
// ----------------------------------------------------------------------------

std::string format_flat(const Value& value) {
    std::string path;
    std::string out;
    flatten_into(value, path, out);
    return out;
}

std::string format_path_segment(std::string_view key, bool first) {
    bool simple = !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });

    if (simple) {
        return first ? std::string(key) : "." + std::string(key);
    }
    return "[" + quote_string(key) + "]";
}

std::string quote_string(std::string_view s) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    return platform::is_tty(s == Stream::Stdout ? stdout : stderr);
}

}  // namespace eveapi::output
