// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Writer, плоский формат, JSON, таблицы, вывод в файл.
//
// ==============================================================================

#include "eveapi/output.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

namespace eveapi::output::test {

namespace fs = std::filesystem;

namespace {

Value make_result() {
    Value::Object characters;
    characters.emplace("499939401", Value(Value::Object{{"name", Value("Alpha")}}));

    Value::Object result;
    result.emplace("characters", Value(std::move(characters)));
    result.emplace("serverOpen", Value(Value::Object{{"text", Value("True")}}));

    return Value(Value::Object{{"eveapi", Value(Value::Object{{"result", Value(std::move(result))}})}});
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Записать значение через Writer в файл и вернуть содержимое
std::string render_to_file(const Value& value, Format format, const std::string& name) {
    fs::path path = fs::temp_directory_path() / name;
    {
        OutputConfig config;
        config.quiet = true;
        config.format = format;
        config.output_path = path;
        Writer writer(config);
        EXPECT_TRUE(writer.has_output_file());
        writer.write_value(value);
    }
    std::string content = read_file(path);
    fs::remove(path);
    return content;
}

}  // namespace

// ==============================================================================
// Writer
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_CreatesSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });
}

TEST(OutputTest, Writer_Messages_DoNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);
    EXPECT_NO_THROW({
        writer.info("info message");
        writer.warn("warn message");
        writer.error("error message");
        writer.debug("debug message");
        writer.trace("trace message");
    });
}

TEST(OutputTest, Writer_NoOutputPath_NoFile) {
    OutputConfig config;
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

TEST(OutputTest, Writer_OutputToFile_WritesStdoutBytes) {
    fs::path path = fs::temp_directory_path() / "eveapi_test_writer.txt";
    {
        OutputConfig config;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_line(Stream::Stdout, "first");
        writer.write(Stream::Stdout, "second");
    }
    EXPECT_EQ(read_file(path), "first\nsecond");
    fs::remove(path);
}

TEST(OutputTest, Writer_UnwritablePath_NoFile) {
    OutputConfig config;
    config.output_path = fs::temp_directory_path() / "eveapi_missing_dir" / "sub" / "out.txt";
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

// ==============================================================================
// write_value: форматы
// ==============================================================================

TEST(OutputTest, WriteValue_Flat) {
    std::string out = render_to_file(make_result(), Format::Flat, "eveapi_test_flat.txt");
    EXPECT_EQ(out,
              "eveapi.result.characters.499939401.name = \"Alpha\"\n"
              "eveapi.result.serverOpen.text = \"True\"\n");
}

TEST(OutputTest, WriteValue_Json) {
    std::string out = render_to_file(make_result(), Format::Json, "eveapi_test_json.txt");
    EXPECT_EQ(out,
              "{\"eveapi\":{\"result\":{\"characters\":{\"499939401\":{\"name\":\"Alpha\"}},"
              "\"serverOpen\":{\"text\":\"True\"}}}}\n");
}

TEST(OutputTest, WriteValue_Pretty_Indented) {
    std::string out = render_to_file(make_result(), Format::Pretty, "eveapi_test_pretty.txt");
    EXPECT_EQ(out.rfind("{\n", 0), 0u);
    EXPECT_NE(out.find("    \"eveapi\": {"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

// ==============================================================================
// Плоский формат
// ==============================================================================

TEST(OutputTest, FormatFlat_EmptyDocument) {
    EXPECT_EQ(format_flat(Value()), "{}\n");
}

TEST(OutputTest, FormatFlat_EmptyNestedObject) {
    Value v(Value::Object{{"r", Value(Value::Object{{"skills", Value()}})}});
    EXPECT_EQ(format_flat(v), "r.skills = {}\n");
}

TEST(OutputTest, FormatFlat_EscapesValues) {
    Value v(Value::Object{{"k", Value("a \"q\"\n")}});
    EXPECT_EQ(format_flat(v), "k = \"a \\\"q\\\"\\n\"\n");
}

TEST(OutputTest, FormatPathSegment_Simple) {
    EXPECT_EQ(format_path_segment("eveapi", true), "eveapi");
    EXPECT_EQ(format_path_segment("result", false), ".result");
    EXPECT_EQ(format_path_segment("current_time", false), ".current_time");
}

TEST(OutputTest, FormatPathSegment_NeedsQuoting) {
    EXPECT_EQ(format_path_segment("a b", false), "[\"a b\"]");
    EXPECT_EQ(format_path_segment("1.5", true), "[\"1.5\"]");
    EXPECT_EQ(format_path_segment("", false), "[\"\"]");
}

TEST(OutputTest, QuoteString_Json) {
    EXPECT_EQ(quote_string("plain"), "\"plain\"");
    EXPECT_EQ(quote_string("tab\there"), "\"tab\\there\"");
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_ToString_BoxDrawing) {
    Table table;
    table.set_headers({"NAME", "PATH"});
    table.add_row({"SERVER_STATUS", "/server/ServerStatus"});

    std::string s = table.to_string();
    EXPECT_EQ(table.row_count(), 1u);
    EXPECT_NE(s.find("\xe2\x94\x8c"), std::string::npos);  // ┌
    EXPECT_NE(s.find("\xe2\x94\x98"), std::string::npos);  // ┘
    EXPECT_NE(s.find("│ SERVER_STATUS │ /server/ServerStatus │"), std::string::npos);
    EXPECT_NE(s.find("│ NAME          │ PATH                 │"), std::string::npos);
}

TEST(OutputTest, Table_Utf8Width) {
    Table table;
    table.set_headers({"имя"});
    table.add_row({"abc"});

    std::string s = table.to_string();
    EXPECT_NE(s.find("│ имя │"), std::string::npos);
    EXPECT_NE(s.find("│ abc │"), std::string::npos);
}

TEST(OutputTest, Table_NoHeaders_OnlyRows) {
    Table table;
    table.add_row({"a", "b"});
    std::string s = table.to_string();
    EXPECT_EQ(s.find("\xe2\x94\x9c"), std::string::npos);  // нет ├
}

// ==============================================================================
// Цвета префиксов
// ==============================================================================

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

}  // namespace eveapi::output::test
