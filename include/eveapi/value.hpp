// ==============================================================================
// eveapi/value.hpp - Модель результата конверсии (ResultMap)
// ==============================================================================
//
// Назначение:
// - Рекурсивный тип Value = String | Object (map string -> Value)
// - KeyPath: путь из ключей от корня к значению
// - Поиск значения по пути (KeyPath или строка через точку)
// - Конверсия в RapidJSON для вывода
//
// Копирование Value глубокое: две копии никогда не разделяют вложенные map.
//
// ==============================================================================

#ifndef EVEAPI_VALUE_HPP
#define EVEAPI_VALUE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace eveapi {

class Value;

/// Объект: упорядоченный map string -> Value (детерминированный порядок вывода)
using ValueObject = std::map<std::string, Value>;

/// Путь к значению: сегменты от корня документа
using KeyPath = std::vector<std::string>;

/// Значение результата: строка (лист) или вложенный объект (узел)
class Value {
public:
    using String = std::string;
    using Object = ValueObject;

private:
    std::variant<String, std::unique_ptr<Object>> data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    /// Пустой объект
    Value();

    /// Лист-строка
    explicit Value(std::string v);

    /// Лист-строка из C-строки
    explicit Value(const char* v);

    /// Узел-объект
    explicit Value(Object v);

    Value(const Value& other);
    /// После перемещения источник становится пустой строкой
    Value(Value&& other) noexcept;
    Value& operator=(const Value& other);
    Value& operator=(Value&& other) noexcept;
    ~Value();

    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_object() const { return std::holds_alternative<std::unique_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить строку (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    /// Получить объект (undefined behavior если не is_object())
    const Object& as_object() const { return *std::get<std::unique_ptr<Object>>(data_); }

    /// Получить объект для модификации
    Object& as_object_mut() { return *std::get<std::unique_ptr<Object>>(data_); }

    /// nullptr если тип не совпадает
    const String* get_string() const { return std::get_if<String>(&data_); }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::unique_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::unique_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v);

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const;

    /// Проверить наличие ключа в объекте
    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Размер объекта (0 если лист)
    std::size_t object_size() const;

    // -------------------------------------------------------------------------
    // Поиск по пути
    // -------------------------------------------------------------------------

    /// Пройти по пути от этого значения.
    /// @return nullptr если какой-то сегмент отсутствует или упирается в лист
    const Value* find(const KeyPath& path) const;

    /// То же для пути через точку: "eveapi.result.onlinePlayers.text"
    const Value* find(std::string_view dotted) const;

    /// Строка-лист по пути (nullptr если путь не ведёт к строке)
    const String* find_string(std::string_view dotted) const;

    // -------------------------------------------------------------------------
    // Сравнение (структурное)
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия в RapidJSON
    // -------------------------------------------------------------------------

    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;
};

/// Разбить путь через точку на сегменты ("a.b.c" -> {"a", "b", "c"})
KeyPath split_path(std::string_view dotted);

/// Склеить путь через точку
std::string join_path(const KeyPath& path);

}  // namespace eveapi

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // EVEAPI_VALUE_HPP
