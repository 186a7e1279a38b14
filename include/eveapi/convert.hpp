// ==============================================================================
// eveapi/convert.hpp - Конверсия XML ответа EVE API в Value
// ==============================================================================
//
// Назначение:
// - Обход DOM (pugixml) и построение вложенного map без схемы
// - Специальная обработка <rowset>: строки индексируются по key-атрибуту
//
// Правила конверсии элемента по пути P, для каждого дочернего узла:
// - текст (после trim, непустой)  -> P + ["text"]
// - атрибуты дочернего элемента   -> P + ["attributes"]
// - <rowset name=N key=K>         -> P + [N] = {row[K]: атрибуты row, ...}
// - любой другой элемент <T>      -> рекурсия с P + [T]
//
// Конверсия чистая: не пишет в лог, не делает I/O, не держит глобального
// состояния. Можно вызывать параллельно на разных документах.
//
// ==============================================================================

#ifndef EVEAPI_CONVERT_HPP
#define EVEAPI_CONVERT_HPP

#include <eveapi/value.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

#include <pugixml.hpp>

namespace eveapi {

// ----------------------------------------------------------------------------
// Зарезервированные имена протокола
// ----------------------------------------------------------------------------

constexpr const char* ROWSET_TAG = "rowset";
constexpr const char* ROW_TAG = "row";
constexpr const char* ROWSET_KEY_ATTR = "key";
constexpr const char* ROWSET_NAME_ATTR = "name";
constexpr const char* TEXT_KEY = "text";
constexpr const char* ATTRIBUTES_KEY = "attributes";

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

/// Структура ответа не соответствует протоколу (например rowset без key/name)
class MalformedResponseError : public std::runtime_error {
public:
    MalformedResponseError(const std::string& message, KeyPath path)
        : std::runtime_error(message), path_(std::move(path)) {}

    /// Путь элемента, на котором обнаружена ошибка
    const KeyPath& path() const { return path_; }

private:
    KeyPath path_;
};

// ----------------------------------------------------------------------------
// Опции
// ----------------------------------------------------------------------------

struct ConvertOptions {
    /// Максимальная глубина вложенности элементов
    std::size_t max_depth = 256;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Конвертировать весь документ.
/// Корневой элемент <R> становится ключом R, его атрибуты: R.attributes.
/// Пустой документ (без корневого элемента) даёт пустой объект.
///
/// @throws MalformedResponseError
Value convert_document(const pugi::xml_document& doc, const ConvertOptions& options = {});

/// Конвертировать поддерево элемента, расположенного по пути path.
/// Результат: объект от корня документа (ключи path включены).
///
/// @throws MalformedResponseError
Value::Object convert_element(const pugi::xml_node& element, const KeyPath& path,
                              const ConvertOptions& options = {});

/// Конвертировать rowset: {path: {row[key_attribute]: атрибуты row, ...}}.
/// Повторный ключ строки заменяет предыдущую строку целиком.
///
/// @throws MalformedResponseError если у строки нет key_attribute
Value::Object convert_rowset(const pugi::xml_node& rowset, const KeyPath& path,
                             const std::string& key_attribute);

/// Атрибуты элемента как объект строк
Value::Object attributes_to_object(const pugi::xml_node& element);

/// Обрезать пробельные символы по краям
std::string trim_text(const char* text);

}  // namespace eveapi

#endif  // EVEAPI_CONVERT_HPP
