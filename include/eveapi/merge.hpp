// ==============================================================================
// eveapi/merge.hpp - Построение map по пути и глубокое слияние
// ==============================================================================
//
// Назначение:
// - build_path_map: {k1: {k2: {... {kn: v}}}} из пути и значения
// - deep_merge: рекурсивное объединение объектов
//
// Политика deep_merge для каждого ключа из src:
// - оба значения объекты -> рекурсивное слияние
// - иначе значение из src заменяет значение в dst
//
// ==============================================================================

#ifndef EVEAPI_MERGE_HPP
#define EVEAPI_MERGE_HPP

#include <eveapi/value.hpp>

namespace eveapi {

/// Построить объект с единственным листом value по пути path.
///
/// @param path Непустой путь (поглощается)
/// @param value Значение в конце пути
/// @throws std::invalid_argument если path пуст
Value::Object build_path_map(KeyPath path, Value value);

/// Влить src в dst (dst изменяется на месте, src поглощается).
/// @return dst
Value::Object& deep_merge(Value::Object& dst, Value::Object src);

/// Вариант для Value: если dst не объект, а src объект: dst заменяется на src
Value& deep_merge(Value& dst, Value src);

}  // namespace eveapi

#endif  // EVEAPI_MERGE_HPP
