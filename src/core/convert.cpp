// ==============================================================================
// convert.cpp - Конверсия DOM (pugixml) в Value
// ==============================================================================
//
// Каждый фрагмент (текст, атрибуты, rowset, поддерево) строится как объект
// от корня документа и вливается в единственный аккумулятор через
// deep_merge. Так соседние фрагменты с общим префиксом пути
// (например два дочерних элемента с атрибутами) не теряют друг друга.
//
// ==============================================================================

#include <eveapi/convert.hpp>
#include <eveapi/merge.hpp>

#include <cstring>
#include <string_view>
#include <utility>

namespace eveapi {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\f\v";

KeyPath child_path(const KeyPath& path, std::string segment) {
    KeyPath out = path;
    out.push_back(std::move(segment));
    return out;
}

std::string describe_path(const KeyPath& path) {
    return path.empty() ? std::string("<document>") : join_path(path);
}

/// Обязательный атрибут rowset; отсутствие: нарушение протокола
std::string required_rowset_attribute(const pugi::xml_node& rowset, const char* name,
                                      const KeyPath& path) {
    pugi::xml_attribute attr = rowset.attribute(name);
    if (!attr) {
        throw MalformedResponseError("malformed response structure: <rowset> under '" +
                                         describe_path(path) + "' has no '" + name +
                                         "' attribute",
                                     path);
    }
    return attr.value();
}

Value::Object convert_element_impl(const pugi::xml_node& element, const KeyPath& path,
                                   const ConvertOptions& options, std::size_t depth) {
    if (depth > options.max_depth) {
        throw MalformedResponseError("malformed response structure: nesting under '" +
                                         describe_path(path) + "' exceeds " +
                                         std::to_string(options.max_depth) + " levels",
                                     path);
    }

    Value::Object result;

    for (const auto& child : element.children()) {
        switch (child.type()) {
        case pugi::node_pcdata:
        case pugi::node_cdata: {
            std::string text = trim_text(child.value());
            if (!text.empty()) {
                deep_merge(result,
                           build_path_map(child_path(path, TEXT_KEY), Value(std::move(text))));
            }
            break;
        }
        case pugi::node_element: {
            // Атрибуты дочернего элемента попадают в attributes текущего
            // элемента: так у rowset видны name/key/columns рядом с набором строк
            Value::Object attributes = attributes_to_object(child);
            if (!attributes.empty()) {
                deep_merge(result, build_path_map(child_path(path, ATTRIBUTES_KEY),
                                                  Value(std::move(attributes))));
            }

            if (std::strcmp(child.name(), ROWSET_TAG) == 0) {
                std::string name = required_rowset_attribute(child, ROWSET_NAME_ATTR, path);
                std::string key = required_rowset_attribute(child, ROWSET_KEY_ATTR, path);
                deep_merge(result, convert_rowset(child, child_path(path, std::move(name)), key));
            } else {
                deep_merge(result, convert_element_impl(child, child_path(path, child.name()),
                                                        options, depth + 1));
            }
            break;
        }
        default:
            // Комментарии, processing instructions, doctype: не данные
            break;
        }
    }

    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

Value convert_document(const pugi::xml_document& doc, const ConvertOptions& options) {
    pugi::xml_node root = doc.document_element();
    if (!root) {
        return Value::make_object();
    }

    KeyPath root_path{root.name()};
    Value::Object result;

    // У корня нет родителя, его атрибуты идут под собственный ключ
    Value::Object attributes = attributes_to_object(root);
    if (!attributes.empty()) {
        deep_merge(result, build_path_map(child_path(root_path, ATTRIBUTES_KEY),
                                          Value(std::move(attributes))));
    }

    deep_merge(result, convert_element_impl(root, root_path, options, 1));
    return Value(std::move(result));
}

Value::Object convert_element(const pugi::xml_node& element, const KeyPath& path,
                              const ConvertOptions& options) {
    return convert_element_impl(element, path, options, path.empty() ? 1 : path.size());
}

Value::Object convert_rowset(const pugi::xml_node& rowset, const KeyPath& path,
                             const std::string& key_attribute) {
    Value::Object rows;

    for (const auto& row : rowset.children(ROW_TAG)) {
        pugi::xml_attribute key = row.attribute(key_attribute.c_str());
        if (!key) {
            throw MalformedResponseError("malformed response structure: <row> in rowset '" +
                                             describe_path(path) + "' has no key attribute '" +
                                             key_attribute + "'",
                                         path);
        }
        // Целиком заменяем строку с тем же ключом: поля разных строк не смешиваются
        rows.insert_or_assign(key.value(), Value(attributes_to_object(row)));
    }

    return build_path_map(path, Value(std::move(rows)));
}

Value::Object attributes_to_object(const pugi::xml_node& element) {
    Value::Object attributes;
    for (const auto& attr : element.attributes()) {
        attributes.insert_or_assign(attr.name(), Value(std::string(attr.value())));
    }
    return attributes;
}

std::string trim_text(const char* text) {
    std::string_view view(text != nullptr ? text : "");
    auto start = view.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = view.find_last_not_of(WHITESPACE);
    return std::string(view.substr(start, end - start + 1));
}

}  // namespace eveapi
