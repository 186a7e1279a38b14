// ==============================================================================
// value.cpp - Реализация Value (модель результата конверсии)
// ==============================================================================

#include <eveapi/value.hpp>

namespace eveapi {

// ----------------------------------------------------------------------------
// Конструкторы и копирование
// ----------------------------------------------------------------------------

Value::Value() : data_(std::make_unique<Object>()) {}

Value::Value(std::string v) : data_(std::move(v)) {}

Value::Value(const char* v) : data_(std::string(v)) {}

Value::Value(Object v) : data_(std::make_unique<Object>(std::move(v))) {}

Value::Value(const Value& other) {
    if (const auto* obj = other.get_object()) {
        data_ = std::make_unique<Object>(*obj);
    } else {
        data_ = other.as_string();
    }
}

// Источник после перемещения остаётся пустым листом-строкой:
// unique_ptr<Object> без объекта никогда не хранится
Value::Value(Value&& other) noexcept : data_(std::move(other.data_)) {
    other.data_.emplace<String>();
}

Value& Value::operator=(const Value& other) {
    if (this != &other) {
        Value tmp(other);
        data_ = std::move(tmp.data_);
    }
    return *this;
}

Value& Value::operator=(Value&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        other.data_.emplace<String>();
    }
    return *this;
}

Value::~Value() = default;

// ----------------------------------------------------------------------------
// Операции с объектом
// ----------------------------------------------------------------------------

void Value::set(const std::string& key, Value v) {
    if (auto* obj = get_object_mut()) {
        (*obj)[key] = std::move(v);
    }
}

const Value* Value::get(const std::string& key) const {
    if (const auto* obj = get_object()) {
        auto it = obj->find(key);
        if (it != obj->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::size_t Value::object_size() const {
    if (const auto* obj = get_object()) {
        return obj->size();
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Поиск по пути
// ----------------------------------------------------------------------------

const Value* Value::find(const KeyPath& path) const {
    const Value* current = this;
    for (const auto& segment : path) {
        current = current->get(segment);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

const Value* Value::find(std::string_view dotted) const {
    return find(split_path(dotted));
}

const Value::String* Value::find_string(std::string_view dotted) const {
    const Value* v = find(dotted);
    return v ? v->get_string() : nullptr;
}

KeyPath split_path(std::string_view dotted) {
    KeyPath parts;
    std::size_t start = 0;
    while (start <= dotted.size()) {
        std::size_t dot_pos = dotted.find('.', start);
        if (dot_pos == std::string_view::npos) {
            parts.emplace_back(dotted.substr(start));
            break;
        }
        parts.emplace_back(dotted.substr(start, dot_pos - start));
        start = dot_pos + 1;
    }
    // Пустая строка: пустой путь (значение само по себе)
    if (parts.size() == 1 && parts.front().empty()) {
        parts.clear();
    }
    return parts;
}

std::string join_path(const KeyPath& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += path[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// Сравнение
// ----------------------------------------------------------------------------

bool Value::operator==(const Value& other) const {
    if (is_string() != other.is_string()) {
        return false;
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    // std::map::operator== сравнивает ключи и рекурсивно значения
    return as_object() == other.as_object();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson - конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace eveapi
