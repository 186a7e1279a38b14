// ==============================================================================
// merge.cpp - build_path_map / deep_merge
// ==============================================================================

#include <eveapi/merge.hpp>

#include <stdexcept>

namespace eveapi {

Value::Object build_path_map(KeyPath path, Value value) {
    if (path.empty()) {
        throw std::invalid_argument("build_path_map: key path must not be empty");
    }

    // Собираем изнутри наружу: последний сегмент получает value
    Value current = std::move(value);
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        Value::Object wrapper;
        wrapper.emplace(std::move(*it), std::move(current));
        current = Value(std::move(wrapper));
    }
    return std::move(current.as_object_mut());
}

Value::Object& deep_merge(Value::Object& dst, Value::Object src) {
    for (auto& [key, incoming] : src) {
        auto it = dst.find(key);
        if (it != dst.end() && it->second.is_object() && incoming.is_object()) {
            deep_merge(it->second.as_object_mut(), std::move(incoming.as_object_mut()));
        } else {
            dst.insert_or_assign(key, std::move(incoming));
        }
    }
    return dst;
}

Value& deep_merge(Value& dst, Value src) {
    if (dst.is_object() && src.is_object()) {
        deep_merge(dst.as_object_mut(), std::move(src.as_object_mut()));
    } else {
        dst = std::move(src);
    }
    return dst;
}

}  // namespace eveapi
