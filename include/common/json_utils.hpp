#pragma once

#include <nlohmann/json.hpp>

namespace nlohmann {

/**
 * @brief 按 keys 依次访问 json 对象，任意一层不存在或为 null 时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = &j;
    ((ref = (ref && ref->is_object() && ref->count(keys)) ? &ref->at(keys) : nullptr), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    return find_path(j, keys...) != nullptr;
}

/**
 * @brief 读取可选字段，字段不存在时返回 def_value
 * @throw json::type_error 字段存在但类型不匹配
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref ? ref->get<T>() : def_value;
}

/**
 * @brief 字段存在时写入 value，否则保持 value 不变
 * @throw json::type_error 字段存在但类型不匹配
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (ref) ref->get_to(value);
}

}  // namespace nlohmann
