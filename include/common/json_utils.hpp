#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 检查 j 是否按顺序包含 keys 描述的路径
 * @code{.cpp}
 *     exists(j, "run", "stdout");
 * @endcode
 */
template <typename... Keys>
bool exists(const json &j, Keys &&...keys) {
    const json *ref = j.is_object() ? &j : nullptr;
    auto step = [&ref](const std::string &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref != nullptr && !ref->is_null();
}

}  // namespace nlohmann

namespace codebox {

/**
 * @brief 若 j 存在键 key 且不为 null，则将值写入 value
 * 兼容数字写成字符串的情况，比如 "port": "6379"
 */
template <typename T>
void get_value_if_exists(const nlohmann::json &j, const std::string &key, T &value) {
    if (!j.is_object() || !j.count(key) || j.at(key).is_null()) return;
    const nlohmann::json &v = j.at(key);
    if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
        if (v.is_string()) {
            value = boost::lexical_cast<T>(v.get<std::string>());
            return;
        }
    }
    value = v.get<T>();
}

template <typename T>
void get_value_if_exists(const nlohmann::json &j, const std::string &key, std::optional<T> &value) {
    if (!j.is_object() || !j.count(key) || j.at(key).is_null()) return;
    T result{};
    get_value_if_exists(j, key, result);
    value = result;
}

}  // namespace codebox
