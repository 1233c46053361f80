#pragma once

#include <diagram_model/logger.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace diagram_loaders::detail {

// Thrown for a well-formed JSON document that does not describe a diagram.
class InvalidDocument : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::string required_string(const nlohmann::json& j, const char* key, const char* where) {
    if (!j.contains(key) || !j[key].is_string())
        throw InvalidDocument(std::string(where) + ": missing string field \"" + key + "\"");
    return j[key].get<std::string>();
}

// Optional fields of the wrong type are skipped with a warning.
inline void warn_wrong_type(const nlohmann::json& j, const char* key, const char* expected) {
    diagram_model::logger()->warn("ignoring field \"{}\": expected {}, got {}",
        key, expected, j[key].type_name());
}

inline std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    if (j[key].is_string()) return j[key].get<std::string>();
    warn_wrong_type(j, key, "string");
    return std::nullopt;
}

inline std::optional<bool> optional_bool(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    if (j[key].is_boolean()) return j[key].get<bool>();
    warn_wrong_type(j, key, "boolean");
    return std::nullopt;
}

inline const nlohmann::json* optional_array(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return nullptr;
    if (!j[key].is_array())
        throw InvalidDocument(std::string("\"") + key + "\" must be an array");
    return &j[key];
}

// Maps a word through parse(); unknown words reject the document.
template <typename Parse>
auto required_enum(const nlohmann::json& j, const char* key, const char* where, Parse parse) {
    const std::string word = required_string(j, key, where);
    auto value = parse(word);
    if (!value)
        throw InvalidDocument(std::string(where) + ": unknown " + key + " \"" + word + "\"");
    return *value;
}

} // namespace diagram_loaders::detail
