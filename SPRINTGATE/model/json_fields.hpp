#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sprintgate::model {

// Reads one JSON object strictly. Problems are appended to `issues` as "<where>.<key>: <problem>"
// instead of thrown, so a whole document can be checked in one pass.
class FieldReader {
public:
    FieldReader(const nlohmann::json& object,
                std::string where,
                std::vector<std::string>& issues,
                std::initializer_list<const char*> allowed_keys);

    bool valid_object() const { return object_ != nullptr; }
    bool has(const char* key) const;

    std::string string(const char* key, bool required, const std::string& fallback = std::string());
    int integer(const char* key, bool required, int fallback, int minimum = 0);
    std::optional<int> optional_integer(const char* key, int minimum = 0);
    bool boolean(const char* key, bool required, bool fallback);
    std::vector<std::string> string_list(const char* key, bool required);
    std::map<std::string, std::string> string_map(const char* key);

    // Returns the member when present with the expected type; reports it otherwise.
    const nlohmann::json* object(const char* key, bool required);
    const nlohmann::json* array(const char* key, bool required);

    std::string path(const char* key) const;
    std::string path(const char* key, std::size_t index) const;
    void report(const std::string& problem);

private:
    const nlohmann::json* member(const char* key, bool required, const char* expected_type,
                                 bool (nlohmann::json::*check)() const noexcept);

    const nlohmann::json* object_ = nullptr;
    std::string where_;
    std::vector<std::string>& issues_;
};

}
