#include "model/json_fields.hpp"

#include <algorithm>
#include <utility>

namespace sprintgate::model {

FieldReader::FieldReader(const nlohmann::json& object,
                         std::string where,
                         std::vector<std::string>& issues,
                         std::initializer_list<const char*> allowed_keys)
    : where_(std::move(where)),
      issues_(issues) {
    if (!object.is_object()) {
        issues_.push_back(where_ + ": expected object");
        return;
    }
    object_ = &object;
    for (auto it = object.begin(); it != object.end(); ++it) {
        const bool known = std::any_of(allowed_keys.begin(), allowed_keys.end(), [&](const char* allowed) {
            return it.key() == allowed;
        });
        if (!known) {
            issues_.push_back(path(it.key().c_str()) + ": unknown field");
        }
    }
}

bool FieldReader::has(const char* key) const {
    return object_ && object_->contains(key);
}

std::string FieldReader::path(const char* key) const {
    return where_.empty() ? std::string(key) : where_ + "." + key;
}

std::string FieldReader::path(const char* key, std::size_t index) const {
    return path(key) + "[" + std::to_string(index) + "]";
}

void FieldReader::report(const std::string& problem) {
    issues_.push_back(where_ + ": " + problem);
}

const nlohmann::json* FieldReader::member(const char* key,
                                          bool required,
                                          const char* expected_type,
                                          bool (nlohmann::json::*check)() const noexcept) {
    if (!object_) {
        return nullptr;
    }
    auto it = object_->find(key);
    if (it == object_->end()) {
        if (required) {
            issues_.push_back(path(key) + ": missing required field");
        }
        return nullptr;
    }
    if (!((*it).*check)()) {
        issues_.push_back(path(key) + ": expected " + expected_type);
        return nullptr;
    }
    return &(*it);
}

std::string FieldReader::string(const char* key, bool required, const std::string& fallback) {
    const auto* value = member(key, required, "string", &nlohmann::json::is_string);
    if (!value) {
        return fallback;
    }
    std::string out = value->get<std::string>();
    if (required && out.empty()) {
        issues_.push_back(path(key) + ": must not be empty");
    }
    return out;
}

int FieldReader::integer(const char* key, bool required, int fallback, int minimum) {
    const auto* value = member(key, required, "integer", &nlohmann::json::is_number_integer);
    if (!value) {
        return fallback;
    }
    const auto raw = value->get<long long>();
    if (raw < minimum || raw > 1000000) {
        issues_.push_back(path(key) + ": out of range (" + std::to_string(raw) + ")");
        return fallback;
    }
    return static_cast<int>(raw);
}

std::optional<int> FieldReader::optional_integer(const char* key, int minimum) {
    if (!has(key)) {
        return std::nullopt;
    }
    const std::size_t before = issues_.size();
    const int value = integer(key, true, 0, minimum);
    if (issues_.size() != before) {
        return std::nullopt;
    }
    return value;
}

bool FieldReader::boolean(const char* key, bool required, bool fallback) {
    const auto* value = member(key, required, "boolean", &nlohmann::json::is_boolean);
    return value ? value->get<bool>() : fallback;
}

std::vector<std::string> FieldReader::string_list(const char* key, bool required) {
    std::vector<std::string> out;
    const auto* value = member(key, required, "array", &nlohmann::json::is_array);
    if (!value) {
        return out;
    }
    out.reserve(value->size());
    for (std::size_t i = 0; i < value->size(); ++i) {
        const auto& entry = (*value)[i];
        if (!entry.is_string()) {
            issues_.push_back(path(key, i) + ": expected string");
            continue;
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

std::map<std::string, std::string> FieldReader::string_map(const char* key) {
    std::map<std::string, std::string> out;
    const auto* value = member(key, false, "object", &nlohmann::json::is_object);
    if (!value) {
        return out;
    }
    for (auto it = value->begin(); it != value->end(); ++it) {
        if (!it->is_string()) {
            issues_.push_back(path(key) + "." + it.key() + ": expected string");
            continue;
        }
        out.emplace(it.key(), it->get<std::string>());
    }
    return out;
}

const nlohmann::json* FieldReader::object(const char* key, bool required) {
    return member(key, required, "object", &nlohmann::json::is_object);
}

const nlohmann::json* FieldReader::array(const char* key, bool required) {
    return member(key, required, "array", &nlohmann::json::is_array);
}

}
