#pragma once

#include <tku/result.hpp>
#include <jsoncpp/json/json.h>
#include <cstdint>
#include <optional>
#include <string>

namespace tku::json {

// Parse one JSON document. Never throws.
Result<Json::Value> parse(const std::string& text);

// Typed member access; nullopt when missing or of the wrong type
std::optional<std::string> get_string(const Json::Value& obj, const char* key);
std::optional<uint64_t> get_u64(const Json::Value& obj, const char* key);
std::optional<int64_t> get_i64(const Json::Value& obj, const char* key);
std::optional<double> get_double(const Json::Value& obj, const char* key);

// Object member or nullptr
const Json::Value* get_object(const Json::Value& obj, const char* key);

} // namespace tku::json
