#include <tku/json_util.hpp>

#include <memory>

namespace tku::json {

Result<Json::Value> parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    bool ok = false;
    try {
        ok = reader->parse(text.data(), text.data() + text.size(), &root, &errs);
    } catch (const Json::Exception& e) {
        errs = e.what();
    }
    if (!ok) {
        return TkuError(TkuError::Parse, "invalid JSON: " + errs);
    }
    return Result<Json::Value>::ok(std::move(root));
}

std::optional<std::string> get_string(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return std::nullopt;
    const Json::Value& v = obj[key];
    if (!v.isString()) return std::nullopt;
    return v.asString();
}

// jsoncpp reports integral doubles such as 5.0 as UInt64; token counts must
// be written as integers.
static bool is_integer(const Json::Value& v) {
    return v.type() == Json::intValue || v.type() == Json::uintValue;
}

std::optional<uint64_t> get_u64(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return std::nullopt;
    const Json::Value& v = obj[key];
    if (!is_integer(v) || !v.isUInt64()) return std::nullopt;
    return static_cast<uint64_t>(v.asUInt64());
}

std::optional<int64_t> get_i64(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return std::nullopt;
    const Json::Value& v = obj[key];
    if (!is_integer(v) || !v.isInt64()) return std::nullopt;
    return static_cast<int64_t>(v.asInt64());
}

std::optional<double> get_double(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return std::nullopt;
    const Json::Value& v = obj[key];
    if (!v.isNumeric()) return std::nullopt;
    return v.asDouble();
}

const Json::Value* get_object(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return nullptr;
    const Json::Value* v = obj.find(key, key + std::char_traits<char>::length(key));
    if (!v || !v->isObject()) return nullptr;
    return v;
}

} // namespace tku::json
