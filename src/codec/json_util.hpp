/**
 * @file json_util.hpp
 * @brief Lenient field access helpers over jsoncpp values (internal)
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <json/json.h>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace opsdeck {
namespace json {

/**
 * @brief Parse text into a JSON value
 * @return INVALID_MESSAGE status on syntax errors and on reader limits
 *         (jsoncpp throws past its nesting depth)
 */
inline Result<Json::Value> parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            return SyncError::InvalidMessage(errors);
        }
    } catch (const Json::Exception& e) {
        return SyncError::InvalidMessage(e.what());
    }
    return root;
}

inline std::string to_compact_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

/// First member among names that is present and not null
inline const Json::Value* find(const Json::Value& obj,
                               std::initializer_list<const char*> names) {
    if (!obj.isObject()) {
        return nullptr;
    }
    for (const char* name : names) {
        const Json::Value* member = obj.find(name, name + std::char_traits<char>::length(name));
        if (member != nullptr && !member->isNull()) {
            return member;
        }
    }
    return nullptr;
}

inline std::optional<std::string> get_string(const Json::Value& obj,
                                             std::initializer_list<const char*> names) {
    const Json::Value* v = find(obj, names);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return v->asString();
}

inline std::optional<double> get_double(const Json::Value& obj,
                                        std::initializer_list<const char*> names) {
    const Json::Value* v = find(obj, names);
    if (v == nullptr || !v->isNumeric() || !std::isfinite(v->asDouble())) {
        return std::nullopt;
    }
    return v->asDouble();
}

inline std::optional<int64_t> get_int(const Json::Value& obj,
                                      std::initializer_list<const char*> names) {
    const Json::Value* v = find(obj, names);
    if (v == nullptr || !v->isNumeric()) {
        return std::nullopt;
    }
    if (v->isIntegral()) {
        // isIntegral() also holds for unsigned values above INT64_MAX
        if (!v->isInt64()) {
            return std::nullopt;
        }
        return v->asInt64();
    }

    // Fractional numbers truncate; anything outside int64 counts as absent
    const double d = v->asDouble();
    constexpr double kLimit = 9223372036854775808.0;  // 2^63
    if (!std::isfinite(d) || d >= kLimit || d < -kLimit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

/// get_int() narrowed to int; out-of-range values count as absent
inline std::optional<int> get_int32(const Json::Value& obj,
                                    std::initializer_list<const char*> names) {
    auto v = get_int(obj, names);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

inline std::optional<bool> get_bool(const Json::Value& obj,
                                    std::initializer_list<const char*> names) {
    const Json::Value* v = find(obj, names);
    if (v == nullptr || !v->isBool()) {
        return std::nullopt;
    }
    return v->asBool();
}

}  // namespace json
}  // namespace opsdeck
