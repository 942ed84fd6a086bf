#include "common/JsonUtil.hpp"

#include <cmath>
#include <exception>
#include <string>

#include "domain/Errors.h"

namespace tw::common::json {
namespace {

[[noreturn]] void fail(std::string_view field, const char* problem) {
    throw domain::DecodeError(std::string(field) + ": " + problem);
}

const boost::json::value* lookup(const boost::json::object& obj, std::string_view key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return nullptr;
    }
    return value;
}

const boost::json::value& require(const boost::json::object& obj, std::string_view key) {
    const auto* value = lookup(obj, key);
    if (value == nullptr) {
        fail(key, "missing");
    }
    return *value;
}

}  // namespace

double to_number(const boost::json::value& value, std::string_view field) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const double parsed = std::stod(str, &consumed);
            if (consumed == str.size() && std::isfinite(parsed)) {
                return parsed;
            }
        }
        catch (const std::exception&) {
            fail(field, "not a number");
        }
        fail(field, "not a number");
    }
    fail(field, "unsupported JSON type for number");
}

std::int64_t to_int(const boost::json::value& value, std::string_view field) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(str, &consumed);
            if (consumed == str.size()) {
                return parsed;
            }
        }
        catch (const std::exception&) {
            fail(field, "not an integer");
        }
        fail(field, "not an integer");
    }
    fail(field, "unsupported JSON type for integer");
}

const boost::json::object& as_object(const boost::json::value& value, std::string_view what) {
    if (!value.is_object()) {
        fail(what, "expected an object");
    }
    return value.get_object();
}

double number_field(const boost::json::object& obj, std::string_view key) {
    return to_number(require(obj, key), key);
}

std::int64_t int_field(const boost::json::object& obj, std::string_view key) {
    return to_int(require(obj, key), key);
}

std::string string_field(const boost::json::object& obj, std::string_view key) {
    const auto& value = require(obj, key);
    if (!value.is_string()) {
        fail(key, "expected a string");
    }
    return std::string(value.get_string().c_str());
}

bool bool_field(const boost::json::object& obj, std::string_view key) {
    const auto& value = require(obj, key);
    if (!value.is_bool()) {
        fail(key, "expected a boolean");
    }
    return value.get_bool();
}

std::optional<double> optional_number(const boost::json::object& obj, std::string_view key) {
    const auto* value = lookup(obj, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return to_number(*value, key);
}

std::optional<std::int64_t> optional_int(const boost::json::object& obj, std::string_view key) {
    const auto* value = lookup(obj, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return to_int(*value, key);
}

std::optional<std::string> optional_string(const boost::json::object& obj, std::string_view key) {
    if (lookup(obj, key) == nullptr) {
        return std::nullopt;
    }
    return string_field(obj, key);
}

std::optional<bool> optional_bool(const boost::json::object& obj, std::string_view key) {
    if (lookup(obj, key) == nullptr) {
        return std::nullopt;
    }
    return bool_field(obj, key);
}

}  // namespace tw::common::json
