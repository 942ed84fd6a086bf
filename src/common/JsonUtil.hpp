#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

// Typed field access over boost::json. Every helper throws domain::DecodeError on a missing
// required field or a value of the wrong type. Numbers may arrive as JSON numbers or strings.
namespace tw::common::json {

double to_number(const boost::json::value& value, std::string_view field);
std::int64_t to_int(const boost::json::value& value, std::string_view field);

const boost::json::object& as_object(const boost::json::value& value, std::string_view what);

double number_field(const boost::json::object& obj, std::string_view key);
std::int64_t int_field(const boost::json::object& obj, std::string_view key);
std::string string_field(const boost::json::object& obj, std::string_view key);
bool bool_field(const boost::json::object& obj, std::string_view key);

// Absent or null fields give nullopt.
std::optional<double> optional_number(const boost::json::object& obj, std::string_view key);
std::optional<std::int64_t> optional_int(const boost::json::object& obj, std::string_view key);
std::optional<std::string> optional_string(const boost::json::object& obj, std::string_view key);
std::optional<bool> optional_bool(const boost::json::object& obj, std::string_view key);

}  // namespace tw::common::json
