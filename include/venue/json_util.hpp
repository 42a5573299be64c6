#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>

namespace venue {

// Exchanges send numbers both as JSON numbers and as strings.
double parse_double_optional(const nlohmann::json& value, double fallback = 0.0);
int64_t parse_int_optional(const nlohmann::json& value, int64_t fallback = 0);
std::string parse_string_optional(const nlohmann::json& value);

// First present key wins.
double get_double(const nlohmann::json& obj, std::initializer_list<const char*> keys, double fallback = 0.0);
int64_t get_int(const nlohmann::json& obj, std::initializer_list<const char*> keys, int64_t fallback = 0);
std::string get_string(const nlohmann::json& obj, std::initializer_list<const char*> keys);
bool get_bool(const nlohmann::json& obj, const char* key, bool fallback);

} // namespace venue
