#include "venue/json_util.hpp"

#include <stdexcept>

namespace venue {

double parse_double_optional(const nlohmann::json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return fallback;
        }
        try {
            return std::stod(text);
        } catch (const std::invalid_argument&) {
            return fallback;
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }
    return fallback;
}

int64_t parse_int_optional(const nlohmann::json& value, int64_t fallback) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        return static_cast<int64_t>(value.get<double>());
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return fallback;
        }
        try {
            return std::stoll(text);
        } catch (const std::invalid_argument&) {
            return fallback;
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }
    return fallback;
}

std::string parse_string_optional(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return value.dump();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return {};
}

double get_double(const nlohmann::json& obj, std::initializer_list<const char*> keys, double fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    for (const auto* key : keys) {
        const auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return parse_double_optional(*it, fallback);
        }
    }
    return fallback;
}

int64_t get_int(const nlohmann::json& obj, std::initializer_list<const char*> keys, int64_t fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    for (const auto* key : keys) {
        const auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return parse_int_optional(*it, fallback);
        }
    }
    return fallback;
}

std::string get_string(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) {
        return {};
    }
    for (const auto* key : keys) {
        const auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return parse_string_optional(*it);
        }
    }
    return {};
}

bool get_bool(const nlohmann::json& obj, const char* key, bool fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        return text == "true" || text == "1";
    }
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    return fallback;
}

} // namespace venue
