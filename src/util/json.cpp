#include "mz/util/json.hpp"

namespace mz::util {

namespace {

const dpp::json* member(const dpp::json& j, const char* key)
{
    if (!j.is_object()) {
        return nullptr;
    }
    const auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

} // namespace

std::string string_field(const dpp::json& j, const char* key, const std::string& fallback)
{
    const auto* v = member(j, key);
    return v != nullptr && v->is_string() ? v->get<std::string>() : fallback;
}

std::int64_t int_field(const dpp::json& j, const char* key, std::int64_t fallback)
{
    const auto* v = member(j, key);
    if (v == nullptr) {
        return fallback;
    }
    if (v->is_number_integer()) {
        return v->get<std::int64_t>();
    }
    if (v->is_number_float()) {
        return static_cast<std::int64_t>(v->get<double>());
    }
    return fallback;
}

bool bool_field(const dpp::json& j, const char* key, bool fallback)
{
    const auto* v = member(j, key);
    return v != nullptr && v->is_boolean() ? v->get<bool>() : fallback;
}

const dpp::json* object_field(const dpp::json& j, const char* key)
{
    const auto* v = member(j, key);
    return v != nullptr && v->is_object() ? v : nullptr;
}

const dpp::json* array_field(const dpp::json& j, const char* key)
{
    const auto* v = member(j, key);
    return v != nullptr && v->is_array() ? v : nullptr;
}

} // namespace mz::util
