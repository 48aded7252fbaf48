#pragma once

#include <cstdint>
#include <string>

#include <dpp/json.h>

namespace mz::util {

// Field readers for scraped or third-party JSON. A missing key, a null or a
// value of the wrong type gives the fallback instead of throwing.

std::string  string_field(const dpp::json& j, const char* key, const std::string& fallback = "");
std::int64_t int_field(const dpp::json& j, const char* key, std::int64_t fallback = 0);
bool         bool_field(const dpp::json& j, const char* key, bool fallback = false);

/// The member if `j` is an object holding an object under `key`, else null.
const dpp::json* object_field(const dpp::json& j, const char* key);

/// Same for arrays.
const dpp::json* array_field(const dpp::json& j, const char* key);

} // namespace mz::util
