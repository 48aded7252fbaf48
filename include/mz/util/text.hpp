#pragma once

#include <string>
#include <vector>

namespace mz::util {

std::string to_lower(std::string s);
std::string trim(const std::string& s);

/// Lowercased alphanumeric words; everything else separates.
std::vector<std::string> tokenize(const std::string& s);

/// Decodes a JSON string body as scraped out of a page ("&" -> "&").
/// Returns the input unchanged if it is not a valid JSON string body.
std::string unescape_json_string(const std::string& raw);

/// Decodes the handful of HTML entities that show up in titles.
std::string decode_html_entities(std::string s);

/// "Artist - Song (Live)!" -> "Artist-Song-Live"
std::string sanitize_filename(const std::string& title);

/// Resolves a possibly relative reference against an absolute URL.
std::string resolve_url(const std::string& base, const std::string& ref);

/// Strips query string and fragment.
std::string url_path(const std::string& url);

} // namespace mz::util
