#include "mz/util/text.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <cctype>

namespace mz::util {

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> tokenize(const std::string& s)
{
    std::vector<std::string> out;
    std::string cur;
    for (const unsigned char c : s) {
        if (std::isalnum(c)) {
            cur.push_back(static_cast<char>(std::tolower(c)));
        } else if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) {
        out.push_back(std::move(cur));
    }
    return out;
}

std::string unescape_json_string(const std::string& raw)
{
    if (raw.find('\\') == std::string::npos) {
        return raw;
    }
    try {
        return dpp::json::parse("\"" + raw + "\"").get<std::string>();
    } catch (const dpp::json::exception&) {
        return raw;
    }
}

std::string decode_html_entities(std::string s)
{
    static const std::pair<const char*, const char*> entities[] = {
        { "&amp;",  "&"  },
        { "&quot;", "\"" },
        { "&#39;",  "'"  },
        { "&#x27;", "'"  },
        { "&lt;",   "<"  },
        { "&gt;",   ">"  },
    };

    for (const auto& [from, to] : entities) {
        const std::string f(from);
        std::size_t pos = 0;
        while ((pos = s.find(f, pos)) != std::string::npos) {
            s.replace(pos, f.size(), to);
            pos += 1;
        }
    }
    return s;
}

std::string sanitize_filename(const std::string& title)
{
    std::string kept;
    for (const unsigned char c : title) {
        if (std::isalnum(c) || c == '_' || c == '-' || std::isspace(c)) {
            kept.push_back(static_cast<char>(c));
        }
    }

    std::string out;
    bool pending_sep = false;
    for (const char c : trim(kept)) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) {
            pending_sep = true;
            continue;
        }
        if (pending_sep && !out.empty()) {
            out.push_back('-');
        }
        pending_sep = false;
        out.push_back(c);
    }

    if (out.empty()) {
        return "track";
    }
    if (out.size() > 80) {
        out.resize(80);
    }
    return out;
}

std::string url_path(const std::string& url)
{
    const auto cut = url.find_first_of("?#");
    return cut == std::string::npos ? url : url.substr(0, cut);
}

std::string resolve_url(const std::string& base, const std::string& ref)
{
    if (ref.find("://") != std::string::npos) {
        return ref;
    }

    const auto scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return ref;
    }

    if (ref.rfind("//", 0) == 0) {
        return base.substr(0, scheme_end + 1) + ref;
    }

    if (!ref.empty() && ref.front() == '/') {
        const auto host_end = base.find('/', scheme_end + 3);
        const std::string origin = host_end == std::string::npos ? base : base.substr(0, host_end);
        return origin + ref;
    }

    const std::string path = url_path(base);
    const auto slash = path.rfind('/');
    if (slash == std::string::npos || slash < scheme_end + 3) {
        return path + "/" + ref;
    }
    return path.substr(0, slash + 1) + ref;
}

} // namespace mz::util
