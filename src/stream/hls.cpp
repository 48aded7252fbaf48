#include "mz/stream/hls.hpp"

#include "mz/util/text.hpp"

#include <cstdlib>
#include <sstream>

namespace mz::stream {

hls_playlist parse_hls(const std::string& text, const std::string& base_url)
{
    hls_playlist out;
    std::istringstream in(text);
    std::string line;
    bool expect_variant = false;
    std::uint64_t bandwidth = 0;

    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty()) {
            continue;
        }

        if (line[0] == '#') {
            if (line.rfind("#EXT-X-STREAM-INF:", 0) == 0) {
                expect_variant = true;
                bandwidth = 0;
                const auto pos = line.find("BANDWIDTH=");
                if (pos != std::string::npos) {
                    bandwidth = std::strtoull(line.c_str() + pos + 10, nullptr, 10);
                }
            }
            continue;
        }

        const std::string url = util::resolve_url(base_url, line);
        if (expect_variant) {
            out.variants.push_back({ bandwidth, url });
            expect_variant = false;
        } else {
            out.segments.push_back(url);
        }
    }
    return out;
}

bool is_hls_url(const std::string& url)
{
    const std::string path = util::to_lower(util::url_path(url));
    return path.size() >= 5 && path.compare(path.size() - 5, 5, ".m3u8") == 0;
}

} // namespace mz::stream
