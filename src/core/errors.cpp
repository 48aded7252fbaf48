#include "mz/core/errors.hpp"

#include <sstream>
#include <utility>

namespace mz {

provider_unavailable::provider_unavailable(provider_id provider, const std::string& reason)
    : error("provider " + provider_name(provider) + " unavailable: " + reason)
    , m_provider(provider)
{
}

namespace {

std::string describe_failure(const std::string& query, const std::vector<provider_id>& tried)
{
    std::ostringstream oss;
    oss << "no playable result for '" << query << "'";
    if (!tried.empty()) {
        oss << " (tried";
        for (const auto p : tried) {
            oss << ' ' << provider_name(p);
        }
        oss << ')';
    }
    return oss.str();
}

} // namespace

resolution_failed::resolution_failed(std::string query, std::vector<provider_id> tried)
    : error(describe_failure(query, tried))
    , m_query(std::move(query))
    , m_tried(std::move(tried))
{
}

queue_full::queue_full(std::size_t max_size)
    : error("queue is full (max " + std::to_string(max_size) + " tracks)")
{
}

index_out_of_range::index_out_of_range(std::size_t index, std::size_t size)
    : error("index " + std::to_string(index) + " out of range (size " + std::to_string(size) + ")")
{
}

request_cancelled::request_cancelled(const std::string& query)
    : error("'" + query + "' was dropped: playback was stopped or skipped while it was being looked up")
{
}

playlist_name_conflict::playlist_name_conflict(const std::string& name)
    : error("playlist '" + name + "' already exists")
{
}

playlist_not_found::playlist_not_found(const std::string& name)
    : error("playlist '" + name + "' not found")
{
}

playlist_full::playlist_full(const std::string& name, std::size_t max_size)
    : error("playlist '" + name + "' is full (max " + std::to_string(max_size) + " tracks)")
{
}

} // namespace mz
