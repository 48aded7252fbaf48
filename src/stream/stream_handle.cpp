#include "mz/stream/stream_handle.hpp"

#include "mz/core/errors.hpp"

namespace mz::stream {

stream_handle::stream_handle(track_ptr source,
                             quality tier,
                             std::string locator,
                             std::vector<std::string> segments,
                             std::shared_ptr<net::http_client> http,
                             std::chrono::milliseconds timeout)
    : m_source(std::move(source))
    , m_tier(tier)
    , m_locator(std::move(locator))
    , m_segments(std::move(segments))
    , m_http(std::move(http))
    , m_timeout(timeout)
{
}

std::optional<std::string> stream_handle::next_chunk()
{
    std::string url;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_next >= m_segments.size()) {
            return std::nullopt;
        }
        url = m_segments[m_next++];
    }

    net::http_response res;
    try {
        res = m_http->get(url, {}, m_timeout);
    } catch (const net::transport_error& e) {
        throw stream_unavailable(std::string("segment fetch failed: ") + e.what());
    }
    if (!res.ok()) {
        throw stream_unavailable("segment fetch returned status " + std::to_string(res.status));
    }
    return std::move(res.body);
}

void stream_handle::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
}

bool stream_handle::closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

} // namespace mz::stream
