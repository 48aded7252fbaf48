#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mz/core/track.hpp"
#include "mz/net/http_client.hpp"

namespace mz::stream {

/// A prepared, ready-to-consume stream for one track. The segments are
/// fetched lazily and handed out as one continuous byte sequence.
/// A handle with no segments is locator-only: the sink opens `locator()`
/// itself (provider page references end up here).
class stream_handle {
public:
    stream_handle(track_ptr source,
                  quality tier,
                  std::string locator,
                  std::vector<std::string> segments,
                  std::shared_ptr<net::http_client> http,
                  std::chrono::milliseconds timeout);

    stream_handle(const stream_handle&) = delete;
    stream_handle& operator=(const stream_handle&) = delete;

    const track_ptr& source() const { return m_source; }
    quality tier() const { return m_tier; }
    const std::string& locator() const { return m_locator; }

    bool is_byte_stream() const { return !m_segments.empty(); }
    std::size_t segment_count() const { return m_segments.size(); }

    /// Bytes of the next segment, none once exhausted or closed.
    /// Throws stream_unavailable if a segment cannot be fetched.
    std::optional<std::string> next_chunk();

    void close();
    bool closed() const;

private:
    track_ptr                         m_source;
    quality                           m_tier;
    std::string                       m_locator;
    std::vector<std::string>          m_segments;
    std::shared_ptr<net::http_client> m_http;
    std::chrono::milliseconds         m_timeout;

    mutable std::mutex m_mutex;
    std::size_t        m_next   = 0;
    bool               m_closed = false;
};

using stream_handle_ptr = std::shared_ptr<stream_handle>;

} // namespace mz::stream
