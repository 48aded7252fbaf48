#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mz/core/track.hpp"
#include "mz/log.hpp"
#include "mz/net/http_client.hpp"
#include "mz/providers/url_verifier.hpp"
#include "mz/stream/stream_handle.hpp"

namespace mz::stream {

class stream_preparer {
public:
    virtual ~stream_preparer() = default;

    /// Blocking. Throws stream_unavailable when no variant of the track
    /// can be opened.
    virtual stream_handle_ptr prepare(const track_ptr& t) = 0;
};

/// Picks the best reachable variant for the requested tier and expands
/// HLS playlists into their segment lists.
class http_stream_preparer : public stream_preparer {
public:
    http_stream_preparer(std::shared_ptr<net::http_client> http,
                         std::shared_ptr<const providers::url_verifier> verifier,
                         std::chrono::milliseconds timeout,
                         logger log = {});

    stream_handle_ptr prepare(const track_ptr& t) override;

    struct choice {
        quality     tier;
        std::string url;
    };

    /// Requested tier, lower tiers, higher tiers, then the primary media_ref.
    static std::vector<choice> variant_order(const track& t);

private:
    stream_handle_ptr open(const track_ptr& t, const choice& c);
    std::vector<std::string> expand_hls(const std::string& url, int depth);

    std::shared_ptr<net::http_client>              m_http;
    std::shared_ptr<const providers::url_verifier> m_verifier;
    std::chrono::milliseconds                      m_timeout;
    logger                                         m_log;
};

} // namespace mz::stream
