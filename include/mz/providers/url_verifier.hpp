#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "mz/log.hpp"
#include "mz/net/http_client.hpp"

namespace mz::providers {

/// Checks a media URL with a two-byte ranged GET and accepts it only if the
/// answer looks like audio (or a playlist of it). Never throws: an
/// unreachable or expired URL is an ordinary "no".
class url_verifier {
public:
    url_verifier(std::shared_ptr<net::http_client> http,
                 std::chrono::milliseconds timeout,
                 logger log = {});

    bool verify(const std::string& media_ref) const;

    static bool is_playable_content_type(const std::string& content_type);

private:
    std::shared_ptr<net::http_client> m_http;
    std::chrono::milliseconds         m_timeout;
    logger                            m_log;
};

} // namespace mz::providers
