#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace mz::net {

using header_map = std::multimap<std::string, std::string>;

struct http_response {
    uint16_t    status = 0;
    std::string body;
    header_map  headers;

    bool ok() const { return status >= 200 && status < 300; }

    /// Case-insensitive header lookup, empty if absent.
    std::string header(const std::string& name) const;
};

/// Timeout, refused connection, DNS failure: no HTTP status at all.
class transport_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Blocking GET used by every outbound fetch. Implementations throw
/// transport_error when no response arrives within `timeout`.
class http_client {
public:
    virtual ~http_client() = default;

    virtual http_response get(const std::string& url,
                              const header_map& headers,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace mz::net
