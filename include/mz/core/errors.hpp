#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "mz/core/track.hpp"

namespace mz {

/// Base of every error kind that may reach the front end.
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Transport-level failure of a single provider (timeout, refused, bad status).
class provider_unavailable : public error {
public:
    provider_unavailable(provider_id provider, const std::string& reason);

    provider_id provider() const { return m_provider; }

private:
    provider_id m_provider;
};

/// Every provider in the try-list was exhausted without a verified result.
class resolution_failed : public error {
public:
    resolution_failed(std::string query, std::vector<provider_id> tried);

    const std::string& query() const { return m_query; }
    const std::vector<provider_id>& tried() const { return m_tried; }

private:
    std::string              m_query;
    std::vector<provider_id> m_tried;
};

class stream_unavailable : public error {
public:
    using error::error;
};

class queue_full : public error {
public:
    explicit queue_full(std::size_t max_size);
};

class index_out_of_range : public error {
public:
    index_out_of_range(std::size_t index, std::size_t size);
};

class playlist_name_conflict : public error {
public:
    explicit playlist_name_conflict(const std::string& name);
};

class playlist_not_found : public error {
public:
    explicit playlist_not_found(const std::string& name);
};

class playlist_full : public error {
public:
    playlist_full(const std::string& name, std::size_t max_size);
};

/// A stop, skip or disconnect overtook a command that was still resolving.
class request_cancelled : public error {
public:
    explicit request_cancelled(const std::string& query);
};

class playback_failed : public error {
public:
    using error::error;
};

class config_error : public error {
public:
    using error::error;
};

} // namespace mz
