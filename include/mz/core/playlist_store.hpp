#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <dpp/json.h>
#include <dpp/snowflake.h>

#include "mz/core/track.hpp"
#include "mz/log.hpp"

namespace mz {

/// Named, user-owned track collections, shared by every session.
///
/// Writes to one playlist are serialised on that playlist's own lock; the
/// index lock is only held exclusively to create, rename or delete, so reads
/// of one playlist never wait on writes to another.
class playlist_store {
public:
    explicit playlist_store(std::size_t max_playlist_size, logger log = {});

    /// Throws playlist_name_conflict if the owner already has `name`.
    void create(dpp::snowflake owner, const std::string& name);

    /// Appends to the owner's playlist, creating it first if missing.
    /// Returns the new size. Throws playlist_full.
    std::size_t add(dpp::snowflake owner, const std::string& name, track_ptr t);

    /// Copy of the tracks. Throws playlist_not_found.
    std::vector<track_ptr> tracks(dpp::snowflake owner, const std::string& name) const;

    /// Owner's playlist names, sorted.
    std::vector<std::string> list(dpp::snowflake owner) const;

    bool contains(dpp::snowflake owner, const std::string& name) const;
    bool remove(dpp::snowflake owner, const std::string& name);

    /// Throws playlist_not_found / playlist_name_conflict.
    void rename(dpp::snowflake owner, const std::string& from, const std::string& to);

    std::size_t max_playlist_size() const { return m_max_size; }

    // ---------- persistence ----------

    /// When set, every write is followed by a save to this file.
    void persist_to(std::string path);

    void load(const std::string& path);
    void save(const std::string& path) const;

    dpp::json to_json() const;
    void from_json(const dpp::json& j);

private:
    struct slot {
        std::mutex             mutex;
        std::string            name;
        std::vector<track_ptr> tracks;
    };

    using key = std::pair<std::uint64_t, std::string>;

    std::shared_ptr<slot> find_slot(dpp::snowflake owner, const std::string& name) const;
    void persist() const;

    std::size_t m_max_size;
    logger      m_log;

    mutable std::shared_mutex             m_index_mutex;
    std::map<key, std::shared_ptr<slot>>  m_slots;

    mutable std::mutex m_persist_mutex;
    std::string        m_persist_path;
};

} // namespace mz
