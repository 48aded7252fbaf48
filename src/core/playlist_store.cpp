#include "mz/core/playlist_store.hpp"

#include "mz/core/errors.hpp"
#include "mz/util/text.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace mz {

namespace {

std::string checked_name(const std::string& name)
{
    std::string n = util::trim(name);
    if (n.empty()) {
        throw error("playlist name must not be empty");
    }
    return n;
}

} // namespace

playlist_store::playlist_store(std::size_t max_playlist_size, logger log)
    : m_max_size(max_playlist_size)
    , m_log(std::move(log))
{
}

std::shared_ptr<playlist_store::slot> playlist_store::find_slot(dpp::snowflake owner,
                                                                const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(m_index_mutex);
    auto it = m_slots.find(key{ static_cast<std::uint64_t>(owner), name });
    if (it == m_slots.end()) {
        return nullptr;
    }
    return it->second;
}

void playlist_store::create(dpp::snowflake owner, const std::string& name)
{
    const std::string n = checked_name(name);
    {
        std::unique_lock<std::shared_mutex> lock(m_index_mutex);
        const key k{ static_cast<std::uint64_t>(owner), n };
        if (m_slots.count(k) != 0) {
            throw playlist_name_conflict(n);
        }
        auto s  = std::make_shared<slot>();
        s->name = n;
        m_slots.emplace(k, std::move(s));
    }

    std::ostringstream oss;
    oss << "Created playlist '" << n << "' for owner " << owner;
    m_log.log(dpp::ll_info, oss.str());

    persist();
}

std::size_t playlist_store::add(dpp::snowflake owner, const std::string& name, track_ptr t)
{
    const std::string n = checked_name(name);

    auto s = find_slot(owner, n);
    if (!s) {
        std::unique_lock<std::shared_mutex> lock(m_index_mutex);
        auto& entry = m_slots[key{ static_cast<std::uint64_t>(owner), n }];
        if (!entry) {
            entry       = std::make_shared<slot>();
            entry->name = n;
        }
        s = entry;
    }

    std::size_t size = 0;
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->tracks.size() >= m_max_size) {
            throw playlist_full(n, m_max_size);
        }
        s->tracks.push_back(std::move(t));
        size = s->tracks.size();
    }

    persist();
    return size;
}

std::vector<track_ptr> playlist_store::tracks(dpp::snowflake owner, const std::string& name) const
{
    auto s = find_slot(owner, util::trim(name));
    if (!s) {
        throw playlist_not_found(name);
    }
    std::lock_guard<std::mutex> lock(s->mutex);
    return s->tracks;
}

std::vector<std::string> playlist_store::list(dpp::snowflake owner) const
{
    std::vector<std::string> names;
    std::shared_lock<std::shared_mutex> lock(m_index_mutex);
    const auto id = static_cast<std::uint64_t>(owner);
    for (auto it = m_slots.lower_bound(key{ id, std::string() });
         it != m_slots.end() && it->first.first == id; ++it) {
        names.push_back(it->first.second);
    }
    return names;
}

bool playlist_store::contains(dpp::snowflake owner, const std::string& name) const
{
    return find_slot(owner, util::trim(name)) != nullptr;
}

bool playlist_store::remove(dpp::snowflake owner, const std::string& name)
{
    {
        std::unique_lock<std::shared_mutex> lock(m_index_mutex);
        if (m_slots.erase(key{ static_cast<std::uint64_t>(owner), util::trim(name) }) == 0) {
            return false;
        }
    }
    persist();
    return true;
}

void playlist_store::rename(dpp::snowflake owner, const std::string& from, const std::string& to)
{
    const std::string old_name = util::trim(from);
    const std::string new_name = checked_name(to);
    {
        std::unique_lock<std::shared_mutex> lock(m_index_mutex);
        const auto id = static_cast<std::uint64_t>(owner);
        auto it = m_slots.find(key{ id, old_name });
        if (it == m_slots.end()) {
            throw playlist_not_found(old_name);
        }
        if (m_slots.count(key{ id, new_name }) != 0) {
            throw playlist_name_conflict(new_name);
        }
        auto s = it->second;
        m_slots.erase(it);
        {
            std::lock_guard<std::mutex> slot_lock(s->mutex);
            s->name = new_name;
        }
        m_slots.emplace(key{ id, new_name }, std::move(s));
    }
    persist();
}

void playlist_store::persist_to(std::string path)
{
    std::lock_guard<std::mutex> lock(m_persist_mutex);
    m_persist_path = std::move(path);
}

void playlist_store::persist() const
{
    std::lock_guard<std::mutex> lock(m_persist_mutex);
    if (m_persist_path.empty()) {
        return;
    }
    try {
        save(m_persist_path);
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_warning,
                  "Failed to persist playlists to " + m_persist_path + ": " + e.what());
    }
}

dpp::json playlist_store::to_json() const
{
    dpp::json j;
    j["playlists"] = dpp::json::array();

    std::shared_lock<std::shared_mutex> lock(m_index_mutex);
    for (const auto& [k, s] : m_slots) {
        dpp::json p;
        p["owner"]  = std::to_string(k.first);
        p["name"]   = k.second;
        p["tracks"] = dpp::json::array();

        std::lock_guard<std::mutex> slot_lock(s->mutex);
        for (const auto& t : s->tracks) {
            p["tracks"].push_back(track_to_json(*t));
        }
        j["playlists"].push_back(std::move(p));
    }
    return j;
}

void playlist_store::from_json(const dpp::json& j)
{
    std::map<key, std::shared_ptr<slot>> loaded;

    if (j.contains("playlists") && j["playlists"].is_array()) {
        for (const auto& p : j["playlists"]) {
            const std::string owner_str = p.value("owner", "");
            const std::string name      = util::trim(p.value("name", ""));
            if (owner_str.empty() || name.empty()) {
                continue;
            }

            std::uint64_t owner = 0;
            try {
                owner = std::stoull(owner_str);
            } catch (const std::exception&) {
                m_log.log(dpp::ll_warning, "Skipping playlist with bad owner id: " + owner_str);
                continue;
            }

            auto s  = std::make_shared<slot>();
            s->name = name;
            if (p.contains("tracks") && p["tracks"].is_array()) {
                for (const auto& jt : p["tracks"]) {
                    if (s->tracks.size() >= m_max_size) {
                        break;
                    }
                    try {
                        s->tracks.push_back(track_from_json(jt));
                    } catch (const std::invalid_argument& e) {
                        m_log.log(dpp::ll_warning,
                                  "Skipping stored track in '" + name + "': " + e.what());
                    }
                }
            }
            loaded[key{ owner, name }] = std::move(s);
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_index_mutex);
    m_slots = std::move(loaded);
}

void playlist_store::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        m_log.log(dpp::ll_info, "No playlist file at " + path + ", starting empty");
        return;
    }

    dpp::json j;
    try {
        j = dpp::json::parse(in);
    } catch (const dpp::json::exception& e) {
        throw error("playlist file " + path + " is corrupt: " + e.what());
    }
    from_json(j);

    std::size_t count = 0;
    {
        std::shared_lock<std::shared_mutex> lock(m_index_mutex);
        count = m_slots.size();
    }

    std::ostringstream oss;
    oss << "Loaded " << count << " playlist(s) from " << path;
    m_log.log(dpp::ll_info, oss.str());
}

void playlist_store::save(const std::string& path) const
{
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw error("cannot write " + tmp);
        }
        out << to_json().dump(2);
    }
    std::filesystem::rename(tmp, target);
}

} // namespace mz
