#include "mz/core/play_queue.hpp"

#include "mz/core/errors.hpp"
#include "mz/util/text.hpp"

#include <stdexcept>

namespace mz {

std::string to_string(loop_mode mode)
{
    switch (mode) {
        case loop_mode::off:   return "off";
        case loop_mode::track: return "track";
        case loop_mode::queue: return "queue";
    }
    return "off";
}

std::optional<loop_mode> parse_loop_mode(const std::string& text)
{
    const std::string s = util::to_lower(util::trim(text));
    if (s == "off" || s == "none") {
        return loop_mode::off;
    }
    if (s == "track" || s == "single" || s == "song") {
        return loop_mode::track;
    }
    if (s == "queue" || s == "all") {
        return loop_mode::queue;
    }
    return std::nullopt;
}

play_queue::play_queue(std::size_t max_size, std::uint32_t seed)
    : m_max_size(max_size)
    , m_rng(seed)
{
}

std::size_t play_queue::enqueue(track_ptr t, std::optional<std::size_t> position)
{
    if (!t) {
        throw std::invalid_argument("cannot enqueue an empty track");
    }
    if (m_items.size() >= m_max_size) {
        throw queue_full(m_max_size);
    }

    const std::size_t idx = (position.has_value() && *position <= m_items.size())
                          ? *position
                          : m_items.size();

    entry e;
    e.item = std::move(t);
    m_items.insert(m_items.begin() + static_cast<std::ptrdiff_t>(idx), std::move(e));

    // A pending cursor item has not started yet, so an insert at its slot plays first
    if (m_cursor.has_value() && (idx < *m_cursor || (idx == *m_cursor && !m_cursor_pending))) {
        ++*m_cursor;
    }
    if (idx < m_exhausted_at) {
        ++m_exhausted_at;
    }
    return idx;
}

std::optional<std::size_t> play_queue::advance()
{
    if (!m_cursor.has_value()) {
        return std::nullopt;
    }

    if (m_cursor_pending) {
        m_cursor_pending = false;
        if (m_shuffle) {
            return next_shuffled(false);
        }
        land_on(*m_cursor);
        return m_cursor;
    }

    if (m_loop == loop_mode::track) {
        return m_cursor;
    }

    if (m_shuffle) {
        return next_shuffled(true);
    }

    if (*m_cursor + 1 >= m_items.size()) {
        if (m_loop == loop_mode::queue) {
            land_on(0);
        } else {
            m_exhausted_at = m_items.size();
            m_cursor.reset();
        }
        return m_cursor;
    }

    land_on(*m_cursor + 1);
    return m_cursor;
}

std::optional<std::size_t> play_queue::next_shuffled(bool exclude_current)
{
    auto unplayed = [this, exclude_current]() {
        std::vector<std::size_t> out;
        for (std::size_t i = 0; i < m_items.size(); ++i) {
            if (m_items[i].played) {
                continue;
            }
            if (exclude_current && m_items.size() > 1 && m_cursor.has_value() && i == *m_cursor) {
                continue;
            }
            out.push_back(i);
        }
        return out;
    };

    auto choices = unplayed();
    if (choices.empty()) {
        if (m_loop != loop_mode::queue) {
            m_exhausted_at = m_items.size();
            m_cursor.reset();
            return std::nullopt;
        }
        // New pass
        for (auto& e : m_items) {
            e.played = false;
        }
        choices = unplayed();
        if (choices.empty()) {
            m_cursor.reset();
            return std::nullopt;
        }
    }

    std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
    land_on(choices[dist(m_rng)]);
    return m_cursor;
}

void play_queue::land_on(std::size_t index)
{
    m_cursor = index;
    m_items[index].played = true;
}

track_ptr play_queue::remove_at(std::size_t index)
{
    if (index >= m_items.size()) {
        throw index_out_of_range(index, m_items.size());
    }

    track_ptr removed = m_items[index].item;
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));

    if (index < m_exhausted_at) {
        --m_exhausted_at;
    }

    if (m_cursor.has_value()) {
        if (index < *m_cursor) {
            --*m_cursor;
        } else if (index == *m_cursor) {
            if (m_items.empty()) {
                m_cursor.reset();
                m_cursor_pending = false;
            } else if (*m_cursor < m_items.size()) {
                // The successor slid into place; it plays on the next advance
                m_cursor_pending = true;
            } else {
                m_cursor = m_items.size() - 1;
                m_cursor_pending = false;
            }
        }
    }

    return removed;
}

void play_queue::clear()
{
    m_items.clear();
    m_cursor.reset();
    m_cursor_pending = false;
    m_exhausted_at   = 0;
}

void play_queue::reorder(std::size_t from, std::size_t to)
{
    if (from >= m_items.size()) {
        throw index_out_of_range(from, m_items.size());
    }
    if (to >= m_items.size()) {
        throw index_out_of_range(to, m_items.size());
    }
    if (from == to) {
        return;
    }

    entry moved = std::move(m_items[from]);
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(from));
    m_items.insert(m_items.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));

    if (m_cursor.has_value()) {
        const std::size_t c = *m_cursor;
        if (c == from) {
            m_cursor = to;
        } else if (from < c && to >= c) {
            m_cursor = c - 1;
        } else if (from > c && to <= c) {
            m_cursor = c + 1;
        }
    }
}

void play_queue::set_cursor(std::size_t index)
{
    if (index >= m_items.size()) {
        throw index_out_of_range(index, m_items.size());
    }
    m_cursor_pending = false;
    land_on(index);
}

std::size_t play_queue::resume_index() const
{
    return m_exhausted_at < m_items.size() ? m_exhausted_at : 0;
}

track_ptr play_queue::current() const
{
    if (!m_cursor.has_value()) {
        return nullptr;
    }
    return m_items[*m_cursor].item;
}

void play_queue::set_shuffle(bool enabled)
{
    m_shuffle = enabled;
    if (!enabled) {
        return;
    }
    for (auto& e : m_items) {
        e.played = false;
    }
    if (m_cursor.has_value()) {
        m_items[*m_cursor].played = true;
    }
}

queue_snapshot play_queue::snapshot() const
{
    queue_snapshot snap;
    snap.items.reserve(m_items.size());
    for (const auto& e : m_items) {
        snap.items.push_back(e.item);
    }
    snap.cursor  = m_cursor;
    snap.loop    = m_loop;
    snap.shuffle = m_shuffle;
    return snap;
}

} // namespace mz
