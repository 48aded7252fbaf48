#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "mz/core/track.hpp"

namespace mz {

enum class loop_mode {
    off,
    track,
    queue
};

std::string to_string(loop_mode mode);
std::optional<loop_mode> parse_loop_mode(const std::string& text);

struct queue_snapshot {
    std::vector<track_ptr>     items;
    std::optional<std::size_t> cursor;
    loop_mode                  loop    = loop_mode::off;
    bool                       shuffle = false;
    int                        volume  = 100; // percent, filled in by the session
};

/// Ordered tracks of one session plus the play cursor and loop/shuffle policy.
/// Not synchronised; the owning session serialises access.
///
/// Invariant: the cursor is either empty or a valid index into the items.
class play_queue {
public:
    explicit play_queue(std::size_t max_size, std::uint32_t seed = std::random_device{}());

    /// Inserts at `position` when it is within [0, size], otherwise appends.
    /// Returns the index the track landed at. Throws queue_full.
    std::size_t enqueue(track_ptr t, std::optional<std::size_t> position = std::nullopt);

    /// Moves the cursor according to loop and shuffle policy.
    /// Returns the new cursor; empty once the queue is exhausted.
    std::optional<std::size_t> advance();

    track_ptr remove_at(std::size_t index);
    void clear();
    void reorder(std::size_t from, std::size_t to);

    /// Points the cursor at `index` (throws index_out_of_range).
    void set_cursor(std::size_t index);

    /// Where playback should begin when nothing is current: the first item
    /// appended after the queue was last exhausted, else the start.
    std::size_t resume_index() const;

    std::optional<std::size_t> cursor() const { return m_cursor; }
    track_ptr current() const;

    std::size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }
    std::size_t max_size() const { return m_max_size; }

    loop_mode loop() const { return m_loop; }
    void set_loop(loop_mode mode) { m_loop = mode; }

    bool shuffle() const { return m_shuffle; }
    void set_shuffle(bool enabled);

    queue_snapshot snapshot() const;

private:
    struct entry {
        track_ptr item;
        bool      played = false;
    };

    std::optional<std::size_t> next_shuffled(bool exclude_current);
    void land_on(std::size_t index);

    std::vector<entry>         m_items;
    std::optional<std::size_t> m_cursor;
    // The cursor item replaced a removed current item and has not started yet
    bool                       m_cursor_pending = false;
    // Items before this index were played through when the queue was last exhausted
    std::size_t                m_exhausted_at   = 0;
    loop_mode                  m_loop           = loop_mode::off;
    bool                       m_shuffle        = false;
    std::size_t                m_max_size;
    std::mt19937               m_rng;
};

} // namespace mz
