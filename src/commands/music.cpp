#include "mz/commands/music.hpp"

#include "mz/core/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <variant>

namespace mz::music {

namespace {

constexpr std::size_t max_upload_bytes = 25 * 1024 * 1024;
constexpr std::size_t max_queue_lines  = 15;

std::optional<std::string> string_param(const dpp::slashcommand_t& ev, const std::string& name)
{
    const auto v = ev.get_parameter(name);
    if (std::holds_alternative<std::string>(v)) {
        return std::get<std::string>(v);
    }
    return std::nullopt;
}

std::optional<std::int64_t> int_param(const dpp::slashcommand_t& ev, const std::string& name)
{
    const auto v = ev.get_parameter(name);
    if (std::holds_alternative<std::int64_t>(v)) {
        return std::get<std::int64_t>(v);
    }
    return std::nullopt;
}

// Users count from 1
std::optional<std::size_t> index_param(const dpp::slashcommand_t& ev, const std::string& name)
{
    const auto v = int_param(ev, name);
    if (!v) {
        return std::nullopt;
    }
    if (*v < 1) {
        throw error("positions start at 1");
    }
    return static_cast<std::size_t>(*v - 1);
}

std::optional<provider_id> provider_param(const dpp::slashcommand_t& ev)
{
    const auto s = string_param(ev, "provider");
    if (!s) {
        return std::nullopt;
    }
    const auto p = parse_provider(*s);
    if (!p) {
        throw error("unknown provider '" + *s + "'");
    }
    return p;
}

play_request request_from(const dpp::slashcommand_t& ev)
{
    play_request req;
    req.query    = std::get<std::string>(ev.get_parameter("song"));
    req.provider = provider_param(ev);
    req.position = index_param(ev, "position");
    if (const auto q = string_param(ev, "quality")) {
        req.requested_quality = parse_quality(*q).value_or(quality::high);
    }
    return req;
}

std::string describe(const track_ptr& t)
{
    std::ostringstream oss;
    oss << "**" << t->title << "**";
    if (!t->artist.empty()) {
        oss << " by " << t->artist;
    }
    oss << " (" << format_duration(t->duration_seconds) << ") [" << provider_name(t->source_provider) << "]";
    return oss.str();
}

void send_voice_update(dpp::cluster& bot, dpp::snowflake guild, std::optional<dpp::snowflake> channel)
{
    dpp::guild* g = dpp::find_guild(guild);
    if (!g) {
        throw error("this server is not in my cache yet, try again in a moment");
    }

    // Raw op 4: the voice connection itself belongs to Lavalink
    dpp::json op;
    op["op"] = 4;
    op["d"]["guild_id"]  = guild.str();
    op["d"]["channel_id"] = channel ? dpp::json(channel->str()) : dpp::json(nullptr);
    op["d"]["self_mute"] = false;
    op["d"]["self_deaf"] = true;

    dpp::discord_client* shard = bot.get_shard(g->shard_id);
    if (!shard) {
        throw error("no gateway shard for this server");
    }
    shard->queue_message(op.dump());
}

void join_issuer_channel(dpp::cluster& bot, const dpp::slashcommand_t& ev)
{
    dpp::guild* g = dpp::find_guild(ev.command.guild_id);
    if (!g) {
        throw error("this server is not in my cache yet, try again in a moment");
    }
    const auto it = g->voice_members.find(ev.command.get_issuing_user().id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        throw error("join a voice channel first");
    }
    send_voice_update(bot, ev.command.guild_id, it->second.channel_id);
}

using reply_fn = std::function<dpp::message()>;

// Slow commands: acknowledge now, resolve on a worker, edit the reply later
void run_deferred(const dpp::slashcommand_t& ev, command_context& ctx, reply_fn fn)
{
    ev.thinking();
    dpp::cluster& bot = ctx.bot;
    ctx.workers.post([ev, fn = std::move(fn), &bot]() {
        dpp::message reply;
        try {
            reply = fn();
        } catch (const mz::error& e) {
            reply = dpp::message(std::string("Error: ") + e.what());
        } catch (const std::exception& e) {
            bot.log(dpp::ll_error, "Command /" + ev.command.get_command_name() + " failed: " + e.what());
            reply = dpp::message("Something went wrong.");
        }
        ev.edit_original_response(reply);
    });
}

void run_now(const dpp::slashcommand_t& ev, command_context& ctx, const std::function<std::string()>& fn)
{
    std::string text;
    try {
        text = fn();
    } catch (const mz::error& e) {
        text = std::string("Error: ") + e.what();
    } catch (const std::exception& e) {
        ctx.bot.log(dpp::ll_error, "Command /" + ev.command.get_command_name() + " failed: " + e.what());
        text = "Something went wrong.";
    }
    ev.reply(dpp::message(text));
}

std::string handle_playlist(const dpp::slashcommand_t& ev, music_service& service)
{
    const std::string action = std::get<std::string>(ev.get_parameter("action"));
    const auto owner = ev.command.get_issuing_user().id;
    const auto guild = ev.command.guild_id;
    const std::string name = string_param(ev, "name").value_or("");

    if (action == "list") {
        const auto names = service.playlist_list(owner);
        if (names.empty()) {
            return "You have no playlists.";
        }
        std::ostringstream oss;
        oss << "Your playlists:";
        for (const auto& n : names) {
            oss << "\n- " << n;
        }
        return oss.str();
    }

    if (name.empty()) {
        throw error("a playlist name is required for '" + action + "'");
    }

    if (action == "create") {
        service.playlist_create(owner, name);
        return "Created playlist **" + name + "**.";
    }
    if (action == "add") {
        const auto song = string_param(ev, "song");
        if (!song) {
            throw error("give a song to add");
        }
        play_request req;
        req.query = *song;
        req.provider = provider_param(ev);
        const auto size = service.playlist_add(owner, name, req);
        return "Added to **" + name + "** (" + std::to_string(size) + " tracks).";
    }
    if (action == "play") {
        const auto n = service.playlist_play(guild, owner, name);
        return "Queued " + std::to_string(n) + " tracks from **" + name + "**.";
    }
    if (action == "delete") {
        if (!service.playlist_delete(owner, name)) {
            throw playlist_not_found(name);
        }
        return "Deleted playlist **" + name + "**.";
    }
    if (action == "rename") {
        const auto to = string_param(ev, "new_name");
        if (!to) {
            throw error("give the new name");
        }
        service.playlist_rename(owner, name, *to);
        return "Renamed **" + name + "** to **" + *to + "**.";
    }
    throw error("unknown playlist action '" + action + "'");
}

} // namespace

void leave_voice_channel(dpp::cluster& bot, dpp::snowflake guild)
{
    send_voice_update(bot, guild, std::nullopt);
}

channel_announcer::channel_announcer(dpp::cluster& bot)
    : m_bot(bot)
{
}

void channel_announcer::remember(dpp::snowflake guild, dpp::snowflake channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels[guild] = channel;
}

void channel_announcer::forget(dpp::snowflake guild)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels.erase(guild);
}

void channel_announcer::post(dpp::snowflake guild, const std::string& text)
{
    dpp::snowflake channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(guild);
        if (it == m_channels.end()) {
            return;
        }
        channel = it->second;
    }
    m_bot.message_create(dpp::message(channel, text));
}

void channel_announcer::on_now_playing(dpp::snowflake guild, const track_ptr& t)
{
    post(guild, "Now playing: " + describe(t));
}

void channel_announcer::on_track_error(dpp::snowflake guild, const track_ptr& t, const std::string& reason)
{
    post(guild, "Could not play " + (t ? describe(t) : std::string("track")) + ": " + reason);
}

void channel_announcer::on_queue_exhausted(dpp::snowflake guild)
{
    post(guild, "Queue finished.");
}

void channel_announcer::on_playback_failed(dpp::snowflake guild, const std::string& reason)
{
    post(guild, "Playback stopped after repeated failures: " + reason);
}

std::string format_queue(const queue_snapshot& snap, const track_ptr& now_playing)
{
    std::ostringstream oss;
    if (now_playing) {
        oss << "Now playing: " << describe(now_playing) << "\n";
    }
    if (snap.items.empty()) {
        oss << "The queue is empty.";
        return oss.str();
    }

    oss << "Queue (" << snap.items.size() << " tracks, loop " << to_string(snap.loop)
        << (snap.shuffle ? ", shuffled" : "") << ", volume " << snap.volume << "%):";
    for (std::size_t i = 0; i < snap.items.size() && i < max_queue_lines; ++i) {
        oss << "\n" << (snap.cursor && *snap.cursor == i ? "> " : "  ")
            << (i + 1) << ". " << describe(snap.items[i]);
    }
    if (snap.items.size() > max_queue_lines) {
        oss << "\n... and " << (snap.items.size() - max_queue_lines) << " more";
    }
    return oss.str();
}

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    auto provider_option = [] {
        return dpp::command_option(dpp::co_string, "provider", "Where to look first", false)
            .add_choice(dpp::command_option_choice("YouTube", std::string("youtube")))
            .add_choice(dpp::command_option_choice("Spotify", std::string("spotify")))
            .add_choice(dpp::command_option_choice("SoundCloud", std::string("soundcloud")));
    };

    dpp::slashcommand play("play", "Play a song, or queue it if something is playing", bot.me.id);
    play.add_option(dpp::command_option(dpp::co_string, "song", "Song name or URL", true));
    play.add_option(provider_option());
    play.add_option(dpp::command_option(dpp::co_integer, "position", "Queue position (1 = front)", false));

    dpp::slashcommand addtoqueue("addtoqueue", "Add a song to the queue", bot.me.id);
    addtoqueue.add_option(dpp::command_option(dpp::co_string, "song", "Song name or URL", true));
    addtoqueue.add_option(provider_option());
    addtoqueue.add_option(dpp::command_option(dpp::co_integer, "position", "Queue position (1 = front)", false));

    dpp::slashcommand loop("loop", "Set the loop mode", bot.me.id);
    loop.add_option(
        dpp::command_option(dpp::co_string, "mode", "Loop mode", true)
            .add_choice(dpp::command_option_choice("Off", std::string("off")))
            .add_choice(dpp::command_option_choice("Track", std::string("track")))
            .add_choice(dpp::command_option_choice("Queue", std::string("queue")))
    );

    dpp::slashcommand volume("volume", "Set the playback volume", bot.me.id);
    volume.add_option(
        dpp::command_option(dpp::co_integer, "level", "Volume in percent", true)
            .set_min_value(0)
            .set_max_value(100)
    );

    dpp::slashcommand remove("remove", "Remove a song from the queue", bot.me.id);
    remove.add_option(dpp::command_option(dpp::co_integer, "position", "Queue position", true));

    dpp::slashcommand move("move", "Move a song within the queue", bot.me.id);
    move.add_option(dpp::command_option(dpp::co_integer, "from", "Current position", true));
    move.add_option(dpp::command_option(dpp::co_integer, "to", "New position", true));

    dpp::slashcommand playlist("playlist", "Manage your playlists", bot.me.id);
    playlist.add_option(
        dpp::command_option(dpp::co_string, "action", "What to do", true)
            .add_choice(dpp::command_option_choice("Create", std::string("create")))
            .add_choice(dpp::command_option_choice("Add", std::string("add")))
            .add_choice(dpp::command_option_choice("Play", std::string("play")))
            .add_choice(dpp::command_option_choice("List", std::string("list")))
            .add_choice(dpp::command_option_choice("Delete", std::string("delete")))
            .add_choice(dpp::command_option_choice("Rename", std::string("rename")))
    );
    playlist.add_option(dpp::command_option(dpp::co_string, "name", "Playlist name", false));
    playlist.add_option(dpp::command_option(dpp::co_string, "song", "Song to add", false));
    playlist.add_option(dpp::command_option(dpp::co_string, "new_name", "New name when renaming", false));
    playlist.add_option(provider_option());

    dpp::slashcommand download("download", "Download a song as a file", bot.me.id);
    download.add_option(dpp::command_option(dpp::co_string, "song", "Song name or URL", true));
    download.add_option(provider_option());
    download.add_option(
        dpp::command_option(dpp::co_string, "quality", "Audio quality", false)
            .add_choice(dpp::command_option_choice("High", std::string("high")))
            .add_choice(dpp::command_option_choice("Medium", std::string("medium")))
            .add_choice(dpp::command_option_choice("Low", std::string("low")))
    );

    return {
        play,
        dpp::slashcommand("pause", "Pause playback", bot.me.id),
        dpp::slashcommand("resume", "Resume playback", bot.me.id),
        dpp::slashcommand("skip", "Skip the current song", bot.me.id),
        dpp::slashcommand("stop", "Stop and clear the queue", bot.me.id),
        addtoqueue,
        dpp::slashcommand("clearqueue", "Clear the queue", bot.me.id),
        dpp::slashcommand("queue", "Show the queue", bot.me.id),
        dpp::slashcommand("nowplaying", "Show the current song", bot.me.id),
        loop,
        dpp::slashcommand("shuffle", "Toggle shuffle", bot.me.id),
        volume,
        remove,
        move,
        playlist,
        download,
        dpp::slashcommand("leave", "Leave the voice channel", bot.me.id),
    };
}

bool route_slashcommand(const dpp::slashcommand_t& ev, command_context& ctx)
{
    const std::string name = ev.command.get_command_name();
    const dpp::snowflake guild = ev.command.guild_id;
    music_service& service = ctx.service;

    if (name == "download") {
        run_deferred(ev, ctx, [ev, &service]() {
            play_request req = request_from(ev);
            auto file = service.download(req.query, req.provider, req.requested_quality);
            if (file.size() > max_upload_bytes) {
                throw error("the file is too large to upload");
            }

            const std::string path = file.path();
            const auto slash = path.find_last_of('/');
            dpp::message msg("Here you go.");
            msg.add_file(slash == std::string::npos ? path : path.substr(slash + 1), dpp::utility::read_file(path));
            return msg;
        });
        return true;
    }

    if (name == "playlist") {
        ctx.announcer.remember(guild, ev.command.channel_id);
        const std::string action = std::get<std::string>(ev.get_parameter("action"));
        if (action == "play") {
            try {
                join_issuer_channel(ctx.bot, ev);
            } catch (const mz::error& e) {
                ev.reply(dpp::message(std::string("Error: ") + e.what()));
                return true;
            }
        }
        run_deferred(ev, ctx, [ev, &service]() { return dpp::message(handle_playlist(ev, service)); });
        return true;
    }

    if (name == "play" || name == "addtoqueue") {
        ctx.announcer.remember(guild, ev.command.channel_id);
        const bool start = name == "play";
        if (start) {
            try {
                join_issuer_channel(ctx.bot, ev);
            } catch (const mz::error& e) {
                ev.reply(dpp::message(std::string("Error: ") + e.what()));
                return true;
            }
        }
        run_deferred(ev, ctx, [ev, &service, guild, start]() {
            const auto req = request_from(ev);
            const auto r = start ? service.play(guild, req) : service.enqueue(guild, req);
            std::ostringstream oss;
            if (r.started) {
                oss << "Playing " << describe(r.item);
            } else {
                oss << "Queued " << describe(r.item) << " at position " << (r.index + 1);
            }
            return dpp::message(oss.str());
        });
        return true;
    }

    if (name == "pause") {
        run_now(ev, ctx, [&] { return service.pause(guild) ? "Paused." : "Nothing is playing."; });
    } else if (name == "resume") {
        run_now(ev, ctx, [&] { return service.resume(guild) ? "Resumed." : "Nothing is paused."; });
    } else if (name == "skip") {
        run_now(ev, ctx, [&] { return service.skip(guild) ? "Skipped." : "Nothing to skip."; });
    } else if (name == "stop") {
        run_now(ev, ctx, [&] {
            service.stop(guild);
            return "Stopped and cleared the queue.";
        });
    } else if (name == "clearqueue") {
        run_now(ev, ctx, [&] {
            service.clear_queue(guild);
            return "Queue cleared.";
        });
    } else if (name == "queue") {
        run_now(ev, ctx, [&] { return format_queue(service.get_queue(guild), service.get_now_playing(guild)); });
    } else if (name == "nowplaying") {
        run_now(ev, ctx, [&] {
            const auto t = service.get_now_playing(guild);
            return t ? "Now playing: " + describe(t) : std::string("Nothing is playing.");
        });
    } else if (name == "loop") {
        run_now(ev, ctx, [&] {
            const std::string raw = std::get<std::string>(ev.get_parameter("mode"));
            const auto mode = parse_loop_mode(raw);
            if (!mode) {
                throw error("unknown loop mode '" + raw + "'");
            }
            service.set_loop_mode(guild, *mode);
            return "Loop mode: " + to_string(*mode) + ".";
        });
    } else if (name == "shuffle") {
        run_now(ev, ctx, [&] { return service.toggle_shuffle(guild) ? "Shuffle on." : "Shuffle off."; });
    } else if (name == "volume") {
        run_now(ev, ctx, [&] {
            const auto level = std::get<std::int64_t>(ev.get_parameter("level"));
            const int set = service.set_volume(guild, static_cast<int>(std::clamp<std::int64_t>(level, 0, 100)));
            return "Volume: " + std::to_string(set) + "%.";
        });
    } else if (name == "remove") {
        run_now(ev, ctx, [&] {
            const auto removed = service.remove(guild, *index_param(ev, "position"));
            return "Removed " + describe(removed) + ".";
        });
    } else if (name == "move") {
        run_now(ev, ctx, [&] {
            const auto from = *index_param(ev, "from");
            const auto to = *index_param(ev, "to");
            service.move(guild, from, to);
            return "Moved " + std::to_string(from + 1) + " to " + std::to_string(to + 1) + ".";
        });
    } else if (name == "leave") {
        run_now(ev, ctx, [&] {
            service.disconnect(guild);
            ctx.announcer.forget(guild);
            leave_voice_channel(ctx.bot, guild);
            return "Left the voice channel.";
        });
    } else {
        return false;
    }
    return true;
}

} // namespace mz::music
