#include <dpp/dpp.h>                // D++

#include <cstdlib>                  // getenv
#include <iostream>                 // std::cout, std::cerr
#include <memory>

#include "mz/commands/music.hpp"            // Slash commands
#include "mz/config.hpp"
#include "mz/core/errors.hpp"
#include "mz/core/playlist_store.hpp"
#include "mz/lavalink/client.hpp"           // Lavalink audio sink
#include "mz/net/cluster_http_client.hpp"
#include "mz/providers/provider_adapter.hpp"
#include "mz/resolve/pipeline.hpp"
#include "mz/service/music_service.hpp"
#include "mz/session/session_registry.hpp"
#include "mz/stream/download.hpp"
#include "mz/stream/stream_preparer.hpp"
#include "mz/util/worker_pool.hpp"

using namespace dpp;

namespace {

std::string config_path(int argc, char** argv)
{
    if (argc > 1) {
        return argv[1];
    }
    if (const char* env = std::getenv("MUZZOC_CONFIG")) {
        return env;
    }
    return "config.json";
}

} // namespace

int main(int argc, char** argv) {
    mz::config cfg;
    try {
        cfg = mz::load_config(config_path(argc, argv));
    } catch (const mz::config_error& e) {
        std::cerr << "Bad config: " << e.what() << std::endl;
        return 1;
    }

    const std::string token = mz::discord_token();
    if (token.empty()) {
        std::cerr << "No bot token: set DISCORD_TOKEN" << std::endl;
        return 1;
    }

    cluster bot(token, i_default_intents);
    bot.on_log(utility::cout_logger()); // D++ logger

    mz::logger log([&bot](loglevel level, const std::string& msg) {
        bot.log(level, msg);
    });

    mz::util::worker_pool workers(cfg.worker_threads, log);

    // ---------- Resolution ----------
    auto http     = std::make_shared<mz::net::cluster_http_client>(bot);
    auto verifier = std::make_shared<const mz::providers::url_verifier>(http, cfg.verification_timeout, log);

    mz::providers::adapter_options adapter_opts;
    adapter_opts.http                 = http;
    adapter_opts.timeout              = cfg.resolution_timeout;
    adapter_opts.soundcloud_client_id = cfg.soundcloud_client_id;
    adapter_opts.log                  = log;

    mz::resolve::pipeline_options pipeline_opts;
    pipeline_opts.priority_order  = cfg.provider_priority_order;
    pipeline_opts.scoring.title_tolerance = cfg.title_tolerance;

    auto pipeline = std::make_shared<const mz::resolve::resolution_pipeline>(
        mz::providers::make_default_adapters(adapter_opts), verifier, pipeline_opts, log);

    auto preparer = std::make_shared<mz::stream::http_stream_preparer>(http, verifier, cfg.resolution_timeout, log);

    // ---------- Playlists ----------
    auto playlists = std::make_shared<mz::playlist_store>(cfg.max_playlist_size, log);
    if (!cfg.playlist_store_path.empty()) {
        try {
            playlists->load(cfg.playlist_store_path);
        } catch (const mz::error& e) {
            log.log(ll_warning, std::string("Starting with no playlists: ") + e.what());
        }
        playlists->persist_to(cfg.playlist_store_path);
    }

    // ---------- Lavalink node ----------
    auto lavalink  = std::make_shared<mz::lavalink::node>(bot, cfg.lavalink);
    auto announcer = std::make_shared<mz::music::channel_announcer>(bot);

    // ---------- Sessions ----------
    mz::session::engine_options engine_opts;
    engine_opts.max_queue_size = cfg.max_queue_size;
    engine_opts.retry_budget   = cfg.retry_budget;

    mz::session::session_registry sessions(
        [engine_opts, preparer, lavalink, announcer, &workers, log](snowflake guild) {
            return mz::session::session_engine::create(guild, engine_opts, preparer, lavalink,
                                                       announcer, workers.executor(), log);
        },
        cfg.session_idle_timeout, log);

    mz::music::music_service service(pipeline, sessions, playlists, preparer,
                                     mz::stream::download_writer(cfg.download_path, log), log);

    mz::music::command_context ctx{ bot, service, *announcer, workers };

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&bot, &service, lavalink, announcer](const voice_state_update_t& ev) {
        lavalink->handle_voice_state_update(ev);

        // Kicked or moved out by someone else
        if (ev.state.user_id == bot.me.id && ev.state.channel_id.empty()) {
            service.disconnect(ev.state.guild_id);
            announcer->forget(ev.state.guild_id);
        }
    });

    bot.on_voice_server_update([lavalink](const voice_server_update_t& ev) {
        lavalink->handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&ctx](const slashcommand_t& event) {
        mz::music::route_slashcommand(event, ctx);
    });

    // ---------- Timers ----------
    bot.start_timer([lavalink](timer t) {
        (void)t;
        lavalink->poll_players();
    }, 2);

    bot.start_timer([&bot, &sessions, announcer, log](timer t) {
        (void)t;
        for (const auto& guild : sessions.reap_idle(mz::session::session_engine::clock::now())) {
            announcer->forget(guild);
            try {
                mz::music::leave_voice_channel(bot, guild);
            } catch (const mz::error& e) {
                log.log(ll_debug, "Idle guild " + guild.str() + " not left: " + e.what());
            }
        }
    }, 60);

    // ---------- on_ready ----------
    bot.on_ready([&bot, lavalink](const ready_t& event) {
        (void)event;

        std::cout << "Logged in as " << bot.me.username << "!" << std::endl;

        if (run_once<struct lavalink_session>()) {
            lavalink->ensure_session();
        }

        // Slash commands
        if (run_once<struct register_bot_commands>()) {
            std::cout << "Registering slash commands..." << std::endl;
            bot.global_bulk_command_create(mz::music::make_commands(bot));
            std::cout << "Registered slash commands!" << std::endl;
        }
    });

    // ---------- Start bot ----------
    bot.start(st_wait);
    workers.shutdown();
    return 0;
}
