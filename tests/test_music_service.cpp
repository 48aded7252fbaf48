#include "mz/core/errors.hpp"
#include "mz/service/music_service.hpp"

#include "fixtures/fake_http_client.hpp"
#include "fixtures/manual_executor.hpp"
#include "fixtures/recording_listener.hpp"
#include "fixtures/recording_sink.hpp"
#include "fixtures/scripted_preparer.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <filesystem>
#include <random>
#include <thread>

using namespace mz;
using namespace mz::music;
using namespace mz::tests::fixtures;

namespace {

const dpp::snowflake kGuild = 900;
const dpp::snowflake kOwner = 77;

// Holds every search for `gated_query` until opened
class search_gate {
public:
    void wait_if(const std::string& query) {
        if (query != gated_query) {
            return;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_open; });
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }

    std::string gated_query;

private:
    std::mutex              m_mutex;
    std::condition_variable m_cv;
    bool                    m_entered = false;
    bool                    m_open    = false;
};

} // namespace

class MusicServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        download_dir = std::filesystem::temp_directory_path() / ("mz_service_" + std::to_string(rd()));

        providers::provider_adapter a;
        a.id     = provider_id::a;
        a.search = [this](const std::string& query, quality) {
            gate.wait_if(query);
            std::vector<providers::track_candidate> out;
            if (query == "nothing") {
                return out;
            }
            providers::track_candidate c;
            c.title      = query;
            c.artist     = "Artist";
            c.provider   = provider_id::a;
            c.media_refs = { "https://media.test/" + query + ".mp3" };
            c.verified   = true;
            out.push_back(c);
            return out;
        };

        auto verifier = std::make_shared<const providers::url_verifier>(http, std::chrono::milliseconds(500));
        auto pipeline = std::make_shared<const resolve::resolution_pipeline>(
            std::vector<providers::provider_adapter>{ a }, verifier, resolve::pipeline_options{});

        engine_opts.max_queue_size = 5;
        sessions = std::make_unique<session::session_registry>(
            [this](dpp::snowflake guild) {
                return session::session_engine::create(guild, engine_opts, preparer, sink, listener, exec.executor());
            },
            std::chrono::seconds(300));

        auto http_preparer = std::make_shared<stream::http_stream_preparer>(http, verifier, std::chrono::milliseconds(500));
        playlists = std::make_shared<playlist_store>(3);
        service = std::make_unique<music_service>(pipeline, *sessions, playlists, http_preparer,
                                                  stream::download_writer(download_dir.string()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(download_dir, ec);
    }

    static play_request req(const std::string& query) {
        play_request r;
        r.query = query;
        return r;
    }

    std::vector<std::string> queue_titles() const {
        std::vector<std::string> out;
        for (const auto& t : service->get_queue(kGuild).items) {
            out.push_back(t->title);
        }
        return out;
    }

    std::shared_ptr<fake_http_client>         http     = std::make_shared<fake_http_client>();
    std::shared_ptr<scripted_preparer>        preparer = std::make_shared<scripted_preparer>();
    std::shared_ptr<recording_sink>           sink     = std::make_shared<recording_sink>();
    std::shared_ptr<recording_listener>       listener = std::make_shared<recording_listener>();
    manual_executor                           exec;
    search_gate                               gate;
    session::engine_options                   engine_opts;
    std::unique_ptr<session::session_registry> sessions;
    std::shared_ptr<playlist_store>           playlists;
    std::unique_ptr<music_service>            service;
    std::filesystem::path                     download_dir;
};

TEST_F(MusicServiceTest, PlayOnIdleGuildStartsImmediately)
{
    const auto r = service->play(kGuild, req("first"));
    EXPECT_TRUE(r.started);
    EXPECT_EQ(r.index, 0u);
    EXPECT_EQ(r.item->title, "first");

    exec.run_all();
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "first");
}

TEST_F(MusicServiceTest, PlayWhileBusyOnlyQueues)
{
    service->play(kGuild, req("first"));
    exec.run_all();

    const auto r = service->play(kGuild, req("second"));
    EXPECT_FALSE(r.started);
    EXPECT_EQ(r.index, 1u);
    exec.run_all();
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "first");
}

TEST_F(MusicServiceTest, EnqueueNeverStartsPlayback)
{
    const auto r = service->enqueue(kGuild, req("queued"));
    EXPECT_FALSE(r.started);
    EXPECT_EQ(exec.pending(), 0u);
    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "queued" }));
}

TEST_F(MusicServiceTest, EnqueueAtPosition)
{
    service->enqueue(kGuild, req("a"));
    service->enqueue(kGuild, req("c"));

    auto r = req("b");
    r.position = 1;
    EXPECT_EQ(service->enqueue(kGuild, r).index, 1u);
    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "a", "b", "c" }));
}

TEST_F(MusicServiceTest, ResolutionFailureLeavesQueueUntouched)
{
    service->enqueue(kGuild, req("kept"));
    EXPECT_THROW(service->play(kGuild, req("nothing")), resolution_failed);
    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "kept" }));

    // The failed call gave up its turn
    EXPECT_NO_THROW(service->enqueue(kGuild, req("after")));
}

TEST_F(MusicServiceTest, FullQueueIsReported)
{
    for (int i = 0; i < 5; ++i) {
        service->enqueue(kGuild, req("t" + std::to_string(i)));
    }
    EXPECT_THROW(service->enqueue(kGuild, req("overflow")), queue_full);
}

TEST_F(MusicServiceTest, QueueChangesLandInCallOrder)
{
    gate.gated_query = "slow";

    std::thread first([this] { service->enqueue(kGuild, req("slow")); });
    gate.wait_entered();

    std::thread second([this] { service->enqueue(kGuild, req("fast")); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(queue_titles().empty());

    gate.open();
    first.join();
    second.join();

    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "slow", "fast" }));
}

TEST_F(MusicServiceTest, StopWhileResolvingDropsTheResult)
{
    service->play(kGuild, req("a"));
    exec.run_all();
    gate.gated_query = "slow";

    bool cancelled = false;
    std::thread pending([this, &cancelled] {
        try {
            service->play(kGuild, req("slow"));
        } catch (const request_cancelled&) {
            cancelled = true;
        }
    });
    gate.wait_entered();
    service->stop(kGuild);
    gate.open();
    pending.join();
    exec.run_all();

    EXPECT_TRUE(cancelled);
    EXPECT_EQ(service->get_now_playing(kGuild), nullptr);
    EXPECT_TRUE(queue_titles().empty());

    // Later requests are not affected
    EXPECT_TRUE(service->play(kGuild, req("after")).started);
}

TEST_F(MusicServiceTest, SkipWhileResolvingDropsTheResult)
{
    service->play(kGuild, req("a"));
    service->enqueue(kGuild, req("b"));
    exec.run_all();
    gate.gated_query = "slow";

    std::thread pending([this] {
        EXPECT_THROW(service->enqueue(kGuild, req("slow")), request_cancelled);
    });
    gate.wait_entered();
    EXPECT_TRUE(service->skip(kGuild));
    gate.open();
    pending.join();
    exec.run_all();

    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "a", "b" }));
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "b");
}

TEST_F(MusicServiceTest, DisconnectWhileResolvingDoesNotRecreateSession)
{
    service->enqueue(kGuild, req("a"));
    gate.gated_query = "slow";

    std::thread pending([this] {
        EXPECT_THROW(service->play(kGuild, req("slow")), request_cancelled);
    });
    gate.wait_entered();
    service->disconnect(kGuild);
    gate.open();
    pending.join();
    exec.run_all();

    EXPECT_EQ(sessions->size(), 0u);
    EXPECT_EQ(sink->start_count(), 0u);
}

TEST_F(MusicServiceTest, VolumeIsReportedInQueue)
{
    EXPECT_EQ(service->set_volume(kGuild, 30), 30);
    EXPECT_EQ(service->get_queue(kGuild).volume, 30);
    EXPECT_EQ(sink->volumes(), (std::vector<int>{ 30 }));
}

TEST_F(MusicServiceTest, ControlCommandsWithoutSessionReportNothingToDo)
{
    EXPECT_FALSE(service->pause(kGuild));
    EXPECT_FALSE(service->resume(kGuild));
    EXPECT_FALSE(service->skip(kGuild));
    EXPECT_NO_THROW(service->stop(kGuild));
    EXPECT_TRUE(service->get_queue(kGuild).items.empty());
    EXPECT_EQ(service->get_now_playing(kGuild), nullptr);
    EXPECT_THROW(service->remove(kGuild, 0), index_out_of_range);
    EXPECT_EQ(sessions->size(), 0u);
}

TEST_F(MusicServiceTest, PauseResumeSkipReachTheSession)
{
    service->play(kGuild, req("a"));
    service->enqueue(kGuild, req("b"));
    exec.run_all();

    EXPECT_TRUE(service->pause(kGuild));
    EXPECT_TRUE(service->resume(kGuild));
    EXPECT_TRUE(service->skip(kGuild));
    exec.run_all();
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "b");
}

TEST_F(MusicServiceTest, RemoveMoveAndClear)
{
    service->enqueue(kGuild, req("a"));
    service->enqueue(kGuild, req("b"));
    service->enqueue(kGuild, req("c"));

    service->move(kGuild, 0, 2);
    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "b", "c", "a" }));

    EXPECT_EQ(service->remove(kGuild, 1)->title, "c");
    EXPECT_THROW(service->remove(kGuild, 5), index_out_of_range);

    service->clear_queue(kGuild);
    EXPECT_TRUE(queue_titles().empty());
}

TEST_F(MusicServiceTest, LoopAndShuffleSettingsStick)
{
    service->set_loop_mode(kGuild, loop_mode::queue);
    EXPECT_TRUE(service->toggle_shuffle(kGuild));

    const auto snap = service->get_queue(kGuild);
    EXPECT_EQ(snap.loop, loop_mode::queue);
    EXPECT_TRUE(snap.shuffle);
}

TEST_F(MusicServiceTest, PlaylistLifecycle)
{
    service->playlist_create(kOwner, "faves");
    EXPECT_THROW(service->playlist_create(kOwner, "faves"), playlist_name_conflict);

    EXPECT_EQ(service->playlist_add(kOwner, "faves", req("one")), 1u);
    EXPECT_EQ(service->playlist_add(kOwner, "faves", req("two")), 2u);
    EXPECT_EQ(service->playlist_list(kOwner), (std::vector<std::string>{ "faves" }));

    service->playlist_rename(kOwner, "faves", "best");
    EXPECT_EQ(service->playlist_list(kOwner), (std::vector<std::string>{ "best" }));
    EXPECT_TRUE(service->playlist_delete(kOwner, "best"));
    EXPECT_TRUE(service->playlist_list(kOwner).empty());
}

TEST_F(MusicServiceTest, PlaylistAddWithUnresolvableQueryCreatesNothing)
{
    EXPECT_THROW(service->playlist_add(kOwner, "ghost", req("nothing")), resolution_failed);
    EXPECT_TRUE(service->playlist_list(kOwner).empty());
}

TEST_F(MusicServiceTest, PlaylistAddBeyondLimitThrows)
{
    for (const char* q : { "a", "b", "c" }) {
        service->playlist_add(kOwner, "small", req(q));
    }
    EXPECT_THROW(service->playlist_add(kOwner, "small", req("d")), playlist_full);
}

TEST_F(MusicServiceTest, PlaylistPlayQueuesAllAndStarts)
{
    service->playlist_add(kOwner, "mix", req("one"));
    service->playlist_add(kOwner, "mix", req("two"));

    EXPECT_EQ(service->playlist_play(kGuild, kOwner, "mix"), 2u);
    exec.run_all();

    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "one", "two" }));
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "one");
}

TEST_F(MusicServiceTest, PlaylistPlayAppendsBehindCurrentPlayback)
{
    service->play(kGuild, req("current"));
    exec.run_all();
    service->playlist_add(kOwner, "mix", req("one"));

    service->playlist_play(kGuild, kOwner, "mix");
    exec.run_all();

    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "current", "one" }));
    EXPECT_EQ(service->get_now_playing(kGuild)->title, "current");
}

TEST_F(MusicServiceTest, PlaylistPlayErrors)
{
    EXPECT_THROW(service->playlist_play(kGuild, kOwner, "missing"), playlist_not_found);

    service->playlist_create(kOwner, "empty");
    EXPECT_THROW(service->playlist_play(kGuild, kOwner, "empty"), error);
}

TEST_F(MusicServiceTest, PlaylistPlayThatWouldOverflowAddsNothing)
{
    for (int i = 0; i < 4; ++i) {
        service->enqueue(kGuild, req("q" + std::to_string(i)));
    }
    service->playlist_add(kOwner, "pair", req("x"));
    service->playlist_add(kOwner, "pair", req("y"));

    EXPECT_THROW(service->playlist_play(kGuild, kOwner, "pair"), queue_full);
    EXPECT_EQ(queue_titles().size(), 4u);
}

TEST_F(MusicServiceTest, DownloadWritesFileWithoutTouchingSessions)
{
    http->serve_audio("https://media.test/song.mp3", "ID3audio", "audio/mpeg");

    auto file = service->download("song", std::nullopt, quality::high);
    ASSERT_TRUE(static_cast<bool>(file));
    EXPECT_EQ(file.size(), 8u);
    EXPECT_EQ(std::filesystem::path(file.path()).extension(), ".mp3");
    EXPECT_EQ(sessions->size(), 0u);
}

TEST_F(MusicServiceTest, DownloadOfUnreachableStreamThrows)
{
    EXPECT_THROW(service->download("song", std::nullopt, quality::high), stream_unavailable);
}

TEST_F(MusicServiceTest, DisconnectDropsSession)
{
    service->play(kGuild, req("a"));
    exec.run_all();

    service->disconnect(kGuild);
    EXPECT_EQ(sessions->find(kGuild), nullptr);
    EXPECT_EQ(sink->stop_count(), 1);

    // A fresh session is created on the next command
    service->enqueue(kGuild, req("b"));
    EXPECT_EQ(queue_titles(), (std::vector<std::string>{ "b" }));
}
