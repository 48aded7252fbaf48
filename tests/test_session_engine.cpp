#include "mz/core/errors.hpp"
#include "mz/session/session_engine.hpp"

#include "fixtures/manual_executor.hpp"
#include "fixtures/recording_listener.hpp"
#include "fixtures/recording_sink.hpp"
#include "fixtures/scripted_preparer.hpp"
#include "fixtures/tracks.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace mz;
using namespace mz::session;
using namespace mz::tests::fixtures;

using events = std::vector<std::string>;

class SessionEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<session_engine> make(engine_options opts = {}) {
        return session_engine::create(dpp::snowflake(42), opts, preparer, sink, listener, exec.executor());
    }

    void add(const std::shared_ptr<session_engine>& s, std::initializer_list<const char*> titles) {
        for (const char* t : titles) {
            s->enqueue(make_test_track(t));
        }
    }

    std::shared_ptr<scripted_preparer>  preparer = std::make_shared<scripted_preparer>();
    std::shared_ptr<recording_sink>     sink     = std::make_shared<recording_sink>();
    std::shared_ptr<recording_listener> listener = std::make_shared<recording_listener>();
    manual_executor                     exec;
};

TEST_F(SessionEngineTest, PlayOnEmptyQueueReportsExhaustedAndStaysIdle)
{
    auto s = make();
    s->play();
    exec.run_all();

    EXPECT_EQ(listener->events(), events{ "queue_exhausted" });
    EXPECT_EQ(s->state(), playback_state::idle);
    EXPECT_EQ(sink->start_count(), 0u);
}

TEST_F(SessionEngineTest, TracksPlayInOrderThenQueueIsExhausted)
{
    auto s = make();
    add(s, { "a", "b", "c" });

    s->play();
    exec.run_all();
    for (int i = 0; i < 3; ++i) {
        sink->last_token().complete();
        exec.run_all();
    }

    EXPECT_EQ(listener->events(),
              (events{ "now_playing:a", "now_playing:b", "now_playing:c", "queue_exhausted" }));
    EXPECT_EQ(s->state(), playback_state::idle);
    EXPECT_FALSE(s->queue().cursor.has_value());
    EXPECT_EQ(s->now_playing(), nullptr);
}

TEST_F(SessionEngineTest, PreparationRunsOnExecutorNotCaller)
{
    auto s = make();
    add(s, { "a" });

    s->play();
    EXPECT_EQ(preparer->calls("a"), 0);
    EXPECT_TRUE(s->busy());
    EXPECT_EQ(exec.pending(), 1u);

    exec.run_all();
    EXPECT_EQ(preparer->calls("a"), 1);
    EXPECT_EQ(s->state(), playback_state::playing);
}

TEST_F(SessionEngineTest, SkipBeforePreparationFinishesPlaysOnlyTheNextTrack)
{
    auto s = make();
    add(s, { "a", "b" });

    s->play();
    EXPECT_TRUE(s->skip());
    exec.run_all();

    EXPECT_EQ(listener->count("now_playing"), 1u);
    EXPECT_EQ(listener->events(), events{ "now_playing:b" });
    EXPECT_EQ(sink->start_count(), 1u);
    EXPECT_EQ(sink->last_title(), "b");
}

TEST_F(SessionEngineTest, StopBeforePreparationFinishesPlaysNothing)
{
    auto s = make();
    add(s, { "a" });

    s->play();
    s->stop();
    exec.run_all();

    EXPECT_EQ(sink->start_count(), 0u);
    EXPECT_TRUE(listener->events().empty());
    EXPECT_TRUE(s->queue().items.empty());
    EXPECT_EQ(s->state(), playback_state::idle);
}

TEST_F(SessionEngineTest, CompletionFromReplacedStreamIsIgnored)
{
    auto s = make();
    add(s, { "a", "b", "c" });

    s->play();
    exec.run_all();
    const auto stale = sink->last_token();

    s->skip();
    exec.run_all();
    ASSERT_EQ(s->now_playing()->title, "b");

    stale.complete();
    exec.run_all();

    EXPECT_EQ(s->now_playing()->title, "b");
    EXPECT_EQ(listener->count("now_playing"), 2u);
    EXPECT_EQ(s->state(), playback_state::playing);
}

TEST_F(SessionEngineTest, EveryTeardownBumpsGeneration)
{
    auto s = make();
    add(s, { "a", "b" });

    const auto g0 = s->generation();
    s->play();
    exec.run_all();
    const auto g1 = s->generation();
    EXPECT_GT(g1, g0);
    EXPECT_EQ(sink->last_token().generation(), g1);

    s->skip();
    EXPECT_GT(s->generation(), g1);
}

TEST_F(SessionEngineTest, PauseAndResumeOnlyFromMatchingState)
{
    auto s = make();
    add(s, { "a" });

    EXPECT_FALSE(s->pause());
    s->play();
    exec.run_all();

    EXPECT_FALSE(s->resume());
    EXPECT_TRUE(s->pause());
    EXPECT_EQ(s->state(), playback_state::paused);
    EXPECT_FALSE(s->pause());
    EXPECT_TRUE(s->resume());
    EXPECT_EQ(s->state(), playback_state::playing);
    EXPECT_EQ(sink->pauses(), (std::vector<bool>{ true, false }));
}

TEST_F(SessionEngineTest, CompletionWhilePausedIsIgnored)
{
    auto s = make();
    add(s, { "a", "b" });
    s->play();
    exec.run_all();

    s->pause();
    sink->last_token().complete();
    exec.run_all();

    EXPECT_EQ(s->state(), playback_state::paused);
    EXPECT_EQ(s->now_playing()->title, "a");
}

TEST_F(SessionEngineTest, SkipWhileIdleDoesNothing)
{
    auto s = make();
    add(s, { "a" });
    EXPECT_FALSE(s->skip());
    EXPECT_EQ(exec.pending(), 0u);
}

TEST_F(SessionEngineTest, SkipPastLastTrackExhaustsQueue)
{
    auto s = make();
    add(s, { "a" });
    s->play();
    exec.run_all();

    EXPECT_TRUE(s->skip());
    exec.run_all();

    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "queue_exhausted" }));
    EXPECT_EQ(sink->stop_count(), 1);
    EXPECT_EQ(s->state(), playback_state::idle);
}

TEST_F(SessionEngineTest, PlayWhileBusyIsANoop)
{
    auto s = make();
    add(s, { "a", "b" });

    s->play();
    s->play();
    EXPECT_EQ(exec.pending(), 1u);
    exec.run_all();
    EXPECT_EQ(sink->start_count(), 1u);
}

TEST_F(SessionEngineTest, PlayIndexJumpsAndReplacesCurrentStream)
{
    auto s = make();
    add(s, { "a", "b", "c" });
    s->play();
    exec.run_all();

    s->play(2);
    exec.run_all();

    EXPECT_EQ(s->now_playing()->title, "c");
    EXPECT_EQ(sink->stop_count(), 1);
    EXPECT_THROW(s->play(3), index_out_of_range);
}

TEST_F(SessionEngineTest, LoopTrackReplaysOnCompletion)
{
    auto s = make();
    add(s, { "a", "b" });
    s->set_loop_mode(loop_mode::track);
    s->play();
    exec.run_all();

    sink->last_token().complete();
    exec.run_all();

    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "now_playing:a" }));
}

TEST_F(SessionEngineTest, LoopQueueWrapsAround)
{
    auto s = make();
    add(s, { "a", "b" });
    s->set_loop_mode(loop_mode::queue);
    s->play();
    exec.run_all();

    for (int i = 0; i < 2; ++i) {
        sink->last_token().complete();
        exec.run_all();
    }

    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "now_playing:b", "now_playing:a" }));
}

TEST_F(SessionEngineTest, FailedPreparationMovesOnToNextTrack)
{
    preparer->fail("a");
    auto s = make();
    add(s, { "a", "b" });

    s->play();
    exec.run_all();

    EXPECT_EQ(listener->events(), (events{ "track_error:a", "now_playing:b" }));
    EXPECT_EQ(s->state(), playback_state::playing);
}

TEST_F(SessionEngineTest, RetryBudgetExhaustionReportsPlaybackFailed)
{
    for (const char* t : { "a", "b", "c", "d" }) {
        preparer->fail(t);
    }
    engine_options opts;
    opts.retry_budget = 2;
    auto s = make(opts);
    add(s, { "a", "b", "c", "d" });

    s->play();
    exec.run_all();

    EXPECT_EQ(listener->events(),
              (events{ "track_error:a", "track_error:b", "track_error:c", "playback_failed" }));
    EXPECT_EQ(preparer->calls("d"), 0);
    EXPECT_EQ(s->state(), playback_state::idle);
    EXPECT_EQ(s->queue().cursor, std::optional<std::size_t>(2));
}

TEST_F(SessionEngineTest, SuccessResetsRetryCount)
{
    preparer->fail("a");
    preparer->fail("c");
    engine_options opts;
    opts.retry_budget = 1;
    auto s = make(opts);
    add(s, { "a", "b", "c", "d" });

    s->play();
    exec.run_all();
    sink->last_token().complete();
    exec.run_all();

    EXPECT_EQ(listener->events(),
              (events{ "track_error:a", "now_playing:b", "track_error:c", "now_playing:d" }));
}

TEST_F(SessionEngineTest, SinkFailureReportsTrackErrorAndAdvances)
{
    auto s = make();
    add(s, { "a", "b" });
    s->play();
    exec.run_all();

    sink->last_token().fail("decoder gave up");
    exec.run_all();

    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "track_error:a", "now_playing:b" }));
}

TEST_F(SessionEngineTest, PlayAfterExhaustionStartsAtNewlyAddedTrack)
{
    auto s = make();
    add(s, { "a" });
    s->play();
    exec.run_all();
    sink->last_token().complete();
    exec.run_all();

    add(s, { "b" });
    s->play();
    exec.run_all();

    EXPECT_EQ(s->now_playing()->title, "b");
}

TEST_F(SessionEngineTest, EnqueueAllIsAllOrNothing)
{
    engine_options opts;
    opts.max_queue_size = 3;
    auto s = make(opts);
    add(s, { "a" });

    EXPECT_THROW(s->enqueue_all({ make_test_track("b"), make_test_track("c"), make_test_track("d") }), queue_full);
    EXPECT_EQ(s->queue().items.size(), 1u);

    s->enqueue_all({ make_test_track("b"), make_test_track("c") });
    EXPECT_EQ(s->queue().items.size(), 3u);
}

TEST_F(SessionEngineTest, EnqueueAllStartsFirstAddedTrackWhenIdle)
{
    auto s = make();
    add(s, { "old" });

    const auto out = s->enqueue_all({ make_test_track("b"), make_test_track("c") }, true);
    EXPECT_EQ(out.index, 1u);
    EXPECT_TRUE(out.started);
    exec.run_all();
    EXPECT_EQ(s->now_playing()->title, "b");

    const auto again = s->enqueue_all({ make_test_track("d") }, true);
    EXPECT_EQ(again.index, 3u);
    EXPECT_FALSE(again.started);
    exec.run_all();
    EXPECT_EQ(s->now_playing()->title, "b");
}

TEST_F(SessionEngineTest, EnqueueAndPlayStartsOnlyWhenIdle)
{
    auto s = make();

    const auto first = s->enqueue_and_play(make_test_track("a"));
    EXPECT_TRUE(first.started);
    EXPECT_TRUE(s->busy());

    const auto second = s->enqueue_and_play(make_test_track("b"));
    EXPECT_FALSE(second.started);
    EXPECT_EQ(second.index, 1u);

    exec.run_all();
    EXPECT_EQ(listener->events(), events{ "now_playing:a" });
}

TEST_F(SessionEngineTest, RemovingPlayingTrackStopsItAndPlaysTheNext)
{
    auto s = make();
    add(s, { "a", "b" });
    s->play();
    exec.run_all();
    const auto old_token = sink->last_token();

    EXPECT_EQ(s->remove_at(0)->title, "a");
    EXPECT_EQ(sink->stop_count(), 1);
    EXPECT_EQ(s->now_playing(), nullptr);

    exec.run_all();
    EXPECT_EQ(s->now_playing()->title, "b");
    EXPECT_EQ(s->state(), playback_state::playing);
    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "now_playing:b" }));

    // The removed track's stream can no longer move the queue
    old_token.complete();
    exec.run_all();
    EXPECT_EQ(s->now_playing()->title, "b");
}

TEST_F(SessionEngineTest, RemovingOnlyPlayingTrackGoesIdle)
{
    auto s = make();
    add(s, { "a" });
    s->play();
    exec.run_all();

    s->remove_at(0);
    exec.run_all();

    EXPECT_EQ(sink->stop_count(), 1);
    EXPECT_EQ(s->state(), playback_state::idle);
    EXPECT_EQ(s->now_playing(), nullptr);
    EXPECT_EQ(listener->events(), (events{ "now_playing:a", "queue_exhausted" }));
}

TEST_F(SessionEngineTest, RemovingAnotherTrackLeavesPlaybackAlone)
{
    auto s = make();
    add(s, { "a", "b", "c" });
    s->play();
    exec.run_all();

    s->remove_at(2);
    exec.run_all();

    EXPECT_EQ(sink->stop_count(), 0);
    EXPECT_EQ(sink->start_count(), 1u);
    EXPECT_EQ(s->now_playing()->title, "a");
}

TEST_F(SessionEngineTest, VolumeIsClampedAndForwarded)
{
    auto s = make();
    EXPECT_EQ(s->queue().volume, 100);

    EXPECT_EQ(s->set_volume(40), 40);
    EXPECT_EQ(s->set_volume(250), 100);
    EXPECT_EQ(s->set_volume(-3), 0);

    EXPECT_EQ(sink->volumes(), (std::vector<int>{ 40, 100, 0 }));
    EXPECT_EQ(s->queue().volume, 0);
}

TEST_F(SessionEngineTest, ToggleShuffleReportsNewValue)
{
    auto s = make();
    EXPECT_TRUE(s->toggle_shuffle());
    EXPECT_TRUE(s->queue().shuffle);
    EXPECT_FALSE(s->toggle_shuffle());
}

TEST_F(SessionEngineTest, CommandsRefreshActivity)
{
    auto s = make();
    const auto before = s->last_activity();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    s->set_loop_mode(loop_mode::queue);
    EXPECT_GT(s->last_activity(), before);
}

TEST_F(SessionEngineTest, TokenOutlivingSessionIsHarmless)
{
    completion_token token;
    {
        auto s = make();
        add(s, { "a" });
        s->play();
        exec.run_all();
        token = sink->last_token();
    }
    EXPECT_NO_THROW(token.complete());
    EXPECT_EQ(exec.pending(), 0u);
}

TEST_F(SessionEngineTest, ConcurrentSkipsLeaveOneConsistentStream)
{
    auto s = make();
    for (int i = 0; i < 10; ++i) {
        s->enqueue(make_test_track("t" + std::to_string(i)));
    }
    s->set_loop_mode(loop_mode::queue);
    s->play();
    exec.run_all();

    std::atomic<bool> done{ false };
    std::thread runner([&] {
        while (!done.load()) {
            if (!exec.run_one()) {
                std::this_thread::yield();
            }
        }
    });

    std::vector<std::thread> skippers;
    for (int t = 0; t < 4; ++t) {
        skippers.emplace_back([&s] {
            for (int i = 0; i < 25; ++i) {
                s->skip();
            }
        });
    }
    for (auto& t : skippers) {
        t.join();
    }
    done = true;
    runner.join();
    exec.run_all();

    EXPECT_EQ(s->state(), playback_state::playing);
    EXPECT_EQ(sink->start_count(), listener->count("now_playing"));
    EXPECT_EQ(sink->last_token().generation(), s->generation());
    EXPECT_EQ(sink->last_title(), s->now_playing()->title);
}
