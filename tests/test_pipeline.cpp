#include "mz/core/errors.hpp"
#include "mz/resolve/pipeline.hpp"

#include "fixtures/fake_http_client.hpp"

#include <gtest/gtest.h>

#include <atomic>

#include <dpp/json.h>

using namespace mz;
using namespace mz::providers;
using namespace mz::resolve;
using mz::tests::fixtures::fake_http_client;

namespace {

track_candidate candidate(provider_id p, const std::string& title, const std::string& ref)
{
    track_candidate c;
    c.title            = title;
    c.artist           = "Artist";
    c.duration_seconds = 200;
    c.provider         = p;
    c.media_refs       = { ref };
    c.variants         = { { quality::high, ref } };
    return c;
}

provider_adapter returning(provider_id id, std::vector<track_candidate> out, std::atomic<int>* calls = nullptr)
{
    provider_adapter a;
    a.id     = id;
    a.search = [out, calls](const std::string&, quality) {
        if (calls != nullptr) {
            ++*calls;
        }
        return out;
    };
    return a;
}

provider_adapter unavailable(provider_id id)
{
    provider_adapter a;
    a.id     = id;
    a.search = [id](const std::string&, quality) -> std::vector<track_candidate> {
        throw provider_unavailable(id, "connection refused");
    };
    return a;
}

// Reads a field the way a careless scraper would, so a null throws a
// json type_error out of search.
provider_adapter misparsing(provider_id id, std::string body)
{
    provider_adapter a;
    a.id     = id;
    a.search = [id, body](const std::string&, quality) {
        const auto j = dpp::json::parse(body);
        auto c = candidate(id, j.at("title").get<std::string>(), "https://broken.test/song");
        c.duration_seconds = j.at("duration").get<std::int64_t>() / 1000;
        return std::vector<track_candidate>{ c };
    };
    return a;
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    resolution_pipeline make(std::vector<provider_adapter> adapters, pipeline_options opts = {}) {
        auto verifier = std::make_shared<const url_verifier>(http, std::chrono::milliseconds(500));
        return resolution_pipeline(std::move(adapters), verifier, std::move(opts));
    }

    std::shared_ptr<fake_http_client> http = std::make_shared<fake_http_client>();
};

TEST_F(PipelineTest, FirstVerifiedProviderWins)
{
    http->serve_audio("https://a.test/song");
    std::atomic<int> b_calls{ 0 };

    auto p = make({ returning(provider_id::a, { candidate(provider_id::a, "Song", "https://a.test/song") }),
                    returning(provider_id::b, { candidate(provider_id::b, "Song", "https://b.test/song") }, &b_calls) });

    const auto t = p.resolve("song", std::nullopt, quality::high);
    EXPECT_EQ(t->source_provider, provider_id::a);
    EXPECT_EQ(t->media_ref, "https://a.test/song");
    EXPECT_EQ(t->requested_quality, quality::high);
    EXPECT_EQ(b_calls.load(), 0);
}

TEST_F(PipelineTest, UnverifiableResultFallsThroughToNextProvider)
{
    http->respond("https://a.test/song", 403, "", "text/html");
    http->serve_audio("https://b.test/song");

    auto p = make({ returning(provider_id::a, { candidate(provider_id::a, "Song", "https://a.test/song") }),
                    returning(provider_id::b, { candidate(provider_id::b, "Song", "https://b.test/song") }) });

    const auto t = p.resolve("song", std::nullopt, quality::high);
    EXPECT_EQ(t->source_provider, provider_id::b);
    EXPECT_EQ(t->media_ref, "https://b.test/song");
}

TEST_F(PipelineTest, LaterReferenceOfSameCandidateIsTried)
{
    http->serve_audio("https://a.test/second");
    auto c = candidate(provider_id::a, "Song", "https://a.test/first");
    c.media_refs.push_back("https://a.test/second");

    auto p = make({ returning(provider_id::a, { c }) });
    EXPECT_EQ(p.resolve("song", std::nullopt, quality::high)->media_ref, "https://a.test/second");
}

TEST_F(PipelineTest, OutageFallsThroughToNextProvider)
{
    http->serve_audio("https://c.test/song");

    auto p = make({ unavailable(provider_id::a),
                    returning(provider_id::b, {}),
                    returning(provider_id::c, { candidate(provider_id::c, "Song", "https://c.test/song") }) });

    EXPECT_EQ(p.resolve("song", std::nullopt, quality::high)->source_provider, provider_id::c);
}

TEST_F(PipelineTest, MalformedProviderDataFallsThroughToNextProvider)
{
    http->serve_audio("https://b.test/song");
    pipeline_options opts;
    opts.priority_order = { provider_id::c, provider_id::b };

    auto p = make({ misparsing(provider_id::c, R"({"title":"Song","duration":null})"),
                    returning(provider_id::b, { candidate(provider_id::b, "Song", "https://b.test/song") }) },
                  opts);

    const auto t = p.resolve("song", std::nullopt, quality::high);
    EXPECT_EQ(t->source_provider, provider_id::b);
    EXPECT_EQ(t->media_ref, "https://b.test/song");
}

TEST_F(PipelineTest, ExhaustionListsProvidersInTryOrder)
{
    pipeline_options opts;
    opts.priority_order = { provider_id::c, provider_id::a, provider_id::b };

    auto p = make({ unavailable(provider_id::a), returning(provider_id::b, {}), returning(provider_id::c, {}) }, opts);

    try {
        p.resolve("nothing anywhere", std::nullopt, quality::high);
        FAIL() << "expected resolution_failed";
    } catch (const resolution_failed& e) {
        EXPECT_EQ(e.query(), "nothing anywhere");
        EXPECT_EQ(e.tried(), (std::vector<provider_id>{ provider_id::c, provider_id::a, provider_id::b }));
    }
}

TEST_F(PipelineTest, PreferredProviderGoesFirstWithoutRepeats)
{
    auto p = make({ returning(provider_id::a, {}), returning(provider_id::b, {}), returning(provider_id::c, {}) });

    EXPECT_EQ(p.try_order(provider_id::b),
              (std::vector<provider_id>{ provider_id::b, provider_id::a, provider_id::c }));
    EXPECT_EQ(p.try_order(std::nullopt),
              (std::vector<provider_id>{ provider_id::a, provider_id::b, provider_id::c }));
}

TEST_F(PipelineTest, ProvidersWithoutAdapterAreSkipped)
{
    auto p = make({ returning(provider_id::c, {}) });
    EXPECT_EQ(p.try_order(provider_id::a), (std::vector<provider_id>{ provider_id::c }));
}

TEST_F(PipelineTest, BlankQueryFailsWithoutAskingAnyone)
{
    std::atomic<int> calls{ 0 };
    auto p = make({ returning(provider_id::a, {}, &calls) });

    try {
        p.resolve("   ", std::nullopt, quality::high);
        FAIL() << "expected resolution_failed";
    } catch (const resolution_failed& e) {
        EXPECT_TRUE(e.tried().empty());
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(PipelineTest, BestScoringCandidateIsCommitted)
{
    http->serve_audio("https://a.test/cover");
    http->serve_audio("https://a.test/original");

    auto p = make({ returning(provider_id::a, {
        candidate(provider_id::a, "Karaoke Version Instrumental", "https://a.test/cover"),
        candidate(provider_id::a, "Wonderwall", "https://a.test/original"),
    }) });

    EXPECT_EQ(p.resolve("wonderwall", std::nullopt, quality::high)->title, "Wonderwall");
}

TEST_F(PipelineTest, PreverifiedCandidateSkipsVerification)
{
    auto c = candidate(provider_id::a, "Page Song", "https://www.youtube.com/watch?v=AAAAAAAAAA1");
    c.kind     = media_kind::page;
    c.verified = true;
    c.variants.clear();

    auto p = make({ returning(provider_id::a, { c }) });
    const auto t = p.resolve("page song", std::nullopt, quality::low);

    EXPECT_EQ(t->kind, media_kind::page);
    EXPECT_EQ(t->requested_quality, quality::low);
    EXPECT_TRUE(http->requests().empty());
}
