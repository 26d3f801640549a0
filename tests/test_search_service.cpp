#include <gtest/gtest.h>
#include <cmath>
#include <faiss/IndexFlat.h>
#include "errors.hpp"
#include "knn_faiss.hpp"
#include "search_service.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

namespace {

// Three 2-d movies: east, north-east, north.
std::unique_ptr<FaissIndex> make_compass_index() {
    auto index = std::make_unique<faiss::IndexFlatIP>(2);
    const float s = std::sqrt(0.5f);
    const float data[] = {1.0f, 0.0f, s, s, 0.0f, 1.0f};
    index->add(3, data);
    return std::make_unique<FaissIndex>(std::move(index));
}

Catalog catalog_from(const json& meta) {
    return parse_catalog(meta);
}

}  // namespace

TEST(SearchService, RanksByCosineSimilarity) {
    SearchService service(make_compass_index(), catalog_from(make_meta(2, 3)));

    auto results = service.search({1.0f, 0.0f}, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(*results[0].item->title, "Movie 0");
    EXPECT_EQ(*results[1].item->title, "Movie 1");
    EXPECT_NEAR(results[0].score, 1.0f, 1e-6);
    EXPECT_NEAR(results[1].score, std::sqrt(0.5f), 1e-6);
}

TEST(SearchService, QueryScaleDoesNotChangeScores) {
    SearchService service(make_compass_index(), catalog_from(make_meta(2, 3)));

    auto results = service.search({0.0f, 250.0f}, 3);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(*results[0].item->title, "Movie 2");
    EXPECT_NEAR(results[0].score, 1.0f, 1e-6);
    for (size_t i = 1; i < results.size(); i++) {
        EXPECT_GE(results[i - 1].score, results[i].score);
    }
}

TEST(SearchService, ResultsNeverExceedCatalog) {
    SearchService service(make_compass_index(), catalog_from(make_meta(2, 3)));
    EXPECT_EQ(service.search({1.0f, 1.0f}, 200).size(), 3u);
}

TEST(SearchService, ClampsTopKToCatalogSize) {
    auto fake = std::make_unique<FakeIndex>(4, 10, std::vector<Neighbor>{});
    FakeIndex* probe = fake.get();
    SearchService service(std::move(fake), catalog_from(make_meta(4, 10)));

    service.search({1.0f, 2.0f, 3.0f, 4.0f}, 500);
    EXPECT_EQ(probe->last_k, 10);
}

TEST(SearchService, PassesUnitQueryToIndex) {
    auto fake = std::make_unique<FakeIndex>(2, 3, std::vector<Neighbor>{});
    FakeIndex* probe = fake.get();
    SearchService service(std::move(fake), catalog_from(make_meta(2, 3)));

    service.search({3.0f, 4.0f}, 1);
    ASSERT_EQ(probe->last_query.size(), 2u);
    EXPECT_NEAR(probe->last_query[0], 0.6f, 1e-6);
    EXPECT_NEAR(probe->last_query[1], 0.8f, 1e-6);
}

TEST(SearchService, DropsUnfilledAndOutOfRangePositions) {
    std::vector<Neighbor> hits = {{0.9f, 2}, {0.8f, -1}, {0.7f, 7}, {0.6f, 0}};
    SearchService service(std::make_unique<FakeIndex>(2, 3, hits),
                          catalog_from(make_meta(2, 3)));

    auto results = service.search({1.0f, 0.0f}, 3);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(*results[0].item->title, "Movie 2");
    EXPECT_FLOAT_EQ(results[0].score, 0.9f);

    results = service.search({1.0f, 0.0f}, 4);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(*results[1].item->title, "Movie 0");
}

TEST(SearchService, ZeroVectorNeverReachesIndex) {
    auto fake = std::make_unique<FakeIndex>(2, 3, std::vector<Neighbor>{});
    FakeIndex* probe = fake.get();
    SearchService service(std::move(fake), catalog_from(make_meta(2, 3)));

    EXPECT_THROW(service.search({0.0f, 0.0f}, 2), QueryError);
    EXPECT_EQ(probe->last_k, 0);
}

TEST(SearchService, MissingDimIsServerFault) {
    json meta = make_meta(2, 3);
    meta.erase("dim");
    SearchService service(make_compass_index(), catalog_from(meta));
    EXPECT_THROW(service.search({1.0f, 0.0f}, 2), ServerFault);
}

TEST(SearchService, EmptyCatalogReturnsNothing) {
    SearchService service(std::make_unique<FakeIndex>(2, 0, std::vector<Neighbor>{}),
                          catalog_from(make_meta(2, 0)));
    EXPECT_TRUE(service.search({1.0f, 0.0f}, 5).empty());
}

TEST(ResultJoiner, SerializesScoreTwice) {
    Catalog catalog = catalog_from(make_meta(2, 1));
    auto results = join_results({{0.4242f, 0}}, catalog);
    ASSERT_EQ(results.size(), 1u);

    json out = results[0];
    EXPECT_EQ(out["score"], out["similarity"]);
    EXPECT_EQ(out["score"].get<float>(), 0.4242f);
    EXPECT_EQ(out["imdbId"], "tt1000000");
    EXPECT_EQ(out["productionCountry"], "US");
    EXPECT_EQ(out["moodTags"], json::array({"calm"}));
}
