#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "errors.hpp"
#include "query_normalizer.hpp"

namespace {

double l2(const std::vector<float>& v) {
    double s = 0.0;
    for (float x : v) s += static_cast<double>(x) * x;
    return std::sqrt(s);
}

}  // namespace

TEST(QueryNormalizer, ProducesUnitNorm) {
    std::vector<float> q = {3.0f, 4.0f, 12.0f};
    auto unit = normalize_query(q, 3);
    ASSERT_EQ(unit.size(), 3u);
    EXPECT_NEAR(l2(unit), 1.0, 1e-6);
    EXPECT_NEAR(unit[0], 3.0 / 13.0, 1e-6);
    EXPECT_NEAR(unit[2], 12.0 / 13.0, 1e-6);
}

TEST(QueryNormalizer, UnitVectorIsUnchanged) {
    auto unit = normalize_query({1.0f, 0.0f}, 2);
    EXPECT_FLOAT_EQ(unit[0], 1.0f);
    EXPECT_FLOAT_EQ(unit[1], 0.0f);
}

TEST(QueryNormalizer, TinyAndLargeMagnitudes) {
    EXPECT_NEAR(l2(normalize_query({1e-30f, 1e-30f}, 2)), 1.0, 1e-6);
    EXPECT_NEAR(l2(normalize_query({3e38f, 3e38f}, 2)), 1.0, 1e-6);
}

TEST(QueryNormalizer, RejectsZeroVector) {
    try {
        normalize_query({0.0f, 0.0f, 0.0f}, 3);
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_STREQ(e.what(), "vector norm is 0");
    }
}

TEST(QueryNormalizer, LengthMismatchNamesExpectedLength) {
    try {
        normalize_query({1.0f, 2.0f}, 384);
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_STREQ(e.what(), "vector must have length 384");
    }
    EXPECT_THROW(normalize_query({}, 2), QueryError);
}

TEST(QueryNormalizer, RejectsNonFinite) {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(normalize_query({1.0f, inf}, 2), QueryError);
    EXPECT_THROW(normalize_query({-inf, 1.0f}, 2), QueryError);
    EXPECT_THROW(normalize_query({nan, 1.0f}, 2), QueryError);
}

TEST(QueryNormalizer, NonPositiveDimIsServerFault) {
    EXPECT_THROW(normalize_query({1.0f}, 0), ServerFault);
    EXPECT_THROW(normalize_query({1.0f}, -4), ServerFault);
}

TEST(QueryNormalizer, DimCheckedBeforeLength) {
    // A broken catalog is reported as a server fault even for a bad query.
    EXPECT_THROW(normalize_query({}, 0), ServerFault);
}

TEST(EffectiveTopK, ClampsToCatalogSize) {
    EXPECT_EQ(effective_top_k(500, 10), 10);
    EXPECT_EQ(effective_top_k(2, 3), 2);
    EXPECT_EQ(effective_top_k(50, 50), 50);
}

TEST(EffectiveTopK, AtLeastOne) {
    EXPECT_EQ(effective_top_k(0, 10), 1);
    EXPECT_EQ(effective_top_k(-7, 10), 1);
}

TEST(EffectiveTopK, EmptyCatalog) {
    EXPECT_EQ(effective_top_k(5, 0), 0);
}
