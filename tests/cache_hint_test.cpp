#include "cache/cache_hint.hpp"

#include <gtest/gtest.h>

using namespace qcache::cache;

class HintAggregatorTest : public testing::Test {
protected:
    static FieldHint field(std::vector<std::string> path,
                           std::optional<std::uint32_t> max_age,
                           std::optional<CacheScope> scope = std::nullopt) {
        return FieldHint{.path = std::move(path), .hint = CacheHint{.max_age = max_age, .scope = scope}};
    }
};

TEST_F(HintAggregatorTest, EmptyTreeIsUncacheable) {
    HintAggregator aggregator(AggregatorConfig{.default_max_age = 60});
    auto policy = aggregator.aggregate({});

    EXPECT_EQ(policy.max_age, 0u);
    EXPECT_FALSE(policy.cacheable());
    EXPECT_EQ(policy.scope, CacheScope::Public);
}

TEST_F(HintAggregatorTest, MinimumMaxAgeWins) {
    HintAggregator aggregator;
    auto policy = aggregator.aggregate({
        field({"droid"}, 60),
        field({"droid", "friends"}, 30),
        field({"droid", "name"}, 120),
    });

    EXPECT_EQ(policy.max_age, 30u);
    EXPECT_TRUE(policy.cacheable());
    EXPECT_TRUE(policy.possible_root_fields_cacheable);
}

TEST_F(HintAggregatorTest, UnhintedFieldTakesDefaultMaxAge) {
    HintAggregator no_default;
    EXPECT_EQ(no_default.aggregate({field({"droid"}, 60), field({"droid", "friends"}, std::nullopt)}).max_age, 0u);

    HintAggregator with_default(AggregatorConfig{.default_max_age = 10});
    EXPECT_EQ(with_default.aggregate({field({"droid"}, 60), field({"droid", "friends"}, std::nullopt)}).max_age, 10u);
}

TEST_F(HintAggregatorTest, AnyPrivateFieldMakesResponsePrivate) {
    HintAggregator aggregator;
    auto policy = aggregator.aggregate({
        field({"me"}, 60, CacheScope::Public),
        field({"me", "cart"}, 60, CacheScope::Private),
    });

    EXPECT_EQ(policy.scope, CacheScope::Private);
    EXPECT_EQ(policy.max_age, 60u);
}

TEST_F(HintAggregatorTest, ZeroRootMaxAgeIsNotRootCacheable) {
    HintAggregator aggregator;
    auto policy = aggregator.aggregate({field({"now"}, 0), field({"now", "value"}, 60)});

    EXPECT_FALSE(policy.possible_root_fields_cacheable);
    EXPECT_FALSE(policy.cacheable());
}

TEST_F(HintAggregatorTest, EffectiveMaxAgePrefersExplicitHint) {
    HintAggregator aggregator(AggregatorConfig{.default_max_age = 5});

    EXPECT_EQ(aggregator.effective_max_age(CacheHint{}), 5u);
    EXPECT_EQ(aggregator.effective_max_age(CacheHint{.max_age = 0}), 0u);
    EXPECT_EQ(aggregator.effective_max_age(CacheHint{.max_age = 90}), 90u);
}

TEST(CacheScopeTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parse_scope("PUBLIC"), CacheScope::Public);
    EXPECT_EQ(parse_scope("private"), CacheScope::Private);
    EXPECT_EQ(parse_scope("Private"), CacheScope::Private);
    EXPECT_FALSE(parse_scope("shared").has_value());
    EXPECT_EQ(to_string(CacheScope::Private), "PRIVATE");
}
