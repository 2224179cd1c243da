#include "cache/cache_key.hpp"
#include "cache/errors.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <set>

using namespace qcache::cache;
using nlohmann::json;

class CacheKeyTest : public testing::Test {
protected:
    CacheKeyComponents components(std::string document = "{ droid(id: \"2001\") { name } }") {
        CacheKeyComponents c;
        c.document = std::move(document);
        return c;
    }

    CacheKeyBuilder builder_;
};

TEST_F(CacheKeyTest, SameRequestSameKey) {
    auto a = components();
    auto b = components();
    EXPECT_EQ(builder_.build_key(a, SessionMode::NoSession), builder_.build_key(b, SessionMode::NoSession));
}

TEST_F(CacheKeyTest, KeyHasPrefixAndHexDigest) {
    auto key = builder_.build_key(components(), SessionMode::NoSession);

    ASSERT_EQ(key.size(), 4u + 64u);
    EXPECT_TRUE(key.starts_with("fqc:"));
    EXPECT_EQ(key.find_first_not_of("0123456789abcdef", 4), std::string::npos);
}

TEST_F(CacheKeyTest, CustomPrefix) {
    CacheKeyBuilder builder("tenant-a:");
    EXPECT_TRUE(builder.build_key(components(), SessionMode::NoSession).starts_with("tenant-a:"));
    EXPECT_EQ(builder.prefixed("abc"), "tenant-a:abc");
}

TEST_F(CacheKeyTest, WhitespaceInDocumentChangesKey) {
    auto compact = components("{ droid { name } }");
    auto spaced = components("{  droid { name } }");
    EXPECT_NE(builder_.build_key(compact, SessionMode::NoSession),
              builder_.build_key(spaced, SessionMode::NoSession));
}

TEST_F(CacheKeyTest, VariableOrderDoesNotChangeKey) {
    auto a = components();
    a.variables = json::parse(R"({"id": "2001", "first": 3})");
    auto b = components();
    b.variables = json::parse(R"({"first": 3, "id": "2001"})");

    EXPECT_EQ(builder_.build_key(a, SessionMode::NoSession), builder_.build_key(b, SessionMode::NoSession));
}

TEST_F(CacheKeyTest, ComponentsAffectKey) {
    auto base = components();
    auto named = components();
    named.operation_name = "GetDroid";
    auto with_vars = components();
    with_vars.variables = json{{"id", "2001"}};
    auto with_extra = components();
    with_extra.extra = "en-US";

    std::set<std::string> keys{
        builder_.build_key(base, SessionMode::NoSession),
        builder_.build_key(named, SessionMode::NoSession),
        builder_.build_key(with_vars, SessionMode::NoSession),
        builder_.build_key(with_extra, SessionMode::NoSession),
    };
    EXPECT_EQ(keys.size(), 4u);
}

TEST_F(CacheKeyTest, BucketsAreDisjoint) {
    auto c = components();
    c.session_id = "alice";

    std::set<std::string> keys{
        builder_.build_key(c, SessionMode::NoSession),
        builder_.build_key(c, SessionMode::Private),
        builder_.build_key(c, SessionMode::AuthenticatedPublic),
    };
    EXPECT_EQ(keys.size(), 3u);
}

TEST_F(CacheKeyTest, SessionIdOnlyMattersForPrivateBucket) {
    auto alice = components();
    alice.session_id = "alice";
    auto bob = components();
    bob.session_id = "bob";

    EXPECT_NE(builder_.build_key(alice, SessionMode::Private), builder_.build_key(bob, SessionMode::Private));
    EXPECT_EQ(builder_.build_key(alice, SessionMode::AuthenticatedPublic),
              builder_.build_key(bob, SessionMode::AuthenticatedPublic));
}

TEST_F(CacheKeyTest, KeyDocumentShape) {
    auto c = components("{ a }");
    c.session_id = "alice";

    auto shared = key_document(c, SessionMode::AuthenticatedPublic);
    EXPECT_EQ(shared["source"], "{ a }");
    EXPECT_TRUE(shared["operationName"].is_null());
    EXPECT_EQ(shared["sessionMode"], 2);
    EXPECT_FALSE(shared.contains("sessionId"));

    auto priv = key_document(c, SessionMode::Private);
    EXPECT_EQ(priv["sessionMode"], 1);
    EXPECT_EQ(priv["sessionId"], "alice");
}

TEST_F(CacheKeyTest, RejectsNonObjectVariables) {
    EXPECT_THROW(canonicalize_variables(json::array({1, 2})), KeyDerivationError);
    EXPECT_THROW(canonicalize_variables(json("text")), KeyDerivationError);

    auto c = components();
    c.variables = json::array();
    EXPECT_THROW(builder_.build_key(c, SessionMode::NoSession), KeyDerivationError);
}

TEST_F(CacheKeyTest, RejectsNonFiniteNumbers) {
    json variables = {{"ratio", std::numeric_limits<double>::quiet_NaN()}};
    EXPECT_THROW(canonicalize_variables(variables), KeyDerivationError);

    json nested = {{"outer", {{"list", {1.0, std::numeric_limits<double>::infinity()}}}}};
    EXPECT_THROW(canonicalize_variables(nested), KeyDerivationError);
}

TEST_F(CacheKeyTest, RejectsInvalidUtf8) {
    json variables = {{"name", std::string("\xff\xfe")}};
    EXPECT_THROW(canonicalize_variables(variables), KeyDerivationError);
}

TEST_F(CacheKeyTest, NullVariablesCanonicalizeAsEmptyObject) {
    EXPECT_EQ(canonicalize_variables(json()), "{}");
    EXPECT_EQ(canonicalize_variables(json::object()), "{}");
}

TEST(Sha256Test, KnownDigest) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(StoreKeyHashTest, StableForEqualKeys) {
    StoreKeyHash hash;
    EXPECT_EQ(hash("fqc:abc"), hash(std::string("fqc:") + "abc"));
    EXPECT_NE(hash("fqc:abc"), hash("fqc:abd"));
}
