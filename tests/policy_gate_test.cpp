#include "cache/policy_gate.hpp"
#include "util/future.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace qcache::cache;

class PolicyGateTest : public testing::Test {
protected:
    ErrorListener recorder() {
        return [this](const CacheError& error) { errors_.push_back(error.kind()); };
    }

    RequestContext ctx_;
    std::vector<ErrorKind> errors_;
};

TEST_F(PolicyGateTest, MissingPredicatesAllow) {
    PolicyGate gate({}, {}, recorder());

    EXPECT_TRUE(gate.may_read(ctx_));
    EXPECT_TRUE(gate.may_write(ctx_));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(PolicyGateTest, SynchronousPredicates) {
    PolicyGate gate(make_predicate([](const RequestContext&) { return false; }),
                    make_predicate([](const RequestContext&) { return true; }),
                    recorder());

    EXPECT_FALSE(gate.may_read(ctx_));
    EXPECT_TRUE(gate.may_write(ctx_));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(PolicyGateTest, PredicateSeesRequest) {
    ctx_.request.headers["x-cache-no-read"] = "1";
    PolicyGate gate(make_predicate([](const RequestContext& ctx) {
                        return !ctx.request.header("X-Cache-No-Read").has_value();
                    }),
                    {}, recorder());

    EXPECT_FALSE(gate.may_read(ctx_));
}

TEST_F(PolicyGateTest, WaitsForAsynchronousPredicate) {
    PolicyGate gate(
        [](const RequestContext&) {
            return std::async(std::launch::async, [] {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return true;
            });
        },
        {}, recorder());

    EXPECT_TRUE(gate.may_read(ctx_));
}

TEST_F(PolicyGateTest, ThrowingPredicateDeniesAndReports) {
    PolicyGate gate(
        [](const RequestContext&) -> std::future<bool> { throw std::runtime_error("boom"); },
        make_predicate([](const RequestContext&) -> bool { throw std::logic_error("bad"); }),
        recorder());

    EXPECT_FALSE(gate.may_read(ctx_));
    EXPECT_FALSE(gate.may_write(ctx_));
    ASSERT_EQ(errors_.size(), 2u);
    EXPECT_EQ(errors_[0], ErrorKind::PolicyPredicate);
    EXPECT_EQ(errors_[1], ErrorKind::PolicyPredicate);
}

TEST_F(PolicyGateTest, RejectedFutureDeniesAndReports) {
    PolicyGate gate(
        [](const RequestContext&) {
            return qcache::util::make_failed_future<bool>(
                std::make_exception_ptr(std::runtime_error("lookup failed")));
        },
        {}, recorder());

    EXPECT_FALSE(gate.may_read(ctx_));
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], ErrorKind::PolicyPredicate);
}

TEST_F(PolicyGateTest, EmptyFutureDeniesAndReports) {
    PolicyGate gate({}, [](const RequestContext&) { return std::future<bool>{}; }, recorder());

    EXPECT_FALSE(gate.may_write(ctx_));
    ASSERT_EQ(errors_.size(), 1u);
}
