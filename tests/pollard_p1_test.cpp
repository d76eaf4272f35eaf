#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "pollard_p1.h"

using namespace hfactor;

namespace {

std::shared_ptr<PollardP1Worker> make_p1(const std::shared_ptr<RaceContext>& ctx,
                                         unsigned long base, unsigned long max) {
    P1Params p;
    p.base_bound = base;
    p.max_bound = max;
    return std::make_shared<PollardP1Worker>(ctx, p);
}

} // namespace

TEST(PollardP1, SplitsSmoothSemiprime) {
    // 13 - 1 = 2^2 * 3 and 17 - 1 = 2^4: both 50-smooth, so the batch overshoots
    // and the replay has to separate them.
    auto ctx = std::make_shared<RaceContext>(mpz_class(13 * 17));
    auto w = make_p1(ctx, 50, 50);
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(10)));

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, 13);
    EXPECT_EQ(v->q, 17);
    EXPECT_TRUE(w->succeeded());
    EXPECT_TRUE(ctx->stop.requested());
    EXPECT_EQ(ctx->slot.winner(), "p-1");
}

TEST(PollardP1, FindsFactorWithSmoothPredecessor) {
    // 1000003 - 1 = 2 * 3 * 166667 is not smooth; 2003 - 1 = 2 * 7 * 11 * 13 is.
    const mpz_class N = mpz_class(2003) * mpz_class(1000003);
    auto ctx = std::make_shared<RaceContext>(N);
    auto w = make_p1(ctx, 20, 1000);
    w->start();
    w->join();

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, 2003);
    EXPECT_EQ(v->q, 1000003);
}

TEST(PollardP1, EscalatesBound) {
    // 1019 - 1 = 2 * 509: needs B >= 509, so base 10 must grow to 1000.
    const mpz_class N = mpz_class(1019) * mpz_class(1000003);
    auto ctx = std::make_shared<RaceContext>(N);
    auto w = make_p1(ctx, 10, 1000);
    w->start();
    w->join();

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, 1019);
    EXPECT_GT(ctx->heartbeats.snapshot()["p-1"].beats, 1u);
}

TEST(PollardP1, GivesUpWithoutResultWhenNotSmooth) {
    // 1000003 - 1 = 2 * 3 * 166667; 1000033 - 1 = 2^5 * 3 * 11 * 947 needs B >= 947.
    const mpz_class N = mpz_class(1000003) * mpz_class(1000033);
    auto ctx = std::make_shared<RaceContext>(N);
    auto w = make_p1(ctx, 100, 900);
    w->start();
    w->join();

    EXPECT_FALSE(ctx->slot.filled());
    EXPECT_FALSE(w->succeeded());
    EXPECT_FALSE(ctx->stop.requested());
    EXPECT_EQ(ctx->slot.pending_searchers(), 0u);
    EXPECT_GT(w->progress(), 0u);
}

TEST(PollardP1, PrimeModulusEndsWithoutResult) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(97));
    auto w = make_p1(ctx, 1000, 1000);
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(10)));
    EXPECT_FALSE(ctx->slot.filled());
}

TEST(PollardP1, HonoursStopSignalWithinOneBatch) {
    // 2^89 - 1 is prime and N - 1 has a 10-digit prime factor: no bound here ends
    // the search early, only the stop signal does.
    const mpz_class N = (mpz_class(1) << 89) - 1;
    auto ctx = std::make_shared<RaceContext>(N);
    ctx->stop.request();
    P1Params p;
    p.base_bound = 1000;
    p.max_bound = 10000000;
    p.batch = 32;
    auto w = std::make_shared<PollardP1Worker>(ctx, p);
    w->start();
    EXPECT_TRUE(w->join_for(std::chrono::seconds(10)));
    EXPECT_FALSE(ctx->slot.filled());
    EXPECT_LE(w->progress(), 32u);
}
