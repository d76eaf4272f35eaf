#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

#include "pollard_rho.h"

using namespace hfactor;

namespace {

RhoParams fixed(long x0, long c) {
    RhoParams rp;
    rp.x0 = x0;
    rp.c = c;
    return rp;
}

} // namespace

TEST(PollardRho, SplitsFifteenFromTwo) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(15));
    auto w = std::make_shared<PollardRhoWorker>(ctx, fixed(2, 1));
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(2)));

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, 3);
    EXPECT_EQ(v->q, 5);
    EXPECT_TRUE(ctx->stop.requested());
}

TEST(PollardRho, SplitsMediumSemiprime) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(101 * 103));
    auto w = std::make_shared<PollardRhoWorker>(ctx, fixed(2, 1), "rho#1");
    w->start();
    w->join();

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, 101);
    EXPECT_EQ(v->q, 103);
    EXPECT_EQ(ctx->slot.winner(), "rho#1");
}

TEST(PollardRho, SplitsTwentyDigitSemiprime) {
    const mpz_class p("4294967291");	// largest prime below 2^32
    const mpz_class q("4294967279");
    auto ctx = std::make_shared<RaceContext>(mpz_class(p * q));
    auto w = std::make_shared<PollardRhoWorker>(ctx, RhoParams::from_seed(ctx->N, 7));
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(60)));

    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->p, q);
    EXPECT_EQ(v->q, p);
}

TEST(PollardRho, EvenModulusSplitsOffTwo) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(4));
    auto w = std::make_shared<PollardRhoWorker>(ctx, fixed(2, 1));
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(2)));
    auto v = ctx->slot.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, (FactorPair{2, 2}));
}

TEST(PollardRho, CycleOnPrimeEndsWithoutResult) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(97));
    auto w = std::make_shared<PollardRhoWorker>(ctx, fixed(3, 1));
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(5)));
    EXPECT_FALSE(ctx->slot.filled());
    EXPECT_FALSE(ctx->stop.requested());
    EXPECT_EQ(ctx->slot.pending_searchers(), 0u);
}

TEST(PollardRho, IterationBudgetStopsWorker) {
    // 2^61 - 1 is prime; the walk would take ~2^30 steps to close.
    const mpz_class N = (mpz_class(1) << 61) - 1;
    auto ctx = std::make_shared<RaceContext>(N);
    RhoParams rp = fixed(2, 1);
    rp.max_iterations = 1000;
    auto w = std::make_shared<PollardRhoWorker>(ctx, rp);
    w->start();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(10)));
    EXPECT_FALSE(ctx->slot.filled());
    EXPECT_LE(w->progress(), 1000u);
}

TEST(PollardRho, StopsWhenSignalled) {
    const mpz_class N = (mpz_class(1) << 127) - 1;	// prime
    auto ctx = std::make_shared<RaceContext>(N);
    auto w = std::make_shared<PollardRhoWorker>(ctx, fixed(2, 1));
    w->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(w->finished());

    ctx->stop.request();
    ASSERT_TRUE(w->join_for(std::chrono::seconds(5)));
    EXPECT_FALSE(ctx->slot.filled());

    auto hb = ctx->heartbeats.snapshot()["rho"];
    EXPECT_GT(hb.beats, 0u);
    EXPECT_EQ(hb.progress, w->progress());
}

TEST(RhoParams, SeedsGiveDistinctWalks) {
    const mpz_class N("1000000016000000063");
    std::set<std::string> seen;
    for (std::uint64_t s = 1; s <= 16; ++s) {
        RhoParams rp = RhoParams::from_seed(N, s);
        EXPECT_GE(rp.c, 1);
        EXPECT_LE(rp.c, mpz_class(N - 3));
        EXPECT_GE(rp.x0, 0);
        EXPECT_LT(rp.x0, N);
        seen.insert(rp.c.get_str());
    }
    EXPECT_EQ(seen.size(), 16u);

    RhoParams a = RhoParams::from_seed(N, 42);
    RhoParams b = RhoParams::from_seed(N, 42);
    EXPECT_EQ(a.c, b.c);
    EXPECT_EQ(a.x0, b.x0);
}

namespace {

class FaultyWorker : public Worker {
public:
    using Worker::Worker;
    const char* kind() const override { return "faulty"; }

protected:
    std::optional<mpz_class> search() override {
        checkpoint(1);
        throw std::runtime_error("synthetic arithmetic fault");
    }
};

} // namespace

TEST(Worker, InternalFaultStopsOnlyThatWorker) {
    auto ctx = std::make_shared<RaceContext>(mpz_class(101 * 103));
    auto bad = std::make_shared<FaultyWorker>(ctx, "faulty");
    auto good = std::make_shared<PollardRhoWorker>(ctx, fixed(2, 1));
    bad->start();
    good->start();
    ASSERT_TRUE(bad->join_for(std::chrono::seconds(5)));
    ASSERT_TRUE(good->join_for(std::chrono::seconds(5)));

    EXPECT_FALSE(bad->succeeded());
    EXPECT_TRUE(good->succeeded());
    EXPECT_TRUE(ctx->slot.filled());
    EXPECT_EQ(ctx->slot.pending_searchers(), 0u);
}
