#include <gtest/gtest.h>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

#include "../core/Types.hpp"
#include "../core/CardHand.hpp"

using namespace koi::core;

namespace
{
    constexpr double Eps = 1e-9;

    // 1000x800 with the default config: an 800px hand on a 400px radius, and
    // 80px (0.2 rad) of arc per card until the fan reaches its full half angle.
    inline CardHand MakeHand()
    {
        return CardHand(1000.0, 800.0);
    }

    inline auto ArcStep() -> double
    {
        return 0.2;
    }
}

TEST(HandLayout, EmptyCountGivesNoTargets)
{
    CardHand const hand = MakeHand();
    EXPECT_TRUE(hand.MakeTargets(0).empty());
}

TEST(HandLayout, ReturnsOneTargetPerCard)
{
    CardHand const hand = MakeHand();
    for (std::size_t n = 0; n <= 40; ++n)
    {
        EXPECT_EQ(hand.MakeTargets(n).size(), n) << "count " << n;
    }
}

TEST(HandLayout, SingleCardIsCentred)
{
    CardHand const hand = MakeHand();
    TargetsT const t = hand.MakeTargets(1);
    ASSERT_EQ(t.size(), 1u);
    EXPECT_NEAR(t[0].x, 500.0, Eps);
    // viewport height * (1 - raise)
    EXPECT_NEAR(t[0].y, 680.0, Eps);
}

TEST(HandLayout, IsPureForSameInputs)
{
    CardHand const hand = MakeHand();
    TargetsT const a = hand.MakeTargets(5);
    TargetsT const b = hand.MakeTargets(5);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i{}; i < a.size(); ++i)
    {
        EXPECT_EQ(a[i], b[i]);
    }
}

TEST(HandLayout, TwoCardsSitEitherSideOfCentre)
{
    CardHand const hand = MakeHand();
    TargetsT const t = hand.MakeTargets(2);
    ASSERT_EQ(t.size(), 2u);

    double const half = 0.5 * ArcStep();
    EXPECT_NEAR(t[0].x, 500.0 - 400.0 * std::sin(half), 1e-6);
    EXPECT_NEAR(t[1].x, 500.0 + 400.0 * std::sin(half), 1e-6);
    EXPECT_NEAR(t[0].y, 1080.0 - 400.0 * std::cos(half), 1e-6);
    EXPECT_NEAR(t[1].y, t[0].y, 1e-6);
}

TEST(HandLayout, FanIsSymmetricAndLeftToRight)
{
    CardHand const hand = MakeHand();
    for (std::size_t n = 2; n <= 12; ++n)
    {
        TargetsT const t = hand.MakeTargets(n);
        for (std::size_t i{}; i < n; ++i)
        {
            TargetsT::value_type const& l = t[i];
            TargetsT::value_type const& r = t[n - 1 - i];
            EXPECT_NEAR(l.x - 500.0, -(r.x - 500.0), 1e-6) << "count " << n << " slot " << i;
            EXPECT_NEAR(l.y, r.y, 1e-6) << "count " << n << " slot " << i;
            if (i > 0)
            {
                EXPECT_LT(t[i - 1].x, t[i].x);
            }
        }
    }
}

TEST(HandLayout, SpacingIsConstantBelowFullFan)
{
    CardHand const hand = MakeHand();
    double const chord = 2.0 * 400.0 * std::sin(0.5 * ArcStep());

    for (std::size_t n = 2; n <= 8; ++n)
    {
        TargetsT const t = hand.MakeTargets(n);
        for (std::size_t i = 1; i < n; ++i)
        {
            double const d = std::hypot(t[i].x - t[i - 1].x, t[i].y - t[i - 1].y);
            EXPECT_NEAR(d, chord, 1e-6) << "count " << n << " slot " << i;
        }
    }
}

TEST(HandLayout, CompressesOnceFanIsFull)
{
    CardHand const hand = MakeHand();
    // 19 gaps of 0.2 rad exceed the pi/2 half angle, so the fan is clamped
    TargetsT const t = hand.MakeTargets(20);
    ASSERT_EQ(t.size(), 20u);
    EXPECT_NEAR(t.front().x, 100.0, 1e-6);
    EXPECT_NEAR(t.back().x, 900.0, 1e-6);
    EXPECT_NEAR(t.front().y, 1080.0, 1e-6);
    EXPECT_NEAR(t.back().y, 1080.0, 1e-6);

    double const gap = std::numbers::pi / 19.0;
    double const chord = 2.0 * 400.0 * std::sin(0.5 * gap);
    EXPECT_NEAR(std::hypot(t[1].x - t[0].x, t[1].y - t[0].y), chord, 1e-6);
}

TEST(HandLayout, SpreadNeverShrinksWithMoreCards)
{
    CardHand const hand = MakeHand();
    double previous = 0.0;
    for (std::size_t n = 1; n <= 40; ++n)
    {
        TargetsT const t = hand.MakeTargets(n);
        double const spread = t.back().x - t.front().x;
        EXPECT_GE(spread + 1e-9, previous) << "count " << n;
        previous = spread;
    }
}

TEST(HandLayout, FollowsViewportAndConfig)
{
    HandConfig cfg{};
    cfg.raise = 0.25;
    CardHand const hand(2000.0, 1600.0, cfg);

    TargetsT const t = hand.MakeTargets(1);
    ASSERT_EQ(t.size(), 1u);
    EXPECT_NEAR(t[0].x, 1000.0, Eps);
    EXPECT_NEAR(t[0].y, 1200.0, Eps);
}

TEST(HandLayout, WiderCardsSpreadFurther)
{
    HandConfig narrow{};
    narrow.card_width = 60.0;
    HandConfig wide{};
    wide.card_width = 140.0;

    TargetsT const a = CardHand(1000.0, 800.0, narrow).MakeTargets(4);
    TargetsT const b = CardHand(1000.0, 800.0, wide).MakeTargets(4);
    EXPECT_LT(a.back().x - a.front().x, b.back().x - b.front().x);
}

TEST(HandLayout, ZeroViewportStaysFinite)
{
    CardHand const hand(0.0, 0.0);
    TargetsT const t = hand.MakeTargets(3);
    ASSERT_EQ(t.size(), 3u);
    for (Vector2 const& p : t)
    {
        EXPECT_TRUE(std::isfinite(p.x));
        EXPECT_TRUE(std::isfinite(p.y));
        EXPECT_EQ(p, t.front());
    }
}

TEST(HandLayout, RejectsBrokenConfig)
{
    HandConfig cfg{};
    cfg.card_width = 0.0;
    EXPECT_THROW(CardHand(100.0, 100.0, cfg), error::AssertionError);

    HandConfig lerp{};
    lerp.interpolation_factor = 1.5;
    EXPECT_THROW(CardHand(100.0, 100.0, lerp), error::AssertionError);

    EXPECT_THROW(CardHand(-1.0, 100.0), error::AssertionError);
}

TEST(HandLayout, HeightFractionDoesNotChangeTargets)
{
    HandConfig flat{};
    flat.height = 0.02;
    HandConfig tall{};
    tall.height = 0.5;

    CardHand const a(1000.0, 800.0, flat);
    CardHand const b(1000.0, 800.0, tall);
    TargetsT const ta = a.MakeTargets(6);
    TargetsT const tb = b.MakeTargets(6);
    ASSERT_EQ(ta.size(), tb.size());
    for (std::size_t i{}; i < ta.size(); ++i)
    {
        EXPECT_NEAR(ta[i].x, tb[i].x, Eps) << "slot " << i;
        EXPECT_NEAR(ta[i].y, tb[i].y, Eps) << "slot " << i;
    }
    // half circle of radius hw / 2: the outermost slots sit at most 400px from the centre
    EXPECT_LE(std::abs(ta.front().x - 500.0), 400.0 + Eps);
}
