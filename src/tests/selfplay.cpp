#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <memory>
#include <random>

#include "../core/BinBuffer.hpp"
#include "../core/Card.hpp"
#include "../core/CardHand.hpp"
#include "../core/CardRegistry.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingRenderer.hpp"

using namespace koi::core;

namespace
{
// Plays a hand for a while: draws while there is room, plays random cards,
// rotates the screen now and then.
struct RandomTable
{
    explicit RandomTable(std::uint64_t seed)
        : rng{seed}
    {
    }

    auto Draw() -> CardSP
    {
        std::uniform_real_distribution<double> x{0.0, hand.Width()};
        std::uniform_real_distribution<double> y{0.0, hand.Height()};
        std::uniform_int_distribution<int> suit{0, 3};
        std::uniform_int_distribution<int> rank{0, 12};
        auto card = std::make_shared<Card>(static_cast<Suit>(suit(rng)), static_cast<Rank>(rank(rng)),
                                           next_id++, Vector2{x(rng), y(rng)});
        registry.RegisterCard(card);
        return card;
    }

    auto PickFromHand() -> CardSP
    {
        std::uniform_int_distribution<std::size_t> pick{0, hand.Size() - 1};
        return hand.Cards()[pick(rng)].lock();
    }

    std::mt19937_64 rng;
    CardRegistry registry;
    CardHand hand{1280.0, 720.0};
    std::uint32_t next_id{0};
};

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_Invariants)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            RandomTable table(seed);
            CardHand& hand = table.hand;
            debug::RecordingRenderer renderer;
            debug::AuditLogger log(std::format("_artifacts/hand_{}.log", seed));
            ASSERT_TRUE(log.is_open());

            log.start(hand, seed);
            std::uniform_int_distribution<int> roll{0, 99};

            for (std::uint64_t frame = 0; frame < 500; ++frame)
            {
                int const r = roll(table.rng);
                if (r < 12 && !hand.IsFull())
                {
                    CardSP const card = table.Draw();
                    std::size_t const slot = hand.Add(card);
                    log.add(hand, *card, slot);
                    ASSERT_TRUE(hand.Contains(card));
                }
                else if (r < 20 && !hand.Empty())
                {
                    CardSP const card = table.PickFromHand();
                    auto const res = hand.Remove(card);
                    log.remove(hand, *card, res);
                    ASSERT_TRUE(res.has_value());
                    ASSERT_FALSE(hand.Contains(card));
                    ASSERT_TRUE(table.registry.Release(card));
                }
                else if (r == 20)
                {
                    hand.Resize(hand.Height(), hand.Width());
                    log.resize(hand);
                }
                else if (r == 21 && frame % 7 == 0)
                {
                    hand.Clear();
                    log.clear();
                }

                debug::CheckInvariants(hand);

                hand.Update();
                renderer.NextFrame();
                hand.Render(renderer, 1.0 / 60.0);
                ASSERT_EQ(renderer.Calls().size(), hand.Size());
                log.frame(hand, frame);
            }

            BinBuffer segment;
            hand.Serialize(segment);
            log.serialized(segment.Size());
            EXPECT_EQ(segment.Size(), 1u + 4u * hand.Size());

            CardRegistry reloaded_registry;
            CardHand reloaded(hand.Width(), hand.Height());
            reloaded.Deserialize(segment, reloaded_registry);
            EXPECT_EQ(reloaded.Size(), hand.Size());
            debug::CheckInvariants(reloaded);

            log.end(hand);

            auto const path = fs::path(std::format("_artifacts/hand_{}.log", seed));
            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (koi::core::OmegaException<koi::core::error::Code> const& e)
    {
        ADD_FAILURE() << e.what() << "\n" << e.to_str();
    }
}
