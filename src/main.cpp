//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp - Frame-loop simulation of a player's hand
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <print>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "core/BinBuffer.hpp"
#include "core/Card.hpp"
#include "core/CardHand.hpp"
#include "core/CardRegistry.hpp"
#include "core/CardRenderer.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/RecordingRenderer.hpp"
#include "net/codec.hpp"

namespace
{
    struct SimConfig
    {
        double        width{1280.0};
        double        height{720.0};
        double        card_width{100.0};
        std::uint64_t frames{600};
        std::uint64_t seed{123456789ULL};
        // cards dealt before the player starts playing them
        std::uint64_t cards{6};
        std::uint64_t deal_every{15};
        std::string   log{"koihand_sim.log"};
    };

    auto ParseArgs(int argc, char** argv) -> SimConfig
    {
        SimConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_double = [&](double& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--width")
            {
                double v{};
                if (next_double(v)) { cfg.width = v; }
            }
            else if (arg == "--height")
            {
                double v{};
                if (next_double(v)) { cfg.height = v; }
            }
            else if (arg == "--card-width")
            {
                double v{};
                if (next_double(v)) { cfg.card_width = v; }
            }
            else if (arg == "--frames")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.frames = v; }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--cards")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.cards = v; }
            }
            else if (arg == "--deal-every")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.deal_every = v; }
            }
            else if (arg == "--log" && i + 1 < argc)
            {
                cfg.log = argv[++i];
            }
        }
        return cfg;
    }

    // Stand-in for the real draw layer: keeps totals for the summary line
    class TallyRenderer final : public koi::core::CardRenderer
    {
    public:
        auto Draw(koi::core::Card const& card, double time) -> void override
        {
            (void)card;
            (void)time;
            ++draws_;
        }

        auto Draws() const -> std::uint64_t { return draws_; }

    private:
        std::uint64_t draws_{0};
    };

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
}

int main(int argc, char** argv)
{
    using namespace koi::core;

    SimConfig const sc = ParseArgs(argc, argv);

    std::print("[koihand] {}x{} viewport, {} frame(s), seed {}\n",
               sc.width, sc.height, sc.frames, sc.seed);

    try
    {
        HandConfig hc{};
        hc.card_width = sc.card_width;

        CardRegistry registry;
        CardHand hand(sc.width, sc.height, hc);
        auto tally = std::make_unique<TallyRenderer>();
        TallyRenderer const& totals = *tally;
        debug::RecordingRenderer renderer(std::move(tally));
        debug::AuditLogger log(sc.log);
        log.start(hand, sc.seed);

        std::mt19937_64 rng{sc.seed};
        std::uniform_real_distribution<double> spawn_x{0.0, sc.width};
        std::uniform_int_distribution<int> suit{0, static_cast<int>(Suit::Spades)};
        std::uniform_int_distribution<int> rank{0, static_cast<int>(Rank::Ace)};
        std::uint32_t next_id = 0;
        std::uint64_t dealt = 0;

        constexpr double frame_time = 1.0 / 60.0;

        for (std::uint64_t f = 0; f < sc.frames; ++f)
        {
            if (f % sc.deal_every == 0)
            {
                // deal from the top edge while filling up, then play a card for every card drawn
                if (dealt >= sc.cards && !hand.Empty())
                {
                    std::uniform_int_distribution<std::size_t> pick{0, hand.Size() - 1};
                    CardSP const played = hand.Cards()[pick(rng)].lock();
                    auto const res = hand.Remove(played);
                    log.remove(hand, *played, res);
                    (void)registry.Release(played);
                }
                if (!hand.IsFull())
                {
                    auto card = std::make_shared<Card>(static_cast<Suit>(suit(rng)), static_cast<Rank>(rank(rng)),
                                                       next_id++, Vector2{spawn_x(rng), 0.0});
                    registry.RegisterCard(card);
                    std::size_t const slot = hand.Add(card);
                    log.add(hand, *card, slot);
                    ++dealt;
                }
            }

            if (f == sc.frames / 2)
            {
                hand.Resize(sc.height, sc.width);
                log.resize(hand);
            }

            hand.Update();
            renderer.NextFrame();
            hand.Render(renderer, frame_time);
            KOI_ASSERT(renderer.Calls().size() == hand.Size(), "Frame skipped a card in hand");
            log.frame(hand, f);
        }

        BinBuffer segment;
        hand.Serialize(segment);
        log.serialized(segment.Size());

        // reload into a fresh hand the way a new session would
        auto const state = net::BuildHandState(hand, 1);
        CardRegistry restored_registry;
        CardHand restored(1.0, 1.0, hc);
        auto const applied = net::ApplyHandState(AsBytes(state), restored, restored_registry);
        if (!applied)
        {
            std::print("[koihand] reload failed: {}\n", applied.error().message);
            return 1;
        }

        log.end(hand);
        std::print("[koihand] {} card(s) in hand, {} registered, {} draw call(s), segment {} byte(s), reload {} card(s)\n",
                   hand.Size(), registry.Size(), totals.Draws(), segment.Size(), restored.Size());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }
    return 0;
}
