#include "AuditLogger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <string_view>
#include <utility>

#include "../core/Card.hpp"
#include "../core/Util.hpp"

using namespace koi::core;

namespace
{

auto s_suit(Suit const s) -> std::string_view
{
    switch (s)
    {
        case Suit::Clubs:    return "C";
        case Suit::Diamonds: return "D";
        case Suit::Hearts:   return "H";
        case Suit::Spades:   return "S";
    }
    return "?";
}

auto s_rank(Rank const r) -> std::string_view
{
    static constexpr std::array<std::string_view, 13> map{
        "2","3","4","5","6","7","8","9","T","J","Q","K","A"
    };
    auto const idx = static_cast<std::size_t>(r);
    return idx < map.size() ? map[idx] : "?";
}

auto s_card(Card const& c) -> std::string
{
    return std::format("{}{}#{}", s_rank(c.GetRank()), s_suit(c.GetSuit()), c.Id());
}

auto s_hand(CardHand const& h) -> std::string
{
    std::string body;
    bool first = true;

    for (CardWP const& w : h.Cards())
    {
        body += (first ? "" : ",");
        first = false;

        auto const sp = w.lock();
        body += sp ? s_card(*sp) : std::string("--");
    }

    return body;
}

} // anonymous namespace

namespace koi::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(CardHand const& hand, std::uint64_t const seed) -> void
{
    HandConfig const& c = hand.Config();
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Viewport={}x{}\n", hand.Width(), hand.Height());
    out_ << std::format("Layout width={} height={} raise={} lerp={} spacing={} card_width={} capacity={}\n",
                        c.width, c.height, c.raise, c.interpolation_factor, c.max_spacing, c.card_width,
                        c.capacity);
    out_.flush();
}

auto AuditLogger::add(CardHand const& hand, Card const& card, std::size_t const slot) -> void
{
    out_ << std::format("Add {} at ({:.1f},{:.1f}) -> slot {} hand=[{}]\n",
                        s_card(card), card.Position().x, card.Position().y, slot, s_hand(hand));
}

auto AuditLogger::remove(CardHand const& hand, Card const& card, error::HandResult const& res) -> void
{
    if (res)
    {
        out_ << std::format("Remove {} hand=[{}]\n", s_card(card), s_hand(hand));
    }
    else
    {
        out_ << std::format("Remove {} rejected: {}\n", s_card(card), error::describe(res.error()));
    }
}

auto AuditLogger::resize(CardHand const& hand) -> void
{
    out_ << std::format("Resize {}x{}\n", hand.Width(), hand.Height());
}

auto AuditLogger::clear() -> void
{
    out_ << "Clear\n";
}

auto AuditLogger::frame(CardHand const& hand, std::uint64_t const frame_no) -> void
{
    double worst = 0.0;
    auto const& targets = hand.Targets();
    auto const& cards = hand.Cards();

    for (std::size_t i{}; i < cards.size() && i < targets.size(); ++i)
    {
        if (auto const sp = cards[i].lock())
        {
            worst = std::max(worst, util::DistanceSq(sp->Position(), targets[i]));
        }
    }

    out_ << std::format("Frame {} cards={} max_dist={:.3f}\n", frame_no, cards.size(), std::sqrt(worst));
}

auto AuditLogger::serialized(std::size_t const bytes) -> void
{
    out_ << std::format("Serialized {} byte(s)\n", bytes);
}

auto AuditLogger::end(CardHand const& hand) -> void
{
    out_ << std::format("Final hand=[{}]\n", s_hand(hand));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace koi::core::debug
