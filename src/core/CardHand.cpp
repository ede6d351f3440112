//
// Created by Malik T on 15/08/2025.
//
#include "CardHand.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <span>
#include <utility>

#include "BinBuffer.hpp"
#include "Card.hpp"
#include "CardRegistry.hpp"
#include "CardRenderer.hpp"
#include "Util.hpp"

namespace koi::core
{
    CardHand::CardHand(double const width, double const height, HandConfig const& config) :
        cfg_(config),
        width_(width),
        height_(height)
    {
        KOI_ASSERT(width_ >= 0.0 && height_ >= 0.0, "Negative viewport while initialising hand");
        KOI_ASSERT(cfg_.card_width > 0.0, "Card width must be positive");
        KOI_ASSERT(cfg_.max_spacing > 0.0, "Card spacing must be positive");
        KOI_ASSERT(cfg_.interpolation_factor > 0.0 && cfg_.interpolation_factor <= 1.0,
                   "Interpolation factor must be in (0, 1]");
        KOI_ASSERT(cfg_.capacity > 0 && cfg_.capacity <= constants::MaxSegmentCards,
                   "Hand capacity does not fit the wire format");
    }

    auto CardHand::Lock(std::size_t const idx) const -> CardSP
    {
        CardSP card = cards_[idx].lock();
        if (!card)
        {
            KOI_THROW(error::Code::State, std::format("Card in slot {} was disposed while still in hand", idx));
        }
        return card;
    }

    auto CardHand::Deserialize(BinBuffer& buffer, CardRegistry& registry) -> void
    {
        std::size_t const count = buffer.ReadUint8();
        TargetsT targets = MakeTargets(count);

        std::vector<CardWP> cards;
        cards.reserve(count);
        for (std::size_t i{}; i < count; ++i)
        {
            CardSP card = Card::Deserialize(buffer, targets[i]);
            cards.emplace_back(card);
            registry.RegisterCard(std::move(card));
        }

        // commit only once every segment decoded
        cards_ = std::move(cards);
        targets_ = std::move(targets);
    }

    auto CardHand::Serialize(BinBuffer& buffer) const -> void
    {
        if (util::any_invalid(std::span<CardWP const>{cards_}))
        {
            KOI_THROW(error::Code::State, "Cannot serialize a hand holding disposed cards");
        }

        buffer.WriteUint8(cards_.size());
        for (std::size_t i{}; i < cards_.size(); ++i)
        {
            Lock(i)->Serialize(buffer);
        }
    }

    auto CardHand::Resize(double const width, double const height) -> void
    {
        KOI_ASSERT(width >= 0.0 && height >= 0.0, "Negative viewport on resize");
        width_ = width;
        height_ = height;
        targets_ = MakeTargets(cards_.size());
    }

    auto CardHand::Contains(CardWP const& card) const -> bool
    {
        return std::ranges::any_of(cards_, [&card](CardWP const& w) { return util::SameCard(w, card); });
    }

    auto CardHand::MakeTargets(std::size_t const count) const -> TargetsT
    {
        using std::numbers::pi;

        double const hand_width = std::round(width_ * cfg_.width);
        double const hand_height = std::round(height_ * cfg_.height);
        double const half_width = 0.5 * hand_width;

        // atan2 keeps a zero sized hand finite
        double const fan_angle = pi - std::atan2(half_width, hand_height) - std::atan2(hand_height, half_width);
        double const fan_radius = half_width / std::sin(fan_angle);

        double fan_portion = 0.0;
        if (count > 1)
        {
            double const arc_length = 2.0 * fan_angle * fan_radius;
            double const slots = arc_length / (cfg_.card_width * cfg_.max_spacing);
            fan_portion = slots > 0.0 ? std::min(1.0, static_cast<double>(count - 1) / slots) : 1.0;
        }

        TargetsT targets;
        targets.reserve(count);
        for (std::size_t target{}; target < count; ++target)
        {
            double const factor = 1.0 - (count == 1 ? 0.5 : static_cast<double>(target) / static_cast<double>(count - 1));
            double const angle = fan_portion * fan_angle * (1.0 - 2.0 * factor) - pi * 0.5;

            targets.push_back(Vector2{
                width_ * 0.5 + std::cos(angle) * fan_radius,
                height_ * (1.0 - cfg_.raise) + fan_radius + std::sin(angle) * fan_radius
            });
        }
        return targets;
    }

    auto CardHand::Update() -> void
    {
        KOI_ASSERT(targets_.size() == cards_.size(), "Targets out of step with cards");
        for (std::size_t i{}; i < cards_.size(); ++i)
        {
            CardSP const card = Lock(i);
            Vector2 const step = (targets_[i] - card->Position()) * cfg_.interpolation_factor;
            card->Move(step.x, step.y);
        }
    }

    auto CardHand::Render(CardRenderer& renderer, double const time) const -> void
    {
        for (std::size_t i{}; i < cards_.size(); ++i)
        {
            Lock(i)->Render(renderer, time);
        }
    }

    auto CardHand::Add(CardWP const& card) -> std::size_t
    {
        CCardSP const sp = card.lock();
        if (!sp)
        {
            KOI_THROW(error::Code::State, "Cannot add a disposed card to the hand");
        }
        if (Contains(card))
        {
            KOI_THROW(error::Code::State, "Card is already in the hand");
        }

        targets_ = MakeTargets(cards_.size() + 1);

        Vector2 const from = sp->Position();
        std::size_t nearest = 0;
        double nearest_distance = std::numeric_limits<double>::max();
        for (std::size_t target{}; target < targets_.size(); ++target)
        {
            double const distance = util::DistanceSq(from, targets_[target]);
            if (distance < nearest_distance)
            {
                nearest_distance = distance;
                nearest = target;
            }
        }

        cards_.insert(cards_.begin() + static_cast<std::ptrdiff_t>(nearest), card);
        return nearest;
    }

    auto CardHand::Remove(CardWP const& card) -> error::HandResult
    {
        auto const it = std::ranges::find_if(cards_, [&card](CardWP const& w) { return util::SameCard(w, card); });
        if (it == cards_.end())
        {
            return std::unexpected(error::HandViolation{error::HandViolationCode::Remove_NotInHand}
                                       .with_hand_size(cards_.size())
                                       .with_capacity(cfg_.capacity));
        }

        cards_.erase(it);
        targets_ = MakeTargets(cards_.size());
        return {};
    }

    auto CardHand::Clear() -> void
    {
        cards_.clear();
        targets_.clear();
    }
}
