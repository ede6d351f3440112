//
// Created by Malik T on 15/08/2025.
//

#ifndef KOIHAND_CARDHAND_HPP
#define KOIHAND_CARDHAND_HPP

#include <cstddef>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"

namespace koi::core::debug {struct Inspector;}
namespace koi::core
{
    class BinBuffer;
    class CardRegistry;
    class CardRenderer;

    // The local player's hand: a fan of cards along a circular arc at the
    // bottom of the screen. Holds non-owning handles, the registry owns the cards.
    class CardHand
    {
    public:
        CardHand() = delete;
        CardHand(double width, double height, HandConfig const& config = {});

        // Replaces the current cards with the ones in the buffer and registers them.
        auto Deserialize(BinBuffer& buffer, CardRegistry& registry) -> void;
        // Throws RangeError for more than 255 cards or an unencodable card.
        auto Serialize(BinBuffer& buffer) const -> void;

        auto Resize(double width, double height) -> void;

        auto IsFull() const noexcept -> bool { return cards_.size() == cfg_.capacity; }
        auto Contains(CardWP const& card) const -> bool;

        // Pure function of count, the viewport and the config.
        auto MakeTargets(std::size_t count) const -> TargetsT;

        // Eases every card towards its target. Call once per frame.
        auto Update() -> void;
        auto Render(CardRenderer& renderer, double time) const -> void;

        // Inserts at the slot nearest to the card's current position and
        // returns that slot. Does not check capacity, see IsFull().
        auto Add(CardWP const& card) -> std::size_t;
        // No-op if the card is not in the hand.
        auto Remove(CardWP const& card) -> error::HandResult;
        // Drops all handles, the registry is not notified.
        auto Clear() -> void;

        auto Size() const noexcept -> std::size_t { return cards_.size(); }
        auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Width() const noexcept -> double { return width_; }
        auto Height() const noexcept -> double { return height_; }
        auto Cards() const noexcept -> std::vector<CardWP> const& { return cards_; }
        auto Targets() const noexcept -> TargetsT const& { return targets_; }
        auto Config() const noexcept -> HandConfig const& { return cfg_; }

        friend struct debug::Inspector;

    private:
        //Throws StateError if the card behind a handle is gone
        auto Lock(std::size_t idx) const -> CardSP;

    private:
        HandConfig cfg_;
        double width_;
        double height_;

        std::vector<CardWP> cards_;                          // fan order, left to right
        TargetsT targets_;                                   // targets_[i] belongs to cards_[i]
    };
}
#endif //KOIHAND_CARDHAND_HPP
