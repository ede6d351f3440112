#ifndef KOIHAND_CARDREGISTRY_HPP
#define KOIHAND_CARDREGISTRY_HPP

#include <cstddef>
#include <vector>
#include "Types.hpp"

namespace koi::core
{
    // Owns every card on screen. Hands and other widgets only hold CardWP
    // handles into it; releasing a card here is what disposes it.
    class CardRegistry
    {
    public:
        CardRegistry() = default;

        CardRegistry(CardRegistry const&) = delete;
        auto operator=(CardRegistry const&) -> CardRegistry& = delete;

        // Registering the same card twice is a no-op.
        auto RegisterCard(CardSP card) -> void;
        // Returns false if the card was not registered.
        auto Release(CardWP const& card) -> bool;
        auto Contains(CardWP const& card) const -> bool;

        auto Size() const noexcept -> std::size_t { return cards_.size(); }
        auto Cards() const noexcept -> std::vector<CardSP> const& { return cards_; }

    private:
        std::vector<CardSP> cards_;
    };
}

#endif //KOIHAND_CARDREGISTRY_HPP
