#ifndef KOIHAND_CARD_HPP
#define KOIHAND_CARD_HPP

#include <cstdint>
#include "Types.hpp"

namespace koi::core
{
    class BinBuffer;
    class CardRenderer;

    class Card
    {
    public:
        Card() = delete;
        Card(Suit suit, Rank rank, std::uint32_t id, Vector2 position = {});

        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;

        // Reads a CardSegment and places the card at home.
        static auto Deserialize(BinBuffer& buffer, Vector2 home) -> CardSP;
        // Throws RangeError if a field does not fit the wire format.
        auto Serialize(BinBuffer& buffer) const -> void;

        auto Move(double dx, double dy) -> void;
        auto Render(CardRenderer& renderer, double time) const -> void;

        auto Position() const noexcept -> Vector2 { return position_; }
        auto GetSuit() const noexcept -> Suit { return suit_; }
        auto GetRank() const noexcept -> Rank { return rank_; }
        auto Id() const noexcept -> std::uint32_t { return id_; }

    private:
        Suit suit_;
        Rank rank_;
        std::uint32_t id_;
        Vector2 position_;
    };

    // Payload equality, not identity
    inline auto SamePayload(Card const& a, Card const& b) -> bool
    {
        return a.GetSuit() == b.GetSuit() && a.GetRank() == b.GetRank() && a.Id() == b.Id();
    }
}

#endif //KOIHAND_CARD_HPP
