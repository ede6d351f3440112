#include "Card.hpp"

#include <format>
#include <memory>
#include <utility>

#include "BinBuffer.hpp"
#include "CardRenderer.hpp"
#include "Exception.hpp"

namespace koi::core
{
    namespace
    {
        constexpr auto SuitCount = static_cast<std::uint8_t>(std::to_underlying(Suit::Spades) + 1);
        constexpr auto RankCount = static_cast<std::uint8_t>(std::to_underlying(Rank::Ace) + 1);
    }

    Card::Card(Suit const suit, Rank const rank, std::uint32_t const id, Vector2 const position) :
        suit_(suit),
        rank_(rank),
        id_(id),
        position_(position)
    {
    }

    auto Card::Deserialize(BinBuffer& buffer, Vector2 const home) -> CardSP
    {
        std::uint8_t const suit = buffer.ReadUint8();
        std::uint8_t const rank = buffer.ReadUint8();
        std::uint16_t const id = buffer.ReadUint16();

        if (suit >= SuitCount)
        {
            KOI_THROW(error::Code::Serialization, std::format("invalid suit {} in card segment", suit));
        }
        if (rank >= RankCount)
        {
            KOI_THROW(error::Code::Serialization, std::format("invalid rank {} in card segment", rank));
        }
        return std::make_shared<Card>(static_cast<Suit>(suit), static_cast<Rank>(rank), id, home);
    }

    auto Card::Serialize(BinBuffer& buffer) const -> void
    {
        auto const suit = std::to_underlying(suit_);
        auto const rank = std::to_underlying(rank_);
        if (suit >= SuitCount)
        {
            KOI_THROW(error::Code::Range, std::format("suit {} out of range", suit));
        }
        if (rank >= RankCount)
        {
            KOI_THROW(error::Code::Range, std::format("rank {} out of range", rank));
        }
        buffer.WriteUint8(suit);
        buffer.WriteUint8(rank);
        buffer.WriteUint16(id_);
    }

    auto Card::Move(double const dx, double const dy) -> void
    {
        position_.x += dx;
        position_.y += dy;
    }

    auto Card::Render(CardRenderer& renderer, double const time) const -> void
    {
        renderer.Draw(*this, time);
    }
}
