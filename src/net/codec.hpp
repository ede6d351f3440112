#ifndef KOIHAND_CODEC_HPP
#define KOIHAND_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/CardHand.hpp"
#include "../core/CardRegistry.hpp"
#include "../core/Exception.hpp"

#include "fbs/koi_hand_generated.h"

namespace koi::core::net
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // Value-side card as an observer sees it
    struct CardView
    {
        Suit suit{};
        Rank rank{};
        std::uint32_t id{};
        Vector2 position{};
        Vector2 target{};
    };

    struct HandSnapshotVal
    {
        std::uint64_t msg_id{};
        std::uint16_t schema_version{};
        double width{};
        double height{};
        std::uint8_t capacity{};
        std::vector<CardView> cards;
    };

    auto ToFbSuit(koi::core::Suit s) noexcept -> koi::gen::net::Suit;
    auto ToFbRank(koi::core::Rank r) noexcept -> koi::gen::net::Rank;

    auto FromFbSuit(koi::gen::net::Suit s) noexcept -> koi::core::Suit;
    auto FromFbRank(koi::gen::net::Rank r) noexcept -> koi::core::Rank;

    // --- Outbound builders ---

    // Positions and targets of every card, for display only.
    auto BuildHandSnapshot(koi::core::CardHand const& hand,
                           std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Viewport plus the binary hand segment. Throws RangeError like CardHand::Serialize.
    auto BuildHandState(koi::core::CardHand const& hand,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto DecodeHandSnapshot(std::span<std::byte const> bytes)
        -> std::expected<HandSnapshotVal, ParseError>;

    // Resizes the hand to the message viewport and replaces its cards with the
    // segment's, registering them. Returns the msg_id. On error the hand is left
    // as it was; cards decoded before a bad segment stay in the registry.
    auto ApplyHandState(std::span<std::byte const> bytes,
                        koi::core::CardHand& hand,
                        koi::core::CardRegistry& registry)
        -> std::expected<std::uint64_t, ParseError>;
} // namespace koi::core::net


#endif //KOIHAND_CODEC_HPP
