//
// Created by Malik T on 14/08/2025.
//

#ifndef KOIHAND_TYPES_HPP
#define KOIHAND_TYPES_HPP

#define KOI_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

namespace koi::core::constants
{
    inline constexpr std::size_t HandCapacity = 8;
    inline constexpr std::size_t MaxSegmentCards = 255;
}
namespace koi::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };
    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    // Pixel space, y grows downwards
    struct Vector2
    {
        double x{};
        double y{};
    };
    inline auto operator-(Vector2 const& a, Vector2 const& b) -> Vector2 { return {a.x - b.x, a.y - b.y}; }
    inline auto operator*(Vector2 const& v, double s) -> Vector2 { return {v.x * s, v.y * s}; }
    inline auto operator==(Vector2 const& a, Vector2 const& b) -> bool { return a.x == b.x && a.y == b.y; }

    class Card;
    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;
    using CardWP = std::weak_ptr<Card>;

    using TargetsT = std::vector<Vector2>;

    struct HandConfig
    {
        // fraction of the viewport the fan spans
        double width{0.8};
        double height{0.12};
        // lifts the fan centre above the bottom edge
        double raise{0.15};
        double interpolation_factor{0.5};
        // minimum arc length per card, in card widths
        double max_spacing{0.8};
        // pixels, normally the --card-width style value
        double card_width{100.0};
        std::size_t capacity{constants::HandCapacity};
    };
}

#endif //KOIHAND_TYPES_HPP
