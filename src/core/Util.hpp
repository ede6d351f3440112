//
// Created by Malik T on 14/08/2025.
//

#ifndef KOIHAND_UTIL_HPP
#define KOIHAND_UTIL_HPP

#include <algorithm>
#include <span>
#include <memory>
#include <type_traits>
#include "Types.hpp"

namespace koi::core::util
{
    template <typename T>
    inline auto any_invalid(std::span<T const> ptrs) -> bool
    {
        if constexpr (std::is_same_v<T, std::weak_ptr<typename T::element_type>>)
        {
            // For weak_ptr: check if expired
            return std::ranges::any_of(ptrs, [](auto const& p) { return p.expired(); });
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<typename T::element_type>>)
        {
            // For shared_ptr: check if null
            return std::ranges::any_of(ptrs, [](auto const& p) { return !p; });
        }
        else
        {
            static_assert([]{return false;}(), "Ptr must be std::shared_ptr<T> or std::weak_ptr<T>");
        }
    }

    // Identity of the control block, valid for expired handles too
    inline auto SameCard(CardWP const& a, CardWP const& b) -> bool
    {
        return !a.owner_before(b) && !b.owner_before(a);
    }

    inline auto DistanceSq(Vector2 const& a, Vector2 const& b) -> double
    {
        double const dx = a.x - b.x;
        double const dy = a.y - b.y;
        return dx * dx + dy * dy;
    }
}

#endif //KOIHAND_UTIL_HPP
