//
// Created by Malik T on 19/08/2025.
//

#ifndef KOIHAND_INSPECTOR_HPP
#define KOIHAND_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <ranges>
#include <algorithm>
#include <iterator>

#include "../core/Types.hpp"
#include "../core/Card.hpp"
#include "../core/CardHand.hpp"

namespace koi::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            // nullptr for handles whose card is gone
            std::vector<Card const*> cards;
            TargetsT targets;
            double width{};
            double height{};
            std::size_t capacity{};
            std::size_t expired{};
        };

        static inline auto Gather(CardHand const& h) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.width = h.width_;
            ret.height = h.height_;
            ret.capacity = h.cfg_.capacity;
            ret.targets = h.targets_;

            ret.cards.reserve(h.cards_.size());
            std::ranges::transform(h.cards_, std::back_inserter(ret.cards),
                                   [](CardWP const& w) -> Card const* { return w.lock().get(); });
            ret.expired = static_cast<std::size_t>(
                std::ranges::count_if(ret.cards, [](Card const* p) { return p == nullptr; }));

            return ret;
        }
    };
}

#endif //KOIHAND_INSPECTOR_HPP
