//
// Created by Malik T on 19/08/2025.
//

#ifndef KOIHAND_INVARIANTS_HPP
#define KOIHAND_INVARIANTS_HPP

#include "../core/CardHand.hpp"
#include "Inspector.hpp"
#include <cassert>
#include <cmath>
#include <unordered_set>

namespace koi::core::debug
{
    // A second layer of checks, run by tests and the simulation after every
    // mutation. The hand itself only guards what it cannot recover from.
    inline auto CheckInvariants(CardHand const& h) -> void
    {
#if KOI_ENABLE_TEST_HOOKS == false
        (void)h;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(h);

    // 1) Every card has exactly one target
    assert(s.targets.size() == s.cards.size() && "Targets out of step with cards");

    // 2) Capacity is the caller's contract, but a hand over it is a bug somewhere
    assert(s.cards.size() <= s.capacity && "Hand over capacity");

    // 3) Every handle still refers to a live card
    assert(s.expired == 0 && "Disposed card still in hand");

    // 4) No card appears twice
    {
        std::unordered_set<Card const*> seen;
        seen.reserve(s.cards.size());
        for (Card const* p : s.cards)
        {
            if (!p) continue;
            bool const inserted = seen.insert(p).second;
            assert(inserted && "Duplicate card in hand");
        }
    }

    // 5) Targets are finite and laid out left to right
    for (std::size_t i{}; i < s.targets.size(); ++i)
    {
        assert(std::isfinite(s.targets[i].x) && std::isfinite(s.targets[i].y) && "Non-finite target");
        if (i > 0)
        {
            assert(s.targets[i - 1].x <= s.targets[i].x && "Targets not ordered left to right");
        }
    }
#endif // KOI_ENABLE_TEST_HOOKS == true
    }
}
#endif //KOIHAND_INVARIANTS_HPP
