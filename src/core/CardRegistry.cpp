#include "CardRegistry.hpp"

#include <algorithm>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace koi::core
{
    auto CardRegistry::RegisterCard(CardSP card) -> void
    {
        KOI_ASSERT(card != nullptr, "Null card registered");
        if (Contains(card))
        {
            return;
        }
        cards_.push_back(std::move(card));
    }

    auto CardRegistry::Release(CardWP const& card) -> bool
    {
        auto const it = std::ranges::find_if(cards_,
                                             [&card](CardSP const& csp) { return util::SameCard(csp, card); });
        if (it == cards_.end())
        {
            return false;
        }
        cards_.erase(it);
        return true;
    }

    auto CardRegistry::Contains(CardWP const& card) const -> bool
    {
        return std::ranges::any_of(cards_, [&card](CardSP const& csp) { return util::SameCard(csp, card); });
    }
}
