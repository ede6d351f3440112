#ifndef KOIHAND_CARDRENDERER_HPP
#define KOIHAND_CARDRENDERER_HPP

#include "Types.hpp"

namespace koi::core
{
    class CardRenderer
    {
    public:
        virtual ~CardRenderer() = default;

        // Called once per card per frame, in fan order (left to right).
        // time is the seconds elapsed since the previous frame.
        virtual auto Draw(Card const& card, double time) -> void = 0;
    };
}
#endif //KOIHAND_CARDRENDERER_HPP
