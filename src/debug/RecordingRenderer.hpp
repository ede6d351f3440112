//
// Created by malikt on 8/20/25.
//

#ifndef KOIHAND_RECORDINGRENDERER_HPP
#define KOIHAND_RECORDINGRENDERER_HPP

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../core/Card.hpp"
#include "../core/CardRenderer.hpp"

namespace koi::core::debug
{
    // Remembers every draw call of the current frame, optionally forwarding
    // to a real renderer.
    class RecordingRenderer final : public CardRenderer
    {
    public:
        struct DrawCall
        {
            Card const* card{};
            Vector2 position{};
            double time{};
        };

        RecordingRenderer() = default;
        explicit RecordingRenderer(std::unique_ptr<CardRenderer> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Draw(Card const& card, double const time) -> void override
        {
            calls_.push_back(DrawCall{&card, card.Position(), time});
            ++total_;
            if (inner_)
            {
                inner_->Draw(card, time);
            }
        }

        // Call between frames
        auto NextFrame() -> void
        {
            calls_.clear();
        }

        auto Calls() const -> std::vector<DrawCall> const&
        {
            return calls_;
        }

        auto TotalDraws() const -> std::size_t
        {
            return total_;
        }

    private:
        std::unique_ptr<CardRenderer> inner_;
        std::vector<DrawCall> calls_;
        std::size_t total_{0};
    };
} // namespace koi::core::debug

#endif //KOIHAND_RECORDINGRENDERER_HPP
