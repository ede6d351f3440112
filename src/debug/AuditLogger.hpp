//
// Created by Malik T on 20/08/2025.
//

#ifndef KOIHAND_AUDITLOGGER_HPP
#define KOIHAND_AUDITLOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

#include "../core/CardHand.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace koi::core::debug
{
    // Plain-text transcript of one hand session, one event per line.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, viewport, layout config)
        auto start(CardHand const& hand, std::uint64_t seed) -> void;

        auto add(CardHand const& hand, Card const& card, std::size_t slot) -> void;
        auto remove(CardHand const& hand, Card const& card, error::HandResult const& res) -> void;
        auto resize(CardHand const& hand) -> void;
        auto clear() -> void;

        // Per frame, after Update(): how far the furthest card still is from its target
        auto frame(CardHand const& hand, std::uint64_t frame_no) -> void;

        auto serialized(std::size_t bytes) -> void;

        // Footer with the final hand
        auto end(CardHand const& hand) -> void;

        // Manual flush
        auto flush() -> void;

        auto is_open() const -> bool { return out_.is_open(); }

    private:
        std::ofstream out_;
    };
}

#endif //KOIHAND_AUDITLOGGER_HPP
