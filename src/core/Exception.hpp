//
// Created by Malik T on 14/08/2025.
//

#ifndef KOIHAND_EXCEPTION_HPP
#define KOIHAND_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace koi::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // hand/registry misuse (expired handles, broken pairing)
        Range, // value does not fit the field it is encoded into
        Serialization, // buffer overrun or undecodable field
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RangeError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Range: throw RangeError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define KOI_THROW(code_enum, msg) ::koi::core::error::fail((code_enum), (msg))
#define KOI_ASSERT(cond, msg) do { if(!(cond)) ::koi::core::error::fail(::koi::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary hand outcomes that callers are expected to handle.
    enum class HandViolationCode : std::uint16_t
    {
        Remove_NotInHand
    };

    struct HandViolation
    {
        HandViolationCode code{};
        std::optional<std::size_t> hand_size{};
        std::optional<std::size_t> capacity{};

        auto with_hand_size(std::size_t v) -> HandViolation&
        {
            hand_size = v;
            return *this;
        }

        auto with_capacity(std::size_t v) -> HandViolation&
        {
            capacity = v;
            return *this;
        }
    };

    inline auto to_string(HandViolationCode c) -> std::string_view
    {
        using E = HandViolationCode;
        switch (c)
        {
        case E::Remove_NotInHand: return "Remove: card not in hand";
        }
        return "Unknown";
    }

    inline auto describe(HandViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.hand_size) s += std::format(" | size={}", *v.hand_size);
        if (v.capacity) s += std::format(" | cap={}", *v.capacity);
        return s;
    }

    using HandResult = std::expected<void, HandViolation>;
}

#endif //KOIHAND_EXCEPTION_HPP
