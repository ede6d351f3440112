#include "BinBuffer.hpp"

#include <format>
#include <limits>
#include <utility>

#include "Exception.hpp"

namespace koi::core
{
    BinBuffer::BinBuffer(std::vector<std::uint8_t> bytes) :
        bytes_(std::move(bytes))
    {
    }

    BinBuffer::BinBuffer(std::span<std::uint8_t const> bytes) :
        bytes_(bytes.begin(), bytes.end())
    {
    }

    auto BinBuffer::WriteUint8(std::uint64_t const value) -> void
    {
        if (value > std::numeric_limits<std::uint8_t>::max())
        {
            KOI_THROW(error::Code::Range, std::format("{} does not fit in uint8", value));
        }
        bytes_.push_back(static_cast<std::uint8_t>(value));
    }

    auto BinBuffer::WriteUint16(std::uint64_t const value) -> void
    {
        if (value > std::numeric_limits<std::uint16_t>::max())
        {
            KOI_THROW(error::Code::Range, std::format("{} does not fit in uint16", value));
        }
        bytes_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
        bytes_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    }

    auto BinBuffer::Require(std::size_t const n) const -> void
    {
        if (Remaining() < n)
        {
            KOI_THROW(error::Code::Serialization,
                      std::format("read of {} byte(s) at offset {} overruns buffer of {}", n, read_, bytes_.size()));
        }
    }

    auto BinBuffer::ReadUint8() -> std::uint8_t
    {
        Require(1);
        return bytes_[read_++];
    }

    auto BinBuffer::ReadUint16() -> std::uint16_t
    {
        Require(2);
        auto const lo = static_cast<std::uint16_t>(bytes_[read_]);
        auto const hi = static_cast<std::uint16_t>(bytes_[read_ + 1]);
        read_ += 2;
        return static_cast<std::uint16_t>(lo | (hi << 8));
    }
}
