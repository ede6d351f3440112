#ifndef KOIHAND_BINBUFFER_HPP
#define KOIHAND_BINBUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace koi::core
{
    // Append-only byte sink with an independent read cursor.
    // Multi-byte values are little endian.
    class BinBuffer
    {
    public:
        BinBuffer() = default;
        explicit BinBuffer(std::vector<std::uint8_t> bytes);
        explicit BinBuffer(std::span<std::uint8_t const> bytes);

        // Throws RangeError if value does not fit in the field.
        auto WriteUint8(std::uint64_t value) -> void;
        auto WriteUint16(std::uint64_t value) -> void;

        // Throws SerializationError when reading past the end.
        auto ReadUint8() -> std::uint8_t;
        auto ReadUint16() -> std::uint16_t;

        auto Bytes() const noexcept -> std::span<std::uint8_t const> { return bytes_; }
        auto Size() const noexcept -> std::size_t { return bytes_.size(); }
        auto ReadOffset() const noexcept -> std::size_t { return read_; }
        auto Remaining() const noexcept -> std::size_t { return bytes_.size() - read_; }
        auto Rewind() noexcept -> void { read_ = 0; }

    private:
        auto Require(std::size_t n) const -> void;

    private:
        std::vector<std::uint8_t> bytes_;
        std::size_t read_{0};
    };
}

#endif //KOIHAND_BINBUFFER_HPP
