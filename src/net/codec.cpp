//
// codec.cpp
//
#include "codec.hpp"

#include <cmath>
#include <cstring>
#include <format>
#include <utility>
#include <vector>

#include "../core/BinBuffer.hpp"
#include "../core/Card.hpp"

namespace koi::core::net
{
    auto ToFbSuit(koi::core::Suit s) noexcept -> koi::gen::net::Suit
    {
        switch (s)
        {
        case koi::core::Suit::Clubs: return koi::gen::net::Suit::Clubs;
        case koi::core::Suit::Diamonds: return koi::gen::net::Suit::Diamonds;
        case koi::core::Suit::Hearts: return koi::gen::net::Suit::Hearts;
        case koi::core::Suit::Spades: return koi::gen::net::Suit::Spades;
        }
        return koi::gen::net::Suit::Clubs;
    }

    auto FromFbSuit(koi::gen::net::Suit s) noexcept -> koi::core::Suit
    {
        switch (s)
        {
        case koi::gen::net::Suit::Clubs: return koi::core::Suit::Clubs;
        case koi::gen::net::Suit::Diamonds: return koi::core::Suit::Diamonds;
        case koi::gen::net::Suit::Hearts: return koi::core::Suit::Hearts;
        case koi::gen::net::Suit::Spades: return koi::core::Suit::Spades;
        }
        return koi::core::Suit::Clubs;
    }

    auto ToFbRank(koi::core::Rank r) noexcept -> koi::gen::net::Rank
    {
        switch (r)
        {
        case koi::core::Rank::Two: return koi::gen::net::Rank::Two;
        case koi::core::Rank::Three: return koi::gen::net::Rank::Three;
        case koi::core::Rank::Four: return koi::gen::net::Rank::Four;
        case koi::core::Rank::Five: return koi::gen::net::Rank::Five;
        case koi::core::Rank::Six: return koi::gen::net::Rank::Six;
        case koi::core::Rank::Seven: return koi::gen::net::Rank::Seven;
        case koi::core::Rank::Eight: return koi::gen::net::Rank::Eight;
        case koi::core::Rank::Nine: return koi::gen::net::Rank::Nine;
        case koi::core::Rank::Ten: return koi::gen::net::Rank::Ten;
        case koi::core::Rank::Jack: return koi::gen::net::Rank::Jack;
        case koi::core::Rank::Queen: return koi::gen::net::Rank::Queen;
        case koi::core::Rank::King: return koi::gen::net::Rank::King;
        case koi::core::Rank::Ace: return koi::gen::net::Rank::Ace;
        }
        return koi::gen::net::Rank::Two;
    }

    auto FromFbRank(koi::gen::net::Rank r) noexcept -> koi::core::Rank
    {
        switch (r)
        {
        case koi::gen::net::Rank::Two: return koi::core::Rank::Two;
        case koi::gen::net::Rank::Three: return koi::core::Rank::Three;
        case koi::gen::net::Rank::Four: return koi::core::Rank::Four;
        case koi::gen::net::Rank::Five: return koi::core::Rank::Five;
        case koi::gen::net::Rank::Six: return koi::core::Rank::Six;
        case koi::gen::net::Rank::Seven: return koi::core::Rank::Seven;
        case koi::gen::net::Rank::Eight: return koi::core::Rank::Eight;
        case koi::gen::net::Rank::Nine: return koi::core::Rank::Nine;
        case koi::gen::net::Rank::Ten: return koi::core::Rank::Ten;
        case koi::gen::net::Rank::Jack: return koi::core::Rank::Jack;
        case koi::gen::net::Rank::Queen: return koi::core::Rank::Queen;
        case koi::gen::net::Rank::King: return koi::core::Rank::King;
        case koi::gen::net::Rank::Ace: return koi::core::Rank::Ace;
        }
        return koi::core::Rank::Two;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)koi::core::Suit::Hearts == (int)koi::gen::net::Suit::Hearts);
    static_assert((int)koi::core::Rank::Ace == (int)koi::gen::net::Rank::Ace);

    inline auto ToFbVec(koi::core::Vector2 const& v) -> koi::gen::net::Vec2
    {
        return koi::gen::net::Vec2{v.x, v.y};
    }

    inline auto FromFbVec(koi::gen::net::Vec2 const* v) -> koi::core::Vector2
    {
        return v ? koi::core::Vector2{v->x(), v->y()} : koi::core::Vector2{};
    }

    // Verifier checks offsets, not enum ranges
    inline auto KnownSuitRank(koi::gen::net::Card const* c) -> bool
    {
        return c->suit() <= koi::gen::net::Suit::MAX && c->rank() <= koi::gen::net::Rank::MAX;
    }

    inline auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<koi::gen::net::Envelope const*, koi::core::net::ParseError>
    {
        using koi::core::net::ParseError;

        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!koi::gen::net::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = koi::gen::net::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }
} // anonymous

namespace koi::core::net
{
    // ---------- Snapshot (hand → observers) ----------

    auto BuildHandSnapshot(koi::core::CardHand const& hand,
                           std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const& cards = hand.Cards();
        auto const& targets = hand.Targets();

        std::vector<flatbuffers::Offset<koi::gen::net::Card>> vec;
        vec.reserve(cards.size());
        for (std::size_t i{}; i < cards.size(); ++i)
        {
            auto const sp = cards[i].lock();
            if (!sp)
            {
                continue;
            }
            auto const position = ToFbVec(sp->Position());
            auto const target = ToFbVec(i < targets.size() ? targets[i] : sp->Position());
            vec.push_back(koi::gen::net::CreateCard(
                fbb, ToFbSuit(sp->GetSuit()), ToFbRank(sp->GetRank()), sp->Id(), &position, &target));
        }
        auto const cards_vec = fbb.CreateVector(vec);

        auto const view = koi::gen::net::CreateHandView(
            fbb,
            /*schema_version*/ 1,
            /*width*/ hand.Width(),
            /*height*/ hand.Height(),
            /*capacity*/ static_cast<uint8_t>(hand.Config().capacity),
            /*cards*/ cards_vec
        );

        auto const sm = koi::gen::net::CreateHandSnapshotMsg(fbb, msg_id, view);
        auto const env = koi::gen::net::CreateEnvelope(
            fbb, koi::gen::net::Message::HandSnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- State (hand → storage/peer) ----------

    auto BuildHandState(koi::core::CardHand const& hand,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        koi::core::BinBuffer segment;
        hand.Serialize(segment);

        flatbuffers::FlatBufferBuilder fbb;
        auto const bytes = segment.Bytes();
        auto const seg = fbb.CreateVector(bytes.data(), bytes.size());
        auto const st = koi::gen::net::CreateHandStateMsg(fbb, msg_id, hand.Width(), hand.Height(), seg);
        auto const env = koi::gen::net::CreateEnvelope(
            fbb, koi::gen::net::Message::HandStateMsg, st.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeHandSnapshot(std::span<std::byte const> bytes)
        -> std::expected<HandSnapshotVal, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != koi::gen::net::Message::HandSnapshotMsg)
            return std::unexpected(ParseError{"not a HandSnapshotMsg"});

        auto const* sm = (*env)->message_as_HandSnapshotMsg();
        auto const* view = sm->view();
        if (!view)
            return std::unexpected(ParseError{"snapshot without view"});

        HandSnapshotVal out{};
        out.msg_id = sm->msg_id();
        out.schema_version = view->schema_version();
        out.width = view->width();
        out.height = view->height();
        out.capacity = view->capacity();

        if (auto const* v = view->cards())
        {
            out.cards.reserve(v->size());
            for (auto const* fb_c : *v)
            {
                if (!KnownSuitRank(fb_c))
                    return std::unexpected(ParseError{"card with unknown suit or rank"});

                out.cards.push_back(CardView{
                    .suit = FromFbSuit(fb_c->suit()),
                    .rank = FromFbRank(fb_c->rank()),
                    .id = fb_c->id(),
                    .position = FromFbVec(fb_c->position()),
                    .target = FromFbVec(fb_c->target())
                });
            }
        }
        return out;
    }

    auto ApplyHandState(std::span<std::byte const> bytes,
                        koi::core::CardHand& hand,
                        koi::core::CardRegistry& registry)
        -> std::expected<std::uint64_t, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != koi::gen::net::Message::HandStateMsg)
            return std::unexpected(ParseError{"not a HandStateMsg"});

        auto const* st = (*env)->message_as_HandStateMsg();
        auto const* seg = st->segment();
        if (!seg)
            return std::unexpected(ParseError{"state without hand segment"});
        if (!std::isfinite(st->width()) || !std::isfinite(st->height()))
            return std::unexpected(ParseError{"non-finite viewport"});
        if (st->width() < 0.0 || st->height() < 0.0)
            return std::unexpected(ParseError{"negative viewport"});

        koi::core::BinBuffer buffer(std::span<std::uint8_t const>{seg->data(), seg->size()});

        // decode into a scratch hand so a rejected segment leaves `hand` alone
        koi::core::CardHand staged(st->width(), st->height(), hand.Config());
        try
        {
            staged.Deserialize(buffer, registry);
        }
        catch (koi::core::error::SerializationError const& e)
        {
            return std::unexpected(ParseError{std::format("bad hand segment: {}", e.what())});
        }
        if (buffer.Remaining() != 0)
            return std::unexpected(ParseError{std::format("{} trailing byte(s) after hand segment", buffer.Remaining())});

        hand = std::move(staged);
        return st->msg_id();
    }
} // namespace koi::core::net
