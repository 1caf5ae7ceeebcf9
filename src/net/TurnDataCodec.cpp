//
// TurnDataCodec.cpp
//
#include "TurnDataCodec.hpp"

#include <format>
#include <string>
#include <utility>

#include <flatbuffers/flatbuffers.h>

#include "../core/Util.hpp"
#include "generated/flatbuffers/turn_data_generated.h"

namespace fbt = wordcube::gen::turn;

namespace
{
    using wordcube::core::CubeFaceSide;
    using wordcube::core::error::TurnDataError;
    using wordcube::core::error::TurnDataErrorCode;

    constexpr std::uint8_t SchemaVersion = 1;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)wordcube::core::CubeFaceSide::Right == (int)fbt::CubeFaceSide::Right);
    static_assert((int)wordcube::core::GameMode::Unlimited == (int)fbt::GameMode::Unlimited);
    static_assert((int)wordcube::core::Language::En == (int)fbt::Language::En);

    auto ToFbSide(CubeFaceSide const s) noexcept -> fbt::CubeFaceSide
    {
        switch (s)
        {
        case CubeFaceSide::Top: return fbt::CubeFaceSide::Top;
        case CubeFaceSide::Left: return fbt::CubeFaceSide::Left;
        case CubeFaceSide::Right: return fbt::CubeFaceSide::Right;
        }
        return fbt::CubeFaceSide::Top;
    }

    // Values outside the enum are possible in foreign buffers; the verifier does not check them.
    auto FromFbSide(fbt::CubeFaceSide const s) noexcept -> std::optional<CubeFaceSide>
    {
        switch (s)
        {
        case fbt::CubeFaceSide::Top: return CubeFaceSide::Top;
        case fbt::CubeFaceSide::Left: return CubeFaceSide::Left;
        case fbt::CubeFaceSide::Right: return CubeFaceSide::Right;
        }
        return std::nullopt;
    }

    auto ToFbFace(wordcube::core::CubeFace const& f) noexcept -> fbt::CubeFace
    {
        return fbt::CubeFace(static_cast<std::uint8_t>(f.letter), ToFbSide(f.side), f.use_count);
    }

    auto Malformed(std::string detail) -> std::unexpected<TurnDataError>
    {
        return std::unexpected(TurnDataError{TurnDataErrorCode::MalformedTurnData, std::move(detail)});
    }

    auto FromFbFace(fbt::CubeFace const& f) -> std::optional<wordcube::core::CubeFace>
    {
        std::optional<CubeFaceSide> const side = FromFbSide(f.side());
        if (!side) return std::nullopt;
        return wordcube::core::CubeFace{static_cast<char>(f.letter()), *side, f.use_count()};
    }

    auto BuildMove(flatbuffers::FlatBufferBuilder& fbb, wordcube::core::Move const& m)
        -> flatbuffers::Offset<fbt::Move>
    {
        fbt::MoveType kind{fbt::MoveType::NONE};
        flatbuffers::Offset<void> body{};

        if (auto const* word = std::get_if<wordcube::core::PlayedWord>(&m.type))
        {
            std::vector<fbt::IndexedCubeFace> faces;
            faces.reserve(word->faces.size());
            for (wordcube::core::IndexedCubeFace const& f : word->faces)
            {
                faces.emplace_back(f.index, ToFbSide(f.side));
            }
            kind = fbt::MoveType::PlayedWord;
            body = fbt::CreatePlayedWord(fbb, fbb.CreateVectorOfStructs(faces)).Union();
        }
        else
        {
            auto const& removed = std::get<wordcube::core::RemovedCube>(m.type);
            kind = fbt::MoveType::RemovedCube;
            body = fbt::CreateRemovedCube(fbb, removed.index).Union();
        }

        return fbt::CreateMove(fbb,
                               wordcube::core::ToMillis(m.played_at),
                               m.player_index.has_value(),
                               m.player_index.value_or(0),
                               m.score,
                               kind,
                               body);
    }

    auto ReadMove(fbt::Move const* m) -> std::expected<wordcube::core::Move, TurnDataError>
    {
        wordcube::core::Move out{};
        out.played_at = wordcube::core::FromMillis(m->played_at_ms());
        if (m->has_player_index()) out.player_index = m->player_index();
        out.score = m->score();

        switch (m->move_type())
        {
        case fbt::MoveType::PlayedWord:
        {
            fbt::PlayedWord const* pw = m->move_as_PlayedWord();
            if (!pw) return Malformed("played word without a body");
            wordcube::core::PlayedWord word{};
            if (auto const* faces = pw->faces())
            {
                word.faces.reserve(faces->size());
                for (fbt::IndexedCubeFace const* f : *faces)
                {
                    std::optional<CubeFaceSide> const side = FromFbSide(f->side());
                    if (!side || f->index() >= wordcube::core::constants::CubeCount)
                        return Malformed("played word references a face off the board");
                    word.faces.push_back(wordcube::core::IndexedCubeFace{f->index(), *side});
                }
            }
            out.type = std::move(word);
            return out;
        }
        case fbt::MoveType::RemovedCube:
        {
            fbt::RemovedCube const* rc = m->move_as_RemovedCube();
            if (!rc) return Malformed("removed cube without a body");
            std::uint8_t const idx = rc->index();
            if (idx >= wordcube::core::constants::CubeCount)
                return Malformed("removed cube off the board");
            out.type = wordcube::core::RemovedCube{idx};
            return out;
        }
        case fbt::MoveType::NONE:
            break;
        }
        return Malformed("move without a type");
    }
} // anonymous

namespace wordcube::net
{
    auto MakeTurnData(core::TurnBasedContext const& context,
                      core::GameState const& game,
                      std::optional<core::PlayerId> const& player_id) -> core::TurnBasedMatchData
    {
        core::TurnBasedMatchData data{};
        data.metadata = context.metadata;
        if (player_id)
        {
            if (std::optional<core::PlyrIdxT> const seat = context.LocalPlayerIndex())
            {
                data.metadata.player_index_to_id[*seat] = *player_id;
            }
        }
        data.cubes = game.cubes;
        data.moves = game.moves;
        data.game_mode = game.game_mode;
        data.language = game.language;
        data.player_id = player_id;
        return data;
    }

    auto EncodeTurnData(core::TurnBasedMatchData const& data) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;

        // std::map iterates in index order, which keeps the bytes stable
        std::vector<flatbuffers::Offset<fbt::PlayerIndexEntry>> entries;
        entries.reserve(data.metadata.player_index_to_id.size());
        for (auto const& [idx, id] : data.metadata.player_index_to_id)
        {
            auto const id_off = fbb.CreateString(id);
            entries.push_back(fbt::CreatePlayerIndexEntry(fbb, idx, id_off));
        }
        auto const entries_vec = fbb.CreateVector(entries);

        std::vector<fbt::Cube> cubes;
        cubes.reserve(data.cubes.size());
        for (core::Cube const& c : data.cubes)
        {
            cubes.emplace_back(ToFbFace(c.left), ToFbFace(c.right), ToFbFace(c.top), c.was_removed);
        }
        auto const cubes_vec = fbb.CreateVectorOfStructs(cubes);

        std::vector<flatbuffers::Offset<fbt::Move>> moves;
        moves.reserve(data.moves.size());
        for (core::Move const& m : data.moves)
        {
            moves.push_back(BuildMove(fbb, m));
        }
        auto const moves_vec = fbb.CreateVector(moves);

        flatbuffers::Offset<flatbuffers::String> pid_off{};
        if (data.player_id)
        {
            pid_off = fbb.CreateString(*data.player_id);
        }

        auto const root = fbt::CreateTurnData(fbb,
                                              SchemaVersion,
                                              core::ToMillis(data.metadata.last_opened_at),
                                              entries_vec,
                                              cubes_vec,
                                              moves_vec,
                                              static_cast<fbt::GameMode>(data.game_mode),
                                              static_cast<fbt::Language>(data.language),
                                              data.player_id.has_value(),
                                              pid_off);
        fbt::FinishTurnDataBuffer(fbb, root);

        std::uint8_t const* p = fbb.GetBufferPointer();
        return std::vector<std::uint8_t>(p, p + fbb.GetSize());
    }

    auto EncodeTurnData(core::TurnBasedContext const& context,
                        core::GameState const& game,
                        std::optional<core::PlayerId> const& player_id) -> std::vector<std::uint8_t>
    {
        return EncodeTurnData(MakeTurnData(context, game, player_id));
    }

    auto DecodeTurnData(std::span<std::byte const> bytes) -> DecodeResult
    {
        if (bytes.empty())
            return std::unexpected(core::error::TurnDataError{core::error::TurnDataErrorCode::NoTurnDataYet, {}});

        auto const* p = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(p, bytes.size());
        if (!fbt::VerifyTurnDataBuffer(verifier))
            return Malformed(std::format("buffer of {} bytes failed verification", bytes.size()));

        fbt::TurnData const* td = fbt::GetTurnData(p);
        if (td->schema_version() != SchemaVersion)
            return Malformed(std::format("unsupported schema version {}", td->schema_version()));

        core::TurnBasedMatchData out{};
        out.metadata.last_opened_at = core::FromMillis(td->last_opened_at_ms());

        if (auto const* entries = td->player_index_to_id())
        {
            for (fbt::PlayerIndexEntry const* e : *entries)
            {
                if (!e->player_id()) return Malformed("player index entry without an id");
                out.metadata.player_index_to_id[e->index()] = e->player_id()->str();
            }
        }

        auto const* cubes = td->cubes();
        if (!cubes || cubes->size() != core::constants::CubeCount)
            return Malformed(std::format("expected {} cubes, got {}", core::constants::CubeCount,
                                         cubes ? cubes->size() : 0u));
        for (flatbuffers::uoffset_t i = 0; i < cubes->size(); ++i)
        {
            fbt::Cube const* c = cubes->Get(i);
            std::optional<core::CubeFace> const left = FromFbFace(c->left());
            std::optional<core::CubeFace> const right = FromFbFace(c->right());
            std::optional<core::CubeFace> const top = FromFbFace(c->top());
            if (!left || !right || !top) return Malformed("cube face with an unknown side");
            out.cubes[i] = core::Cube{*left, *right, *top, c->was_removed()};
        }

        if (auto const* moves = td->moves())
        {
            out.moves.reserve(moves->size());
            for (fbt::Move const* m : *moves)
            {
                auto move = ReadMove(m);
                if (!move) return std::unexpected(std::move(move.error()));
                out.moves.push_back(std::move(*move));
            }
        }

        switch (td->game_mode())
        {
        case fbt::GameMode::Timed: out.game_mode = core::GameMode::Timed; break;
        case fbt::GameMode::Unlimited: out.game_mode = core::GameMode::Unlimited; break;
        default: return Malformed("unknown game mode");
        }
        if (td->language() != fbt::Language::En) return Malformed("unknown language");
        out.language = core::Language::En;

        if (td->has_player_id())
        {
            if (!td->player_id()) return Malformed("player id flagged but missing");
            out.player_id = td->player_id()->str();
        }
        return out;
    }

    auto DecodeTurnData(std::vector<std::uint8_t> const& bytes) -> DecodeResult
    {
        return DecodeTurnData(core::util::AsBytes(bytes));
    }
} // namespace wordcube::net
