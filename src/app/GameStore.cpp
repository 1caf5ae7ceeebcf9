//
// GameStore.cpp
//
#include "GameStore.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "../core/Exception.hpp"

namespace
{
    constexpr char const* Extension = ".wcg";

    auto SafeName(std::string name) -> std::string
    {
        std::ranges::replace_if(name,
                                [](unsigned char c) { return !(std::isalnum(c) || c == '-' || c == '_'); },
                                '_');
        return name;
    }
}

namespace wordcube::app
{
    FileGameStore::FileGameStore(std::filesystem::path dir)
        : dir_{std::move(dir)}
    {
    }

    auto FileGameStore::PathFor(core::GameState const& game) const -> std::filesystem::path
    {
        if (core::TurnBasedContext const* ctx = game.TurnContext())
        {
            return dir_ / (SafeName(ctx->match.match_id) + Extension);
        }
        return dir_ / std::format("solo-{}{}", core::ToMillis(game.game_start_time), Extension);
    }

    auto FileGameStore::Save(core::GameState const& game) -> void
    {
        core::TurnBasedMatchData data{};
        if (core::TurnBasedContext const* ctx = game.TurnContext())
        {
            data = net::MakeTurnData(*ctx, game, std::nullopt);
        }
        else
        {
            data.cubes = game.cubes;
            data.moves = game.moves;
            data.game_mode = game.game_mode;
            data.language = game.language;
        }
        std::vector<std::uint8_t> const bytes = net::EncodeTurnData(data);

        std::lock_guard lock(mtx_);
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            WCB_THROW(core::error::Code::Storage, std::format("cannot create {}: {}", dir_.string(), ec.message()));

        std::filesystem::path const file = PathFor(game);
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out)
            WCB_THROW(core::error::Code::Storage, std::format("cannot write {}", file.string()));
    }

    auto FileGameStore::Load(std::filesystem::path const& file) const -> net::DecodeResult
    {
        std::lock_guard lock(mtx_);
        std::ifstream in(file, std::ios::binary);
        if (!in)
            WCB_THROW(core::error::Code::Storage, std::format("cannot open {}", file.string()));

        std::vector<std::uint8_t> const bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return net::DecodeTurnData(bytes);
    }

    auto FileGameStore::List() const -> std::vector<std::filesystem::path>
    {
        std::lock_guard lock(mtx_);
        std::vector<std::filesystem::path> out;
        std::error_code ec;
        if (!std::filesystem::is_directory(dir_, ec)) return out;

        for (auto const& entry : std::filesystem::directory_iterator(dir_, ec))
        {
            if (entry.is_regular_file() && entry.path().extension() == Extension) out.push_back(entry.path());
        }
        std::ranges::sort(out);
        return out;
    }
}
