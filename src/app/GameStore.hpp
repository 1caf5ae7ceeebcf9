//
// GameStore.hpp
//

#ifndef WORDCUBE_GAMESTORE_HPP
#define WORDCUBE_GAMESTORE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "../core/Game.hpp"
#include "../net/TurnDataCodec.hpp"

namespace wordcube::app
{
    // Where finished games go.
    class GameStore
    {
    public:
        virtual ~GameStore() = default;

        // throws error::StorageError
        virtual auto Save(core::GameState const& game) -> void = 0;
    };

    // One file per completed game, holding the same payload a match carries.
    class FileGameStore final : public GameStore
    {
    public:
        explicit FileGameStore(std::filesystem::path dir);

        auto Save(core::GameState const& game) -> void override;

        auto Load(std::filesystem::path const& file) const -> net::DecodeResult;
        auto List() const -> std::vector<std::filesystem::path>;

        // File a game is saved under; turn based games are keyed by match id.
        auto PathFor(core::GameState const& game) const -> std::filesystem::path;

    private:
        std::filesystem::path dir_;
        mutable std::mutex mtx_;
    };
}

#endif //WORDCUBE_GAMESTORE_HPP
