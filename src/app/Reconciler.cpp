//
// Reconciler.cpp
//
#include "Reconciler.hpp"

#include <format>
#include <print>
#include <utility>

#include "../core/Util.hpp"
#include "../net/TurnDataCodec.hpp"

namespace wordcube::app
{
    using namespace wordcube::core;

    TurnReconciler::TurnReconciler(ReconcilerEnv env)
        : env_{std::move(env)}
    {
    }

    auto TurnReconciler::Reduce(AppState& state, AppAction const& action) -> Effect
    {
        return std::visit(
            util::Overloaded{
                [&](DidFinishLaunching const&) -> Effect
                {
                    return Effect{{AuthenticateLocalPlayer{}, StartListening{}}, Ordering::Sequential};
                },
                [&](ListenerEvent const& e) -> Effect { return OnListenerEvent(state, e); },
                [&](GameOverRematchTapped const&) -> Effect { return OnRematchTapped(state); },
                [&](ActiveGameRematchTapped const& a) -> Effect
                {
                    return Effect{{RequestRematch{a.match_id}}, Ordering::Sequential};
                },
                [&](PastGameOpened const& a) -> Effect { return HandleMatch(state, a.match, true); },
                [&](RematchResponse const& r) -> Effect { return OnRematchResponse(state, r); },
            },
            action);
    }

    auto TurnReconciler::OnListenerEvent(AppState& state, ListenerEvent const& event) -> Effect
    {
        return std::visit(
            util::Overloaded{
                [&](MatchEnded const& e) -> Effect { return OnMatchEnded(state, e.match); },
                [&](ReceivedTurnEvent const& e) -> Effect { return HandleMatch(state, e.match, e.did_become_active); },
                [&](WantsToQuitMatch const& e) -> Effect { return OnWantsToQuit(e.match); },
            },
            event);
    }

    auto TurnReconciler::OnMatchEnded(AppState& state, TurnBasedMatch const& match) -> Effect
    {
        GameState const* shown = AsGame(state.destination);
        TurnBasedContext const* ctx = shown ? shown->TurnContext() : nullptr;
        if (!ctx || ctx->match.match_id != match.match_id) return Effect::None();

        std::optional<TurnBasedMatchData> const data = Decode(match);
        if (!data) return Effect::None();

        GameState game = GameState::FromTurnBasedMatch(env_.clock.Now(), env_.local_player(), match, *data);
        game.active_games = shown->active_games;
        game.is_game_loaded = true;
        game.game_over = MakeGameOver(game);

        PersistGame persist{game};
        state.destination = std::move(game);
        return Effect{{std::move(persist)}, Ordering::Sequential};
    }

    auto TurnReconciler::OnWantsToQuit(TurnBasedMatch const& match) const -> Effect
    {
        LocalPlayer const player = env_.local_player();
        EndMatchInTurn end{};
        end.match_id = match.match_id;
        end.match_data = match.match_data;
        end.local_player_id = player.game_player_id;
        end.local_player_outcome = MatchOutcome::Quit;
        end.message = std::format("{} forfeited the match.", player.display_name);
        return Effect{{std::move(end)}, Ordering::Sequential};
    }

    auto TurnReconciler::OnRematchTapped(AppState& state) -> Effect
    {
        std::optional<MatchId> prior{};
        if (GameState const* g = AsGame(state.destination))
        {
            if (g->game_over && g->game_over->turn_based_context)
                prior = g->game_over->turn_based_context->match.match_id;
        }
        else if (GameOverState const* over = AsGameOver(state.destination))
        {
            if (over->turn_based_context) prior = over->turn_based_context->match.match_id;
        }
        if (!prior) return Effect::None();

        state.destination = NoDestination{};
        return Effect{{RequestRematch{std::move(*prior)}}, Ordering::Sequential};
    }

    auto TurnReconciler::OnRematchResponse(AppState& state, RematchResponse const& response) -> Effect
    {
        if (!response.result)
        {
            std::print("[GameCenter] Rematch failed: {}\n", response.result.error().message);
            return Effect::None();
        }
        return HandleMatch(state, *response.result, true);
    }

    auto TurnReconciler::HandleMatch(AppState& state, TurnBasedMatch const& match, bool did_become_active)
        -> Effect
    {
        if (match.match_data.empty()) return StartFreshMatch(state, match);

        std::optional<TurnBasedMatchData> const data = Decode(match);
        if (!data) return Effect::None();

        if (did_become_active) return ShowMatch(state, match, *data);
        return NotifyIfRecent(state, match, *data);
    }

    auto TurnReconciler::StartFreshMatch(AppState& state, TurnBasedMatch const& match) -> Effect
    {
        Timestamp const now = env_.clock.Now();
        TurnBasedContext ctx{env_.local_player(), match, TurnBasedMetadata{now, {}}};

        GameState game{};
        game.cubes = env_.cubes.RandomCubes(Language::En);
        game.context = ctx;
        game.game_current_time = now;
        game.game_mode = GameMode::Unlimited;
        game.game_start_time = match.creation_date;

        SaveCurrentTurn save{match.match_id, net::EncodeTurnData(ctx, game, env_.current_player_id())};
        state.destination = std::move(game);
        return Effect{{DismissMatchmaker{}, std::move(save)}, Ordering::Concurrent};
    }

    auto TurnReconciler::ShowMatch(AppState& state,
                                   TurnBasedMatch const& match,
                                   TurnBasedMatchData const& data) -> Effect
    {
        Timestamp const now = env_.clock.Now();
        GameState game = GameState::FromTurnBasedMatch(now, env_.local_player(), match, data);

        if (GameState const* prior = AsGame(state.destination))
        {
            game.active_games = prior->active_games;
            game.is_game_loaded = true;
        }

        // finished matches open on their summary
        bool const over = match.IsOver();
        if (over) game.game_over = MakeGameOver(game);
        bool const save = game.IsYourTurn() && !over;
        state.destination = std::move(game);

        Effect fx{{DismissMatchmaker{}}, Ordering::Sequential};
        if (save)
        {
            TurnBasedMatchData opened = data;
            opened.metadata.last_opened_at = now;
            fx.commands.emplace_back(SaveCurrentTurn{match.match_id, net::EncodeTurnData(opened)});
        }
        return fx;
    }

    auto TurnReconciler::NotifyIfRecent(AppState const& state,
                                        TurnBasedMatch const& match,
                                        TurnBasedMatchData const& data) const -> Effect
    {
        TurnBasedContext const ctx{env_.local_player(), match, data.metadata};

        TurnBasedContext const* shown = ShownTurnContext(state.destination);
        if (shown && shown->match.match_id == match.match_id) return Effect::None();
        if (!ctx.CurrentParticipantIsLocalPlayer()) return Effect::None();
        if (match.HasAnyOutcome()) return Effect::None();

        std::optional<Timestamp> const last_turn = match.LastTurnDate();
        if (!last_turn || *last_turn <= env_.clock.Now() - env_.recent_turn_window) return Effect::None();

        return Effect{{ShowNotificationBanner{match.message, std::nullopt}}, Ordering::Sequential};
    }

    auto TurnReconciler::Decode(TurnBasedMatch const& match) const -> std::optional<TurnBasedMatchData>
    {
        net::DecodeResult decoded = net::DecodeTurnData(match.match_data);
        if (decoded) return std::move(*decoded);

        if (decoded.error().code == error::TurnDataErrorCode::MalformedTurnData)
        {
            std::print("[GameCenter] Match {} has unreadable data: {}\n",
                       match.match_id, error::describe(decoded.error()));
            if (env_.report_decode_error) env_.report_decode_error(match.match_id, decoded.error());
        }
        return std::nullopt;
    }
}
