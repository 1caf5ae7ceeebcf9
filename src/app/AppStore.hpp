//
// AppStore.hpp
//

#ifndef WORDCUBE_APPSTORE_HPP
#define WORDCUBE_APPSTORE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../debug/AuditLogger.hpp"
#include "../net/MatchServiceClient.hpp"
#include "CommandRunner.hpp"
#include "GameStore.hpp"
#include "Reconciler.hpp"

namespace wordcube::app
{
    // Owns the app state. Actions are reduced one at a time on a single consumer thread;
    // the commands they produce run on their own tasks and never block the next action.
    class AppStore
    {
    public:
        AppStore(TurnReconciler reconciler,
                 net::MatchServiceClient& client,
                 GameStore& store,
                 debug::AuditLogger* audit = nullptr);
        ~AppStore();

        AppStore(AppStore const&) = delete;
        auto operator=(AppStore const&) -> AppStore& = delete;

        auto Start() -> void;

        // Dropped once Stop() has begun.
        auto Send(core::AppAction action) -> void;

        // Stops the listener and the consumer together, then waits for in-flight commands.
        auto Stop() -> void;

        // True once every queued action is reduced and every command has finished.
        auto WaitIdle(std::chrono::steady_clock::time_point deadline) -> bool;

        auto State() const -> core::AppState;
        auto Failures() const -> std::vector<CommandFailure>;
        auto IsListening() const -> bool { return listening_.load(); }

    private:
        auto ConsumeLoop() -> void;
        auto ListenLoop() -> void;
        auto StartListening() -> void;
        auto Launch(core::Effect effect) -> void;
        auto Finish(RunReport report) -> void;

        TurnReconciler reconciler_;
        net::MatchServiceClient& client_;
        CommandRunner runner_;
        debug::AuditLogger* audit_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<core::AppAction> queue_;
        core::AppState state_;
        bool started_{false};
        bool stopping_{false};
        // actions being reduced plus effects in flight
        std::size_t busy_{0};
        std::vector<std::future<void>> in_flight_;
        std::vector<CommandFailure> failures_;

        std::atomic<bool> listening_{false};
        std::thread consumer_;
        std::thread listener_;
    };
}

#endif //WORDCUBE_APPSTORE_HPP
