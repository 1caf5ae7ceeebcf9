//
// AppStore.cpp
//
#include "AppStore.hpp"

#include <exception>
#include <print>
#include <utility>

#include "../core/Exception.hpp"

namespace wordcube::app
{
    namespace
    {
        constexpr std::chrono::milliseconds ListenPoll{100};
    }

    AppStore::AppStore(TurnReconciler reconciler,
                       net::MatchServiceClient& client,
                       GameStore& store,
                       debug::AuditLogger* audit)
        : reconciler_{std::move(reconciler)}
          , client_{client}
          , runner_{client, store, [this] { StartListening(); }}
          , audit_{audit}
    {
    }

    AppStore::~AppStore()
    {
        Stop();
    }

    auto AppStore::Start() -> void
    {
        std::lock_guard lock(mtx_);
        if (started_ || stopping_) return;
        started_ = true;
        consumer_ = std::thread([this] { ConsumeLoop(); });
    }

    auto AppStore::Send(core::AppAction action) -> void
    {
        {
            std::lock_guard lock(mtx_);
            if (stopping_) return;
            queue_.push_back(std::move(action));
        }
        cv_.notify_all();
    }

    auto AppStore::Stop() -> void
    {
        {
            std::lock_guard lock(mtx_);
            if (stopping_) return;
            stopping_ = true;
        }
        listening_.store(false);
        cv_.notify_all();

        if (consumer_.joinable()) consumer_.join();

        // no new effect can start past this point; the running ones finish
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(mtx_);
            pending.swap(in_flight_);
        }
        for (std::future<void>& f : pending) f.wait();

        if (listener_.joinable()) listener_.join();

        if (audit_)
        {
            std::lock_guard lock(mtx_);
            audit_->end(state_);
        }
    }

    auto AppStore::WaitIdle(std::chrono::steady_clock::time_point deadline) -> bool
    {
        std::unique_lock lk(mtx_);
        return cv_.wait_until(lk, deadline, [&] { return queue_.empty() && busy_ == 0; });
    }

    auto AppStore::State() const -> core::AppState
    {
        std::lock_guard lock(mtx_);
        return state_;
    }

    auto AppStore::Failures() const -> std::vector<CommandFailure>
    {
        std::lock_guard lock(mtx_);
        return failures_;
    }

    auto AppStore::ConsumeLoop() -> void
    {
        for (;;)
        {
            core::Effect effect{};
            {
                std::unique_lock lk(mtx_);
                cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
                if (stopping_) return;

                core::AppAction action = std::move(queue_.front());
                queue_.pop_front();

                effect = reconciler_.Reduce(state_, action);
                if (audit_) audit_->step(action, state_, effect);
                if (!effect.IsNone()) ++busy_;
            }
            cv_.notify_all();

            if (!effect.IsNone()) Launch(std::move(effect));
        }
    }

    auto AppStore::Launch(core::Effect effect) -> void
    {
        std::lock_guard lock(mtx_);
        std::erase_if(in_flight_, [](std::future<void> const& f)
        {
            return f.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
        });
        in_flight_.push_back(std::async(std::launch::async, [this, effect = std::move(effect)]
        {
            Finish(runner_.Run(effect));
        }));
    }

    auto AppStore::Finish(RunReport report) -> void
    {
        for (CommandFailure const& f : report.failures)
        {
            if (audit_) audit_->failure(f.command, f.message);
        }
        {
            std::lock_guard lock(mtx_);
            for (CommandFailure& f : report.failures) failures_.push_back(std::move(f));
            if (!stopping_)
            {
                for (core::AppAction& a : report.follow_ups) queue_.push_back(std::move(a));
            }
            --busy_;
        }
        cv_.notify_all();
    }

    auto AppStore::StartListening() -> void
    {
        std::lock_guard lock(mtx_);
        if (stopping_ || listener_.joinable()) return;
        listening_.store(true);
        listener_ = std::thread([this] { ListenLoop(); });
    }

    auto AppStore::ListenLoop() -> void
    {
        while (listening_.load())
        {
            std::optional<core::ListenerEvent> event{};
            try
            {
                event = client_.NextEvent(std::chrono::steady_clock::now() + ListenPoll);
            }
            catch (core::error::NetworkError const& e)
            {
                // the feed is gone for good
                std::print("[Listener] stopped: {}\n", e.what());
                listening_.store(false);
                return;
            }
            catch (core::OmegaException<core::error::Code> const& e)
            {
                std::print("[Listener] {}\n", e.what());
                std::this_thread::sleep_for(ListenPoll);
                continue;
            }
            catch (std::exception const& e)
            {
                std::print("[Listener] {}\n", e.what());
                std::this_thread::sleep_for(ListenPoll);
                continue;
            }
            if (event) Send(core::AppAction{std::move(*event)});
        }
    }
}
