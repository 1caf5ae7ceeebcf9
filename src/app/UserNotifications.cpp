//
// UserNotifications.cpp
//
#include "UserNotifications.hpp"

#include <algorithm>
#include <utility>

#include "../core/Exception.hpp"

namespace wordcube::app
{
    InMemoryNotificationCenter::InMemoryNotificationCenter(core::GameClock const& clock, bool grant_authorization)
        : clock_{clock}
          , grant_{grant_authorization}
    {
    }

    auto InMemoryNotificationCenter::Add(NotificationRequest const& request) -> void
    {
        std::lock_guard lock(mtx_);
        if (settings_.authorization_status == AuthorizationStatus::Denied)
            WCB_THROW(core::error::Code::Service, "Notifications are not authorized");
        // same identifier replaces
        pending_[request.identifier] = request;
    }

    auto InMemoryNotificationCenter::NotificationSettings() const -> UserNotificationSettings
    {
        std::lock_guard lock(mtx_);
        return settings_;
    }

    auto InMemoryNotificationCenter::RemoveDelivered(std::vector<std::string> const& identifiers) -> void
    {
        std::lock_guard lock(mtx_);
        std::erase_if(delivered_, [&](Notification const& n)
        {
            return std::ranges::find(identifiers, n.request.identifier) != identifiers.end();
        });
    }

    auto InMemoryNotificationCenter::RemovePending(std::vector<std::string> const& identifiers) -> void
    {
        std::lock_guard lock(mtx_);
        for (std::string const& id : identifiers) pending_.erase(id);
    }

    auto InMemoryNotificationCenter::RequestAuthorization(uint8_t options) -> bool
    {
        std::lock_guard lock(mtx_);
        if (settings_.authorization_status == AuthorizationStatus::NotDetermined && options != 0)
        {
            settings_.authorization_status = grant_ ? AuthorizationStatus::Authorized : AuthorizationStatus::Denied;
        }
        return settings_.authorization_status == AuthorizationStatus::Authorized;
    }

    auto InMemoryNotificationCenter::NextDelegateEvent(std::chrono::steady_clock::time_point deadline)
        -> std::optional<DelegateEvent>
    {
        std::unique_lock lk(mtx_);
        cv_.wait_until(lk, deadline, [&] { return !events_.empty(); });
        if (events_.empty()) return std::nullopt;
        DelegateEvent e = std::move(events_.front());
        events_.pop_front();
        return e;
    }

    auto InMemoryNotificationCenter::Deliver() -> std::size_t
    {
        core::Timestamp const now = clock_.Now();
        std::vector<Notification> due;
        {
            std::lock_guard lock(mtx_);
            for (auto it = pending_.begin(); it != pending_.end();)
            {
                if (!it->second.deliver_at || *it->second.deliver_at <= now)
                {
                    due.push_back(Notification{now, std::move(it->second)});
                    it = pending_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
            delivered_.insert(delivered_.end(), due.begin(), due.end());
        }

        for (Notification const& n : due)
        {
            std::string const id = n.request.identifier;
            Emit(WillPresentNotification{n, [this, id](uint8_t options)
            {
                std::lock_guard lock(mtx_);
                presented_[id] = options;
            }});
        }
        return due.size();
    }

    auto InMemoryNotificationCenter::Tap(std::string const& identifier) -> bool
    {
        std::optional<Notification> hit{};
        {
            std::lock_guard lock(mtx_);
            auto it = std::ranges::find(delivered_, identifier,
                                        [](Notification const& n) { return n.request.identifier; });
            if (it == delivered_.end()) return false;
            hit = *it;
        }
        Emit(DidReceiveResponse{NotificationResponse{*hit}, [] {}});
        return true;
    }

    auto InMemoryNotificationCenter::OpenSettings(std::optional<std::string> const& identifier) -> void
    {
        std::optional<Notification> hit{};
        if (identifier)
        {
            std::lock_guard lock(mtx_);
            auto it = std::ranges::find(delivered_, *identifier,
                                        [](Notification const& n) { return n.request.identifier; });
            if (it != delivered_.end()) hit = *it;
        }
        Emit(OpenSettingsForNotification{hit});
    }

    auto InMemoryNotificationCenter::Pending() const -> std::vector<NotificationRequest>
    {
        std::lock_guard lock(mtx_);
        std::vector<NotificationRequest> out;
        out.reserve(pending_.size());
        for (auto const& [id, req] : pending_) out.push_back(req);
        return out;
    }

    auto InMemoryNotificationCenter::Delivered() const -> std::vector<Notification>
    {
        std::lock_guard lock(mtx_);
        return delivered_;
    }

    auto InMemoryNotificationCenter::PresentedWith(std::string const& identifier) const -> std::optional<uint8_t>
    {
        std::lock_guard lock(mtx_);
        if (auto it = presented_.find(identifier); it != presented_.end()) return it->second;
        return std::nullopt;
    }

    auto InMemoryNotificationCenter::Emit(DelegateEvent event) -> void
    {
        {
            std::lock_guard lock(mtx_);
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
    }
}
