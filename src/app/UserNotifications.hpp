//
// UserNotifications.hpp
//

#ifndef WORDCUBE_USERNOTIFICATIONS_HPP
#define WORDCUBE_USERNOTIFICATIONS_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../core/Clock.hpp"
#include "../core/Types.hpp"

namespace wordcube::app
{
    enum class AuthorizationStatus : uint8_t
    {
        NotDetermined = 0,
        Denied,
        Authorized,
        Provisional,
        Ephemeral
    };

    // bit flags
    enum AuthorizationOption : uint8_t
    {
        AuthAlert = 1 << 0,
        AuthBadge = 1 << 1,
        AuthSound = 1 << 2
    };

    enum PresentationOption : uint8_t
    {
        PresentBanner = 1 << 0,
        PresentList = 1 << 1,
        PresentSound = 1 << 2
    };

    struct UserNotificationSettings
    {
        AuthorizationStatus authorization_status{AuthorizationStatus::NotDetermined};
    };
    inline auto operator==(UserNotificationSettings const& a, UserNotificationSettings const& b) -> bool
    {
        return a.authorization_status == b.authorization_status;
    }

    struct NotificationRequest
    {
        std::string identifier{};
        std::string title{};
        std::string body{};
        // delivered on the next Deliver() when unset
        std::optional<core::Timestamp> deliver_at{};
    };
    inline auto operator==(NotificationRequest const& a, NotificationRequest const& b) -> bool
    {
        return a.identifier == b.identifier && a.title == b.title && a.body == b.body && a.deliver_at == b.deliver_at;
    }

    struct Notification
    {
        core::Timestamp date{};
        NotificationRequest request{};
    };
    inline auto operator==(Notification const& a, Notification const& b) -> bool
    {
        return a.date == b.date && a.request == b.request;
    }

    struct NotificationResponse
    {
        Notification notification{};
    };
    inline auto operator==(NotificationResponse const& a, NotificationResponse const& b) -> bool
    {
        return a.notification == b.notification;
    }

    // Delegate events. Equality compares payloads only; completion handlers never take part.
    struct DidReceiveResponse
    {
        NotificationResponse response{};
        std::function<void()> completion_handler{};
    };
    inline auto operator==(DidReceiveResponse const& a, DidReceiveResponse const& b) -> bool
    {
        return a.response == b.response;
    }

    struct OpenSettingsForNotification
    {
        std::optional<Notification> notification{};
    };
    inline auto operator==(OpenSettingsForNotification const& a, OpenSettingsForNotification const& b) -> bool
    {
        return a.notification == b.notification;
    }

    struct WillPresentNotification
    {
        Notification notification{};
        std::function<void(uint8_t)> completion_handler{};
    };
    inline auto operator==(WillPresentNotification const& a, WillPresentNotification const& b) -> bool
    {
        return a.notification == b.notification;
    }

    using DelegateEvent = std::variant<DidReceiveResponse, OpenSettingsForNotification, WillPresentNotification>;

    class UserNotificationClient
    {
    public:
        virtual ~UserNotificationClient() = default;

        // throws error::ServiceError when notifications are denied
        virtual auto Add(NotificationRequest const& request) -> void = 0;
        virtual auto NotificationSettings() const -> UserNotificationSettings = 0;
        virtual auto RemoveDelivered(std::vector<std::string> const& identifiers) -> void = 0;
        virtual auto RemovePending(std::vector<std::string> const& identifiers) -> void = 0;
        virtual auto RequestAuthorization(uint8_t options) -> bool = 0;

        // Blocks until an event arrives or the deadline passes (nullopt).
        virtual auto NextDelegateEvent(std::chrono::steady_clock::time_point deadline)
            -> std::optional<DelegateEvent> = 0;
    };

    // Process-local notification center for the headless client and tests.
    class InMemoryNotificationCenter final : public UserNotificationClient
    {
    public:
        InMemoryNotificationCenter(core::GameClock const& clock, bool grant_authorization);

        auto Add(NotificationRequest const& request) -> void override;
        auto NotificationSettings() const -> UserNotificationSettings override;
        auto RemoveDelivered(std::vector<std::string> const& identifiers) -> void override;
        auto RemovePending(std::vector<std::string> const& identifiers) -> void override;
        auto RequestAuthorization(uint8_t options) -> bool override;
        auto NextDelegateEvent(std::chrono::steady_clock::time_point deadline)
            -> std::optional<DelegateEvent> override;

        // Moves every due request to the delivered list and announces it. Returns how many.
        auto Deliver() -> std::size_t;
        // The user tapped a delivered notification.
        auto Tap(std::string const& identifier) -> bool;
        auto OpenSettings(std::optional<std::string> const& identifier) -> void;

        auto Pending() const -> std::vector<NotificationRequest>;
        auto Delivered() const -> std::vector<Notification>;
        auto PresentedWith(std::string const& identifier) const -> std::optional<uint8_t>;

    private:
        auto Emit(DelegateEvent event) -> void;

        core::GameClock const& clock_;
        bool grant_;
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        UserNotificationSettings settings_{};
        std::map<std::string, NotificationRequest> pending_;
        std::vector<Notification> delivered_;
        std::map<std::string, uint8_t> presented_;
        std::deque<DelegateEvent> events_;
    };
}

#endif //WORDCUBE_USERNOTIFICATIONS_HPP
