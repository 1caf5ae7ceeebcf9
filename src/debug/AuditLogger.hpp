//
// AuditLogger.hpp
//

#ifndef WORDCUBE_AUDITLOGGER_HPP
#define WORDCUBE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/Actions.hpp"
#include "../core/Effects.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace wordcube::debug
{
    // Reconciliation transcript: one block per action, plus command failures as they happen.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header
        auto start(std::string_view player_id, std::uint64_t seed) -> void;

        // After each reduction: the action, the screen it left, the commands it asked for
        auto step(core::AppAction const& action,
                  core::AppState const& state,
                  core::Effect const& effect) -> void;

        auto failure(std::string_view command, std::string_view message) -> void;

        auto end(core::AppState const& state) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::mutex mtx_;
        std::ofstream out_;
        std::uint64_t steps_{0};
    };

    auto DescribeAction(core::AppAction const& action) -> std::string;
    auto DescribeScreen(core::Destination const& destination) -> std::string;
    auto DescribeEffect(core::Effect const& effect) -> std::string;
}

#endif //WORDCUBE_AUDITLOGGER_HPP
