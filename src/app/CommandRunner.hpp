//
// CommandRunner.hpp
//

#ifndef WORDCUBE_COMMANDRUNNER_HPP
#define WORDCUBE_COMMANDRUNNER_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Effects.hpp"
#include "../net/MatchServiceClient.hpp"
#include "GameStore.hpp"

namespace wordcube::app
{
    struct CommandFailure
    {
        std::string command;
        std::string message;
    };

    struct RunReport
    {
        std::vector<CommandFailure> failures{};
        // actions to feed back into the reducer, in completion order for concurrent groups
        std::vector<core::AppAction> follow_ups{};

        auto Ok() const -> bool { return failures.empty(); }
    };

    // Performs an Effect. Nothing is retried; every failure lands in the report.
    class CommandRunner
    {
    public:
        CommandRunner(net::MatchServiceClient& client,
                      GameStore& store,
                      std::function<void()> start_listening);

        auto Run(core::Effect const& effect) -> RunReport;

    private:
        // Throws on failure.
        auto Execute(core::Command const& command) -> std::optional<core::AppAction>;

        // Never throws.
        auto RunOne(core::Command const& command) -> RunReport;

        net::MatchServiceClient& client_;
        GameStore& store_;
        std::function<void()> start_listening_;
    };
}

#endif //WORDCUBE_COMMANDRUNNER_HPP
