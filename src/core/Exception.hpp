//
// Exception.hpp
//

#ifndef WORDCUBE_EXCEPTION_HPP
#define WORDCUBE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace wordcube::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Service, // a command sent to the match service failed
        Timeout, // deadline exceeded waiting for the service
        Network, // transport failure
        Storage, // saving or loading a completed game
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ServiceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StorageError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Service: throw ServiceError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Storage: throw StorageError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "Unknown";
        case Code::Service: return "Service";
        case Code::Timeout: return "Timeout";
        case Code::Network: return "Network";
        case Code::Storage: return "Storage";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

#define WCB_THROW(code_enum, msg) ::wordcube::core::error::fail((code_enum), (msg))
#define WCB_ASSERT(cond, msg) do { if(!(cond)) ::wordcube::core::error::fail(::wordcube::core::error::Code::Assertion, (msg)); } while(0)

    // Outcome of reading a match's data blob. Neither case is an exception:
    // an empty blob is the normal state of a match nobody has played yet.
    enum class TurnDataErrorCode : std::uint8_t
    {
        NoTurnDataYet,
        MalformedTurnData
    };

    struct TurnDataError
    {
        TurnDataErrorCode code{};
        std::string detail{};
    };

    inline auto to_string(TurnDataErrorCode c) -> std::string_view
    {
        switch (c)
        {
        case TurnDataErrorCode::NoTurnDataYet: return "No turn data yet";
        case TurnDataErrorCode::MalformedTurnData: return "Malformed turn data";
        }
        return "Unknown";
    }

    inline auto describe(TurnDataError const& e) -> std::string
    {
        if (e.detail.empty()) return std::string{to_string(e.code)};
        return std::format("{} | {}", to_string(e.code), e.detail);
    }
}

#endif //WORDCUBE_EXCEPTION_HPP
