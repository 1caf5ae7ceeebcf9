//
// Util.hpp
//

#ifndef WORDCUBE_UTIL_HPP
#define WORDCUBE_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace wordcube::core::util
{
    // std::visit helper; a missing alternative is a compile error, not a silent default.
    template <class... Ts>
    struct Overloaded : Ts...
    {
        using Ts::operator()...;
    };

    inline auto AsBytes(std::vector<uint8_t> const& v) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(v.data()), v.size()};
    }

    inline auto AsBytes(std::string const& s) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(s.data()), s.size()};
    }

    inline auto ToVector(std::span<std::byte const> bytes) -> std::vector<uint8_t>
    {
        auto const* p = reinterpret_cast<uint8_t const*>(bytes.data());
        return std::vector<uint8_t>(p, p + bytes.size());
    }
}

#endif //WORDCUBE_UTIL_HPP
