#ifndef PSTRING_HPP
#define PSTRING_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "assert.hpp"

// Holds a slice of the parser's input buffer.
// Convertible to std::string_view, and you'll probably want to do that.
struct pstring_t
{
    std::uint32_t offset;
    std::uint32_t size;

    std::string_view view(char const* buffer) const 
        { return std::string_view(buffer + offset, size); }

    std::string string(char const* buffer) const 
        { return std::string(view(buffer)); }

    constexpr std::uint32_t end() const { return offset + size; }

    constexpr explicit operator bool() const { return size; }

    constexpr bool operator==(pstring_t const&) const = default;
};

#endif
