#ifndef PARSE_ERROR_HPP
#define PARSE_ERROR_HPP

#include <stdexcept>
#include <string>

#include "console.hpp"
#include "format.hpp"
#include "pstring.hpp"
#include "source.hpp"

struct line_col_t
{
    unsigned line;
    unsigned col;
};

// Thrown when a buffer can't be parsed.
// 'what()' holds the fully formatted diagnostic.
class parse_error_t : public std::runtime_error
{
public:
    parse_error_t(std::string const& formatted, pstring_t pstring, line_col_t line_col, std::string message)
    : std::runtime_error(formatted)
    , pstring(pstring)
    , line_col(line_col)
    , message(std::move(message))
    {}

    pstring_t pstring;
    line_col_t line_col;
    std::string message; // Without position or source line.
};

line_col_t get_line_col(char const* src, pstring_t pstring);

std::string fmt_source_pos(source_t const& source, pstring_t pstring);

std::string fmt_error(std::string const& what);
std::string fmt_error(pstring_t pstring, std::string const& what, source_t const& source,
                      char const* color = CONSOLE_RED, char const* prefix = "error");

std::string fmt_note(std::string const& what);
std::string fmt_warning(pstring_t pstring, std::string const& what, source_t const& source);

[[noreturn]] 
void parse_error(pstring_t pstring, std::string const& what, source_t const& source);

// Prints to stderr, or throws parse_error_t with --error-on-warning.
void parse_warning(pstring_t pstring, std::string const& what, source_t const& source);

#endif
