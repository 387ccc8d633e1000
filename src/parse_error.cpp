#include "parse_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "options.hpp"

namespace
{
    char const* get_line_begin(char const* src, pstring_t pstring)
    {
        while(pstring.offset && (src[pstring.offset] == '\n' || src[pstring.offset] == '\r'))
            --pstring.offset;

        for(std::size_t i = pstring.offset;;--i)
        {
            if(src[i] == '\n' || src[i] == '\r')
                return src + std::min<std::size_t>(pstring.offset, i+1);
            if(i == 0)
                return src;
        }
    }

    char const* get_line_end(char const* src, pstring_t pstring)
    {
        auto const is_nl = [](char c) { return c == '\n' || c == '\r' || c == '\0'; };

        while(pstring.offset && is_nl(src[pstring.offset]))
            --pstring.offset;

        for(std::size_t i = pstring.offset;; ++i)
            if(is_nl(src[i]))
                return src + i;
    }
} // end anon namespace

char const* console_color(char const* code)
{
    return relq_options().color ? code : "";
}

line_col_t get_line_col(char const* src, pstring_t pstring)
{
    line_col_t ret = { 1, 1 };

    for(std::size_t i = 0; i < pstring.offset; ++i)
    {
        if(src[i] == '\n')
        {
            if(src[i+1] == '\r')
                ++i;
            goto newline;
        }
        else if(src[i] == '\r')
        {
            if(src[i+1] == '\n')
                ++i;
        newline:
            ++ret.line;
            ret.col = 1;
        }
        else
            ++ret.col;
    }

    return ret;
}

std::string fmt_source_pos(source_t const& source, pstring_t pstring)
{
    line_col_t const line_col = get_line_col(source.source(), pstring);
    return fmt("%%:%:%%", console_color(CONSOLE_BOLD), source.name(), line_col.line, line_col.col, 
               console_color(CONSOLE_RESET));
}

std::string fmt_error(pstring_t pstring, std::string const& what, source_t const& source,
                      char const* color, char const* prefix)
{
    passert(pstring.end() <= source.size(), pstring.end(), source.size());

    char const* const src = source.source();

    std::string str(fmt("%: %%%:% %\n", fmt_source_pos(source, pstring), 
                        console_color(color), console_color(CONSOLE_BOLD), prefix, 
                        console_color(CONSOLE_RESET), what));

    char const* line_begin = get_line_begin(src, pstring);
    char const* line_end = get_line_end(src, pstring);
    if(line_end <= line_begin)
        line_end = line_begin;

    std::string pre = fmt(" % | ", get_line_col(src, pstring).line);

    str += pre;
    str.insert(str.end(), line_begin, line_end);
    str.push_back('\n');

    // Errors at a line ending or at the end of input point just past the text.
    unsigned const caret_position = 
        pre.size() + std::min(src + pstring.offset, line_end) - line_begin;

    str.resize(str.size() + caret_position, ' ');

    str += console_color(color);

    // Don't underline past the line.
    std::size_t underline = std::min<std::size_t>(pstring.size, line_end - std::min(src + pstring.offset, line_end));

    // Remove trailing whitespace
    while(underline > 1 && std::isspace(static_cast<unsigned char>(src[pstring.offset + underline - 1])))
        --underline;

    unsigned i = 0;
    do
        str.push_back('^');
    while(++i < underline);

    str += console_color(CONSOLE_RESET);

    str.push_back('\n');
    return str;
}

std::string fmt_note(std::string const& what)
{
    return fmt("%%note: %%\n", console_color(CONSOLE_BOLD), console_color(CONSOLE_CYN), 
               console_color(CONSOLE_RESET), what);
}

std::string fmt_warning(pstring_t pstring, std::string const& what, source_t const& source)
{
    return fmt_error(pstring, what, source, CONSOLE_YEL, "warning");
}

std::string fmt_error(std::string const& what)
{
    return fmt("%%error: %%\n", console_color(CONSOLE_BOLD), console_color(CONSOLE_RED), 
               console_color(CONSOLE_RESET), what);
}

void parse_error(pstring_t pstring, std::string const& what, source_t const& source)
{
    throw parse_error_t(fmt_error(pstring, what, source), pstring, 
                        get_line_col(source.source(), pstring), what);
}

void parse_warning(pstring_t pstring, std::string const& what, source_t const& source)
{
    std::string msg = fmt_warning(pstring, what, source);

    if(relq_options().werror)
    {
        msg += fmt_note("This is an error because --error-on-warning is enabled.");
        throw parse_error_t(msg, pstring, get_line_col(source.source(), pstring), what);
    }
    else
    {
        std::fputs(msg.c_str(), stderr);
        std::fflush(stderr);
    }
}
