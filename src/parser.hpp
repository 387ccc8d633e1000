#ifndef PARSER_HPP
#define PARSER_HPP

// Parser overview:
// - Recursive descent over a fixed cascade of precedence layers, loosest first:
//   let, select, where, union, difference, product, table, row, cell,
//   equals, or, and, not, atom.
// - Every rule either matches, returning its value and the position after it,
//   or fails without consuming anything, returning where and why.
//   The caller then tries its next alternative.
// - Once an operator token has matched, the right operand is parsed as far
//   as it will go and is never retried with a shorter split.
//   Repeated operators therefore group to the right.
// - Whitespace and comments ("junk") may appear between any two tokens.
// - Only 'parse()' throws. Rules report failure by value.
// - Recursion is unbounded. Very deeply nested input can exhaust the stack.

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/container/small_vector.hpp>

#include "ast.hpp"
#include "pstring.hpp"
#include "source.hpp"

namespace bc = ::boost::container;

// Either a matched value and the position after it, or a failure.
template<typename T>
struct result_t
{
    using value_type = T;

    std::optional<T> value;
    char const* pos = nullptr;       // One past the match, or where matching failed.
    char const* what = nullptr;      // Why it failed.
    std::string_view expecting = {}; // The token that was required, if any.

    explicit operator bool() const { return value.has_value(); }

    // Passes a failure on as the result of a rule of another type.
    template<typename U>
    result_t<U> failure() const
    {
        passert(!value, "failure() called on a match");
        return { std::nullopt, pos, what, expecting };
    }
};

template<typename T>
result_t<std::decay_t<T>> matched(T&& value, char const* pos)
{
    return { std::forward<T>(value), pos };
}

template<typename T>
result_t<T> failed(char const* pos, char const* what, std::string_view expecting = {})
{
    return { std::nullopt, pos, what, expecting };
}

using junk_result_t = result_t<std::monostate>;

class parser_t
{
public:
    parser_t() = delete;
    explicit parser_t(source_t const& source);

    // Parses the whole buffer as one program.
    // Throws parse_error_t if it can't, or if anything but junk is left over.
    exp_t parse();

    // Where a boolean literal ran straight into identifier characters, as in 'truefoo'.
    // The literal is parsed on its own and the rest is left for the next token.
    // Filled in by a successful 'parse()', in source order.
    // Each span covers the whole run of identifier characters.
    bc::small_vector<pstring_t, 4> const& glued_bools() const { return m_glued_bools; }

    source_t const& source() const { return m_source; }
    char const* begin() const { return m_begin; }
    char const* end() const { return m_end; }

    // The rules. Each one starts matching at 'in', which must lie within the buffer.
    // They're public so that fragments can be parsed on their own.

    result_t<exp_t> parse_program(char const* in);
    result_t<exp_t> parse_let(char const* in);
    result_t<exp_t> parse_select(char const* in);
    result_t<var_list_t> parse_var_list(char const* in);
    result_t<exp_t> parse_where(char const* in);
    result_t<exp_t> parse_union(char const* in);
    result_t<exp_t> parse_difference(char const* in);
    result_t<exp_t> parse_product(char const* in);
    result_t<exp_t> parse_table(char const* in);
    result_t<exp_t> parse_row(char const* in);
    result_t<exp_t> parse_cell(char const* in);
    result_t<exp_t> parse_equals(char const* in);
    result_t<exp_t> parse_or(char const* in);
    result_t<exp_t> parse_and(char const* in);
    result_t<exp_t> parse_not(char const* in);
    result_t<exp_t> parse_atom(char const* in);
    result_t<exp_t> parse_parens(char const* in);

    result_t<bool_t> parse_bool(char const* in) const;
    result_t<int_t> parse_int(char const* in) const;
    result_t<str_t> parse_str(char const* in) const;
    result_t<var_t> parse_var(char const* in) const;

    // Matches zero or more whitespace characters and comments.
    // Fails only on a block comment that is never closed.
    junk_result_t parse_junk(char const* in) const;
    junk_result_t parse_line_comment(char const* in) const;
    junk_result_t parse_block_comment(char const* in) const;

private:
    pstring_t span(char const* from, char const* to) const;

    // Returns the position after 'token', or nullptr if it isn't at 'in'.
    // The empty token always matches.
    char const* match_token(char const* in, std::string_view token) const;

    template<typename Rule>
    auto parse_after(char const* in, std::string_view op, Rule rule);

    template<typename Make, typename Operand, typename Next>
    result_t<exp_t> unary_op(char const* in, Make make, std::string_view op, Operand operand, Next next);

    template<typename Make, typename Left, typename Right, typename Next>
    auto binary_op(char const* in, Make make, Left left, std::string_view op, Right right, Next next);

    template<typename T, typename Tighter, typename Self>
    result_t<exp_t> binary_chain(char const* in, Tighter tighter, std::string_view op, Self self);

    template<typename Make, typename Left, typename Middle, typename Right, typename Next>
    result_t<exp_t> ternary_op(char const* in, Make make, Left left, std::string_view op_left, 
                               Middle middle, std::string_view op_right, Right right, Next next);

    void find_glued_bools(exp_t const& exp);

    source_t const& m_source;
    char const* m_begin;
    char const* m_end;
    bc::small_vector<pstring_t, 4> m_glued_bools;
};

#endif
