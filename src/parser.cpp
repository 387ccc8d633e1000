#include "parser.hpp"

#include <algorithm>
#include <charconv>
#include <functional>
#include <limits>
#include <stdexcept>

#include "format.hpp"
#include "parse_error.hpp"

namespace
{
    // Compared by address to pick out the specific atom failures.
    constexpr char const* unterminated_string = "Unterminated string literal.";
    constexpr char const* unterminated_comment = "Unterminated block comment.";
    constexpr char const* int_too_large = "Integer literal is too large.";

    constexpr bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }
    constexpr bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
    constexpr bool is_ident_head(char c) { return is_alpha(c) || c == '_'; }
    constexpr bool is_ident_char(char c) { return is_ident_head(c) || is_digit(c); }
} // end anon namespace

parser_t::parser_t(source_t const& source)
: m_source(source)
, m_begin(source.begin())
, m_end(source.end())
{
    if(source.size() > std::numeric_limits<std::uint32_t>::max())
        throw std::runtime_error(fmt("Input is too large: %", source.name()));
}

// Template definitions have to come before anything that uses them!

// Matches junk, then 'op', then junk, then 'rule'.
template<typename Rule>
auto parser_t::parse_after(char const* in, std::string_view op, Rule rule)
{
    using result_type = std::invoke_result_t<Rule, parser_t&, char const*>;
    using value_type = typename result_type::value_type;

    junk_result_t const pre = parse_junk(in);
    if(!pre)
        return pre.failure<value_type>();

    char const* const after_op = match_token(pre.pos, op);
    if(!after_op)
        return failed<value_type>(pre.pos, "Unexpected token.", op);

    junk_result_t const post = parse_junk(after_op);
    if(!post)
        return post.failure<value_type>();

    return result_type(std::invoke(rule, *this, post.pos));
}

// 'op' followed by 'operand', or else whatever 'next' matches.
template<typename Make, typename Operand, typename Next>
result_t<exp_t> parser_t::unary_op(char const* in, Make make, std::string_view op, Operand operand, Next next)
{
    if(char const* const after_op = match_token(in, op))
        if(junk_result_t const post = parse_junk(after_op))
            if(auto arg = std::invoke(operand, *this, post.pos))
                return matched(make(std::move(*arg.value), span(in, arg.pos)), arg.pos);

    return std::invoke(next, *this, in);
}

// 'left' 'op' 'right', or else whatever 'next' matches.
template<typename Make, typename Left, typename Right, typename Next>
auto parser_t::binary_op(char const* in, Make make, Left left, std::string_view op, Right right, Next next)
{
    if(auto lhs = std::invoke(left, *this, in))
        if(auto rhs = parse_after(lhs.pos, op, right))
            return matched(make(std::move(*lhs.value), std::move(*rhs.value), span(in, rhs.pos)), rhs.pos);

    return std::invoke(next, *this, in);
}

// The common case of 'binary_op': 'tighter' 'op' 'self', or else 'tighter'.
// When 'op' or the right operand is missing, the fallback would rematch
// exactly what 'lhs' already holds, so that is returned instead.
template<typename T, typename Tighter, typename Self>
result_t<exp_t> parser_t::binary_chain(char const* in, Tighter tighter, std::string_view op, Self self)
{
    result_t<exp_t> lhs = std::invoke(tighter, *this, in);
    if(!lhs)
        return lhs;

    if(auto rhs = parse_after(lhs.pos, op, self))
        return matched(exp_t{ T{ box(std::move(*lhs.value)), box(std::move(*rhs.value)) }, span(in, rhs.pos) }, rhs.pos);

    return lhs;
}

// 'left' 'op_left' 'middle' 'op_right' 'right', or else whatever 'next' matches.
template<typename Make, typename Left, typename Middle, typename Right, typename Next>
result_t<exp_t> parser_t::ternary_op(char const* in, Make make, Left left, std::string_view op_left, 
                                     Middle middle, std::string_view op_right, Right right, Next next)
{
    if(auto l = std::invoke(left, *this, in))
        if(auto m = parse_after(l.pos, op_left, middle))
            if(auto r = parse_after(m.pos, op_right, right))
                return matched(make(std::move(*l.value), std::move(*m.value), std::move(*r.value), span(in, r.pos)), r.pos);

    return std::invoke(next, *this, in);
}

exp_t parser_t::parse()
{
    result_t<exp_t> result = parse_program(m_begin);

    pstring_t const at = span(result.pos, result.pos + (result.pos != m_end));

    if(!result)
    {
        if(result.expecting.empty())
            parse_error(at, result.what, m_source);
        parse_error(at, fmt("% Expecting '%'.", result.what, result.expecting), m_source);
    }

    if(result.pos != m_end)
        parse_error(at, "Unexpected input after expression.", m_source);

    m_glued_bools.clear();
    find_glued_bools(*result.value);

    return std::move(*result.value);
}

pstring_t parser_t::span(char const* from, char const* to) const
{
    passert(m_begin <= from && from <= to && to <= m_end, from - m_begin, to - m_begin);
    return { std::uint32_t(from - m_begin), std::uint32_t(to - from) };
}

char const* parser_t::match_token(char const* in, std::string_view token) const
{
    if(std::size_t(m_end - in) < token.size() || std::string_view(in, token.size()) != token)
        return nullptr;
    return in + token.size();
}

void parser_t::find_glued_bools(exp_t const& exp)
{
    // Only a bare literal. In parentheses its span ends at the ')'.
    if(exp.kind() == EXP_BOOL && exp.pstring.size == (exp.get<bool_t>()->value ? 4 : 5))
    {
        char const* const literal_end = m_begin + exp.pstring.end();
        char const* glued = literal_end;
        while(glued != m_end && is_ident_char(*glued))
            ++glued;
        if(glued != literal_end)
            m_glued_bools.push_back(span(m_begin + exp.pstring.offset, glued));
    }

    for_each_child(exp, [this](exp_t const& child) { find_glued_bools(child); });
}

////////////////
// Precedence //
////////////////

result_t<exp_t> parser_t::parse_program(char const* in)
{
    junk_result_t const lead = parse_junk(in);
    if(!lead)
        return lead.failure<exp_t>();

    result_t<exp_t> result = parse_let(lead.pos);
    if(!result)
        return result;

    junk_result_t const trail = parse_junk(result.pos);
    if(!trail)
        return trail.failure<exp_t>();

    result.pos = trail.pos;
    return result;
}

// The body follows the bound expression with no separator.
// Where one ends and the other begins is decided by how far the bound expression extends.
result_t<exp_t> parser_t::parse_let(char const* in)
{
    return ternary_op(in, 
        [](var_t var, exp_t bound, exp_t body, pstring_t pstring)
        {
            return exp_t{ let_t{ std::move(var), box(std::move(bound)), box(std::move(body)) }, pstring };
        },
        &parser_t::parse_var, "=", &parser_t::parse_let, "", &parser_t::parse_let,
        &parser_t::parse_select);
}

result_t<exp_t> parser_t::parse_select(char const* in)
{
    return binary_op(in, 
        [](var_list_t vars, exp_t from, pstring_t pstring)
        {
            return exp_t{ select_t{ std::move(vars), box(std::move(from)) }, pstring };
        },
        &parser_t::parse_var_list, "<-", &parser_t::parse_select, 
        &parser_t::parse_where);
}

result_t<var_list_t> parser_t::parse_var_list(char const* in)
{
    return binary_op(in, 
        [](var_t var, var_list_t vars, pstring_t)
        {
            vars.insert(vars.begin(), std::move(var));
            return vars;
        },
        &parser_t::parse_var, ",", &parser_t::parse_var_list,
        [](parser_t& parser, char const* at) -> result_t<var_list_t>
        {
            result_t<var_t> var = parser.parse_var(at);
            if(!var)
                return var.failure<var_list_t>();
            return matched(var_list_t{ std::move(*var.value) }, var.pos);
        });
}

result_t<exp_t> parser_t::parse_where(char const* in)
{
    return binary_chain<where_t>(in, &parser_t::parse_union, "?", &parser_t::parse_where);
}

result_t<exp_t> parser_t::parse_union(char const* in)
{
    return binary_chain<union_t>(in, &parser_t::parse_difference, "+", &parser_t::parse_union);
}

result_t<exp_t> parser_t::parse_difference(char const* in)
{
    return binary_chain<difference_t>(in, &parser_t::parse_product, "-", &parser_t::parse_difference);
}

result_t<exp_t> parser_t::parse_product(char const* in)
{
    return binary_chain<product_t>(in, &parser_t::parse_table, "*", &parser_t::parse_product);
}

result_t<exp_t> parser_t::parse_table(char const* in)
{
    return binary_chain<table_t>(in, &parser_t::parse_row, ";", &parser_t::parse_table);
}

result_t<exp_t> parser_t::parse_row(char const* in)
{
    return binary_chain<row_t>(in, &parser_t::parse_cell, ",", &parser_t::parse_row);
}

result_t<exp_t> parser_t::parse_cell(char const* in)
{
    return binary_op(in, 
        [](var_t key, exp_t value, pstring_t pstring)
        {
            return exp_t{ cell_t{ std::move(key), box(std::move(value)) }, pstring };
        },
        &parser_t::parse_var, ":", &parser_t::parse_cell, 
        &parser_t::parse_equals);
}

result_t<exp_t> parser_t::parse_equals(char const* in)
{
    return binary_chain<equals_t>(in, &parser_t::parse_or, "==", &parser_t::parse_equals);
}

result_t<exp_t> parser_t::parse_or(char const* in)
{
    return binary_chain<or_t>(in, &parser_t::parse_and, "|", &parser_t::parse_or);
}

result_t<exp_t> parser_t::parse_and(char const* in)
{
    return binary_chain<and_t>(in, &parser_t::parse_not, "&", &parser_t::parse_and);
}

result_t<exp_t> parser_t::parse_not(char const* in)
{
    return unary_op(in, 
        [](exp_t operand, pstring_t pstring)
        {
            return exp_t{ not_t{ box(std::move(operand)) }, pstring };
        },
        "!", &parser_t::parse_not, &parser_t::parse_atom);
}

result_t<exp_t> parser_t::parse_atom(char const* in)
{
    auto const leaf = [&](auto result) -> result_t<exp_t>
    {
        return matched(exp_t{ std::move(*result.value), span(in, result.pos) }, result.pos);
    };

    if(result_t<exp_t> parens = parse_parens(in))
        return parens;

    if(result_t<bool_t> boolean = parse_bool(in))
        return leaf(std::move(boolean));

    result_t<int_t> integer = parse_int(in);
    if(integer)
        return leaf(std::move(integer));

    result_t<str_t> string = parse_str(in);
    if(string)
        return leaf(std::move(string));

    if(result_t<var_t> var = parse_var(in))
        return leaf(std::move(var));

    if(string.what == unterminated_string)
        return string.failure<exp_t>();

    if(integer.what == int_too_large)
        return integer.failure<exp_t>();

    return failed<exp_t>(in, "Unexpected token. Expecting expression.");
}

// The whole program grammar is allowed between the parentheses.
result_t<exp_t> parser_t::parse_parens(char const* in)
{
    char const* const open = match_token(in, "(");
    if(!open)
        return failed<exp_t>(in, "Unexpected token.", "(");

    result_t<exp_t> result = parse_program(open);
    if(!result)
        return result;

    char const* const close = match_token(result.pos, ")");
    if(!close)
        return failed<exp_t>(result.pos, "Unexpected token.", ")");

    result.value->pstring = span(in, close);
    result.pos = close;
    return result;
}

//////////////
// Literals //
//////////////

// Only the spelling is checked. 'truefoo' matches 'true' and leaves 'foo'.
result_t<bool_t> parser_t::parse_bool(char const* in) const
{
    for(bool const value : { true, false })
    {
        if(char const* const next = match_token(in, value ? "true" : "false"))
            return matched(bool_t{ value }, next);
    }

    return failed<bool_t>(in, "Unexpected token. Expecting boolean literal.");
}

result_t<int_t> parser_t::parse_int(char const* in) const
{
    char const* it = in;
    if(it != m_end && *it == '-')
        ++it;

    char const* const digits = it;
    while(it != m_end && is_digit(*it))
        ++it;

    if(it == digits)
        return failed<int_t>(in, "Unexpected token. Expecting integer literal.");

    std::int64_t value = 0;
    std::from_chars_result const result = std::from_chars(in, it, value);
    if(result.ec != std::errc())
        return failed<int_t>(in, int_too_large);
    passert(result.ptr == it, result.ptr - in, it - in);

    return matched(int_t{ value }, it);
}

// No escape sequences. A string literal can't hold a quote.
result_t<str_t> parser_t::parse_str(char const* in) const
{
    char const* const open = match_token(in, "'");
    if(!open)
        return failed<str_t>(in, "Unexpected token. Expecting string literal.");

    char const* const close = std::find(open, m_end, '\'');
    if(close == m_end)
        return failed<str_t>(in, unterminated_string);

    return matched(str_t{ std::string(open, close) }, close + 1);
}

result_t<var_t> parser_t::parse_var(char const* in) const
{
    if(in == m_end || !is_ident_head(*in))
        return failed<var_t>(in, "Unexpected token. Expecting identifier.");

    char const* it = in + 1;
    while(it != m_end && is_ident_char(*it))
        ++it;

    return matched(var_t{ std::string(in, it) }, it);
}

//////////
// Junk //
//////////

junk_result_t parser_t::parse_junk(char const* in) const
{
    while(in != m_end)
    {
        if(is_space(*in))
            ++in;
        else if(junk_result_t const line = parse_line_comment(in))
            in = line.pos;
        else if(junk_result_t const block = parse_block_comment(in))
            in = block.pos;
        else if(block.what == unterminated_comment)
            return block;
        else
            break;
    }

    return matched(std::monostate{}, in);
}

// Runs up to, but not including, the end of the line.
// The text after "--" can't be empty, so a bare "--" is no comment.
junk_result_t parser_t::parse_line_comment(char const* in) const
{
    char const* const open = match_token(in, "--");
    if(!open)
        return failed<std::monostate>(in, "Unexpected token.", "--");

    char const* it = open;
    while(it != m_end && *it != '\n')
        ++it;

    if(it == open)
        return failed<std::monostate>(in, "Unexpected token. Expecting comment text.");

    return matched(std::monostate{}, it);
}

// Block comments don't nest. The first "*/" closes it.
junk_result_t parser_t::parse_block_comment(char const* in) const
{
    char const* const open = match_token(in, "/*");
    if(!open)
        return failed<std::monostate>(in, "Unexpected token.", "/*");

    std::string_view const rest(open, m_end - open);
    std::size_t const close = rest.find("*/");
    if(close == std::string_view::npos)
        return failed<std::monostate>(in, unterminated_comment);

    return matched(std::monostate{}, open + close + 2);
}
