#ifndef AST_HPP
#define AST_HPP

// The expression tree built by the parser.
// Nodes are created once while parsing and never modified afterwards.
// Every node owns its children; nothing is shared.

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <variant>

#include <boost/container/small_vector.hpp>

#include "pstring.hpp"

namespace bc = ::boost::container;

struct exp_t;
using exp_ptr_t = std::unique_ptr<exp_t const>;

// Deep comparison. Two null pointers are equal.
bool operator==(exp_ptr_t const& lhs, exp_ptr_t const& rhs);

// Order matches the alternatives of 'exp_t::node_type'.
enum exp_kind_t : unsigned char
{
    EXP_VAR,
    EXP_INT,
    EXP_BOOL,
    EXP_STR,
    EXP_LET,
    EXP_SELECT,
    EXP_WHERE,
    EXP_UNION,
    EXP_DIFFERENCE,
    EXP_PRODUCT,
    EXP_TABLE,
    EXP_ROW,
    EXP_CELL,
    EXP_EQUALS,
    EXP_OR,
    EXP_AND,
    EXP_NOT,
    NUM_EXP_KINDS,
};

char const* kind_name(exp_kind_t kind);

struct var_t
{
    std::string name;
    bool operator==(var_t const&) const = default;
};

struct int_t
{
    std::int64_t value;
    bool operator==(int_t const&) const = default;
};

struct bool_t
{
    bool value;
    bool operator==(bool_t const&) const = default;
};

// No escapes; the text between the quotes, verbatim.
struct str_t
{
    std::string value;
    bool operator==(str_t const&) const = default;
};

using var_list_t = bc::small_vector<var_t, 4>;

// Binds 'bound' to 'var', then continues as 'body'.
struct let_t
{
    var_t var;
    exp_ptr_t bound;
    exp_ptr_t body;
    bool operator==(let_t const&) const = default;
};

// Projects 'from' onto 'vars', in source order. Never empty.
struct select_t
{
    var_list_t vars;
    exp_ptr_t from;
    bool operator==(select_t const&) const = default;
};

struct where_t
{
    exp_ptr_t from;
    exp_ptr_t pred;
    bool operator==(where_t const&) const = default;
};

// The operators that only differ by name.
template<exp_kind_t Kind>
struct binary_t
{
    static constexpr exp_kind_t kind = Kind;

    exp_ptr_t lhs;
    exp_ptr_t rhs;
    bool operator==(binary_t const&) const = default;
};

using union_t      = binary_t<EXP_UNION>;
using difference_t = binary_t<EXP_DIFFERENCE>;
using product_t    = binary_t<EXP_PRODUCT>;
using table_t      = binary_t<EXP_TABLE>;
using row_t        = binary_t<EXP_ROW>;
using equals_t     = binary_t<EXP_EQUALS>;
using or_t         = binary_t<EXP_OR>;
using and_t        = binary_t<EXP_AND>;

struct cell_t
{
    var_t key;
    exp_ptr_t value;
    bool operator==(cell_t const&) const = default;
};

struct not_t
{
    exp_ptr_t operand;
    bool operator==(not_t const&) const = default;
};

struct exp_t
{
    using node_type = std::variant<
        var_t, int_t, bool_t, str_t, let_t, select_t, where_t, 
        union_t, difference_t, product_t, table_t, row_t, cell_t,
        equals_t, or_t, and_t, not_t>;

    static_assert(std::variant_size_v<node_type> == NUM_EXP_KINDS);

    node_type node;
    pstring_t pstring = {}; // Where it came from. Ignored by comparisons.

    exp_kind_t kind() const { return exp_kind_t(node.index()); }

    template<typename T>
    T const* get() const { return std::get_if<T>(&node); }

    unsigned num_children() const;

    bool operator==(exp_t const& o) const { return node == o.node; }
};

// Calls 'fn' on each direct sub-expression, in source order.
void for_each_child(exp_t const& exp, std::function<void(exp_t const&)> const& fn);

template<typename T>
exp_ptr_t box(T&& t) { return std::make_unique<exp_t const>(std::forward<T>(t)); }

// Renders the tree on a single line, e.g. "Cell(name, 'Alice')".
// Used for debugging and by the driver.
std::string to_string(exp_t const& exp);

// Like 'to_string', but every node is followed by its span as "@offset+size".
std::string to_string_with_spans(exp_t const& exp);

std::ostream& operator<<(std::ostream& o, exp_t const& exp);

#endif
