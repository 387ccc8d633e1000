#include "ast.hpp"

#include <sstream>
#include <type_traits>

#include "format.hpp"

namespace
{
    char const* const kind_names[NUM_EXP_KINDS] =
    {
        "Var",
        "Int",
        "Bool",
        "Str",
        "Let",
        "Select",
        "Where",
        "Union",
        "Difference",
        "Product",
        "Table",
        "Row",
        "Cell",
        "Equals",
        "Or",
        "And",
        "Not",
    };

    void print(std::ostream& o, exp_t const& exp, bool spans);

    void print(std::ostream& o, exp_ptr_t const& ptr, bool spans)
    {
        passert(ptr, "null child");
        print(o, *ptr, spans);
    }

    void print(std::ostream& o, exp_t const& exp, bool spans)
    {
        std::visit([&](auto const& node)
        {
            using T = std::decay_t<decltype(node)>;

            if constexpr(std::is_same_v<T, var_t>)
                o << "Var(" << node.name << ')';
            else if constexpr(std::is_same_v<T, int_t>)
                o << node.value;
            else if constexpr(std::is_same_v<T, bool_t>)
                o << (node.value ? "true" : "false");
            else if constexpr(std::is_same_v<T, str_t>)
                o << quote(node.value);
            else
            {
                o << kind_name(exp.kind()) << '(';

                if constexpr(std::is_same_v<T, let_t>)
                {
                    o << node.var.name << ", ";
                    print(o, node.bound, spans);
                    o << ", ";
                    print(o, node.body, spans);
                }
                else if constexpr(std::is_same_v<T, select_t>)
                {
                    o << '[';
                    for(std::size_t i = 0; i < node.vars.size(); ++i)
                        o << (i ? ", " : "") << node.vars[i].name;
                    o << "], ";
                    print(o, node.from, spans);
                }
                else if constexpr(std::is_same_v<T, where_t>)
                {
                    print(o, node.from, spans);
                    o << ", ";
                    print(o, node.pred, spans);
                }
                else if constexpr(std::is_same_v<T, cell_t>)
                {
                    o << node.key.name << ", ";
                    print(o, node.value, spans);
                }
                else if constexpr(std::is_same_v<T, not_t>)
                    print(o, node.operand, spans);
                else
                {
                    print(o, node.lhs, spans);
                    o << ", ";
                    print(o, node.rhs, spans);
                }

                o << ')';
            }
        }, exp.node);

        if(spans)
            o << '@' << exp.pstring.offset << '+' << exp.pstring.size;
    }
} // end anon namespace

bool operator==(exp_ptr_t const& lhs, exp_ptr_t const& rhs)
{
    if(lhs && rhs)
        return *lhs == *rhs;
    return !lhs && !rhs;
}

char const* kind_name(exp_kind_t kind)
{
    passert(kind < NUM_EXP_KINDS, unsigned(kind));
    return kind_names[kind];
}

unsigned exp_t::num_children() const
{
    switch(kind())
    {
    case EXP_VAR:
    case EXP_INT:
    case EXP_BOOL:
    case EXP_STR:
        return 0;

    case EXP_SELECT:
    case EXP_CELL:
    case EXP_NOT:
        return 1;

    case EXP_LET:
    case EXP_WHERE:
    case EXP_UNION:
    case EXP_DIFFERENCE:
    case EXP_PRODUCT:
    case EXP_TABLE:
    case EXP_ROW:
    case EXP_EQUALS:
    case EXP_OR:
    case EXP_AND:
        return 2;

    default:
        passert(false, unsigned(kind()));
        return 0;
    }
}

void for_each_child(exp_t const& exp, std::function<void(exp_t const&)> const& fn)
{
    std::visit([&](auto const& node)
    {
        using T = std::decay_t<decltype(node)>;

        if constexpr(std::is_same_v<T, let_t>)
        {
            fn(*node.bound);
            fn(*node.body);
        }
        else if constexpr(std::is_same_v<T, select_t>)
            fn(*node.from);
        else if constexpr(std::is_same_v<T, where_t>)
        {
            fn(*node.from);
            fn(*node.pred);
        }
        else if constexpr(std::is_same_v<T, cell_t>)
            fn(*node.value);
        else if constexpr(std::is_same_v<T, not_t>)
            fn(*node.operand);
        else if constexpr(requires { node.lhs; node.rhs; })
        {
            fn(*node.lhs);
            fn(*node.rhs);
        }
    }, exp.node);
}

std::string to_string(exp_t const& exp)
{
    std::ostringstream ss;
    print(ss, exp, false);
    return ss.str();
}

std::string to_string_with_spans(exp_t const& exp)
{
    std::ostringstream ss;
    print(ss, exp, true);
    return ss.str();
}

std::ostream& operator<<(std::ostream& o, exp_t const& exp)
{
    print(o, exp, false);
    return o;
}
