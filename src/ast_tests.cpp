#include <catch2/catch.hpp>
#include "ast.hpp"

#include <string_view>

#include "parser.hpp"
#include "source.hpp"

namespace
{
    exp_t parse(std::string_view text)
    {
        source_t const source("test", text);
        parser_t parser(source);
        return parser.parse();
    }
}

TEST_CASE("equality ignores spans", "[ast]")
{
    exp_t const a = parse("x - y");
    exp_t const b = parse("  x\n-\n\n  y  -- trailing");
    REQUIRE(a == b);
    CHECK(a.pstring != b.pstring);

    CHECK(parse("(x)") == parse("x"));
    CHECK(parse("x = 1 x") == parse("x=1x"));

    CHECK(parse("x - y") != parse("x + y"));
    CHECK(parse("x - y") != parse("y - x"));
    CHECK(parse("x") != parse("'x'"));
    CHECK(parse("1") != parse("2"));
    CHECK(parse("true") != parse("false"));
    CHECK(parse("a, b <- t") != parse("a <- t"));
    CHECK(parse("k: 1") != parse("j: 1"));
    CHECK(parse("x = 1 x") != parse("y = 1 y"));
}

TEST_CASE("to_string", "[ast]")
{
    exp_t const exp = parse(
        "Staff = name: 'Alice', id: 1; name: 'Bob', id: 2\n"
        "bob = name <- Staff ? name == 'Bob'\n"
        "bob\n");

    CHECK(to_string(exp) == 
        "Let(Staff, Table(Row(Cell(name, 'Alice'), Cell(id, 1)), Row(Cell(name, 'Bob'), Cell(id, 2))), "
        "Let(bob, Select([name], Where(Var(Staff), Equals(Var(name), 'Bob'))), Var(bob)))");

    CHECK(to_string(parse("a, b, c <- t")) == "Select([a, b, c], Var(t))");
    CHECK(to_string(parse("!(x | y) & -3")) == "And(Not(Or(Var(x), Var(y))), -3)");
    CHECK(to_string(parse("a + b - c * d")) == "Union(Var(a), Difference(Var(b), Product(Var(c), Var(d))))");
    CHECK(to_string(parse("''")) == "''");
    CHECK(to_string(parse("true")) == "true");
}

TEST_CASE("spans", "[ast]")
{
    CHECK(parse("  x  ").pstring == pstring_t{ 2, 1 });
    CHECK(parse("(a)").pstring == pstring_t{ 0, 3 });
    CHECK(parse("!x").pstring == pstring_t{ 0, 2 });
    CHECK(parse("k: 1").pstring == pstring_t{ 0, 4 });
    CHECK(parse("a, b <- t").pstring == pstring_t{ 0, 9 });
    CHECK(parse("x = 1 y").pstring == pstring_t{ 0, 7 });
    CHECK(parse("'hi'").pstring == pstring_t{ 0, 4 });

    exp_t const diff = parse("a - b");
    CHECK(diff.pstring == pstring_t{ 0, 5 });
    auto const* node = diff.get<difference_t>();
    REQUIRE(node);
    CHECK(node->lhs->pstring == pstring_t{ 0, 1 });
    CHECK(node->rhs->pstring == pstring_t{ 4, 1 });

    CHECK(to_string_with_spans(parse("a-b")) == "Difference(Var(a)@0+1, Var(b)@2+1)@0+3");
    CHECK(to_string_with_spans(parse("(a)")) == "Var(a)@0+3");
}

TEST_CASE("kind and children", "[ast]")
{
    struct kind_case_t
    {
        char const* text;
        exp_kind_t kind;
        char const* name;
        unsigned children;
    };

    for(kind_case_t const& c : 
    {
        kind_case_t{ "x", EXP_VAR, "Var", 0 },
        kind_case_t{ "1", EXP_INT, "Int", 0 },
        kind_case_t{ "true", EXP_BOOL, "Bool", 0 },
        kind_case_t{ "'s'", EXP_STR, "Str", 0 },
        kind_case_t{ "x = 1 x", EXP_LET, "Let", 2 },
        kind_case_t{ "x <- t", EXP_SELECT, "Select", 1 },
        kind_case_t{ "t ? p", EXP_WHERE, "Where", 2 },
        kind_case_t{ "a + b", EXP_UNION, "Union", 2 },
        kind_case_t{ "a - b", EXP_DIFFERENCE, "Difference", 2 },
        kind_case_t{ "a * b", EXP_PRODUCT, "Product", 2 },
        kind_case_t{ "a; b", EXP_TABLE, "Table", 2 },
        kind_case_t{ "a, b", EXP_ROW, "Row", 2 },
        kind_case_t{ "k: v", EXP_CELL, "Cell", 1 },
        kind_case_t{ "a == b", EXP_EQUALS, "Equals", 2 },
        kind_case_t{ "a | b", EXP_OR, "Or", 2 },
        kind_case_t{ "a & b", EXP_AND, "And", 2 },
        kind_case_t{ "!a", EXP_NOT, "Not", 1 },
    })
    {
        INFO("input = " << c.text);
        exp_t const exp = parse(c.text);
        CHECK(exp.kind() == c.kind);
        CHECK(std::string_view(kind_name(exp.kind())) == c.name);
        CHECK(exp.num_children() == c.children);
    }
}

TEST_CASE("box", "[ast]")
{
    exp_ptr_t const a = box(exp_t{ var_t{ "x" } });
    exp_ptr_t const b = box(exp_t{ var_t{ "x" }, pstring_t{ 5, 1 } });
    exp_ptr_t const null;

    CHECK(a == b);
    CHECK_FALSE(a == null);
    CHECK(null == exp_ptr_t());
    CHECK(a->get<var_t>()->name == "x");
    CHECK(a->get<int_t>() == nullptr);
}
