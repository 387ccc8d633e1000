#include <catch2/catch.hpp>
#include "options.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

namespace
{
    // Restores the defaults on both ends, so other tests see them.
    struct options_reset_t
    {
        options_reset_t() { _options = {}; }
        ~options_reset_t() { _options = {}; }
    };

    po::variables_map parse_args(std::vector<char const*> args)
    {
        args.insert(args.begin(), "relq");

        po::positional_options_description p;
        p.add("input", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(int(args.size()), args.data()).options(basic_options()).positional(p).run(), vm);
        po::notify(vm);
        return vm;
    }

    void write_file(fs::path const& path, char const* text)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << text;
    }
}

TEST_CASE("option_bool_default", "[options]")
{
    for(char const* str : { "0", "false", "off", "OFF", "False" })
        CHECK(option_bool_default(str, "auto") == 0);

    for(char const* str : { "1", "true", "on", "On", "TRUE" })
        CHECK(option_bool_default(str, "auto") == 1);

    CHECK(option_bool_default("auto", "auto") == -1);
    CHECK(option_bool_default("Auto", "auto") == -1);
    CHECK(option_bool_default("maybe", "auto") == -2);
    CHECK(option_bool_default("", "auto") == -2);
    CHECK(option_bool_default("2", "auto") == -2);
}

TEST_CASE("command line options", "[options]")
{
    options_reset_t const reset;

    handle_options(fs::path(), basic_options(),
                   parse_args({ "a.relq", "-", "-e", "x - y", "-q", "-s", "-W", "--color", "on" }));

    REQUIRE(relq_options().inputs.size() == 3);
    CHECK(relq_options().inputs[0].kind == INPUT_FILE);
    CHECK(relq_options().inputs[0].path() == fs::path("a.relq"));
    CHECK(relq_options().inputs[1].kind == INPUT_STDIN);
    CHECK(relq_options().inputs[2].kind == INPUT_EXPR);
    CHECK(relq_options().inputs[2].text == "x - y");

    CHECK_FALSE(relq_options().print_ast);
    CHECK(relq_options().print_spans);
    CHECK(relq_options().werror);
    CHECK(relq_options().color);
    CHECK_FALSE(relq_options().build_time);
}

TEST_CASE("color option", "[options]")
{
    options_reset_t const reset;

    _options.color = true;
    handle_options(fs::path(), basic_options(), parse_args({ "--color", "off" }));
    CHECK_FALSE(relq_options().color);

    handle_options(fs::path(), basic_options(), parse_args({ "--color", "TRUE" }));
    CHECK(relq_options().color);

    CHECK_NOTHROW(handle_options(fs::path(), basic_options(), parse_args({ "--color", "auto" })));

    CHECK_THROWS_WITH(handle_options(fs::path(), basic_options(), parse_args({ "--color", "sometimes" })),
                      "Unknown color: sometimes");
}

TEST_CASE("configuration files", "[options]")
{
    options_reset_t const reset;

    fs::path const dir = fs::temp_directory_path() / "relq_options_tests";
    fs::remove_all(dir);

    write_file(dir / "outer.cfg",
        "input = first.relq\n"
        "input = sub/inner.cfg\n");
    write_file(dir / "sub" / "inner.cfg",
        "# Paths are relative to this file.\n"
        "input = second.relq\n"
        "expr = y\n");

    handle_options(fs::path(), basic_options(), parse_args({ (dir / "outer.cfg").c_str() }));

    REQUIRE(relq_options().inputs.size() == 3);
    CHECK(relq_options().inputs[0].kind == INPUT_FILE);
    CHECK(relq_options().inputs[0].path() == dir / "first.relq");
    CHECK(relq_options().inputs[1].kind == INPUT_FILE);
    CHECK(relq_options().inputs[1].path() == dir / "sub" / "second.relq");
    CHECK(relq_options().inputs[2].kind == INPUT_EXPR);
    CHECK(relq_options().inputs[2].text == "y");

    // A file that includes itself runs into the nesting limit.
    write_file(dir / "loop.cfg", "input = loop.cfg\n");
    CHECK_THROWS_WITH(handle_options(fs::path(), basic_options(), parse_args({ (dir / "loop.cfg").c_str() })),
                      "Configuration files nested too deeply.");

    CHECK_THROWS_AS(handle_options(fs::path(), basic_options(), parse_args({ (dir / "missing.cfg").c_str() })),
                    std::runtime_error);

    fs::remove_all(dir);
}
