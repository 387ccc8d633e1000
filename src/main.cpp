#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

#include <boost/program_options.hpp>

#include "ast.hpp"
#include "format.hpp"
#include "options.hpp"
#include "parse_error.hpp"
#include "parser.hpp"
#include "source.hpp"

#ifndef RELQ_VERSION
#define RELQ_VERSION "unknown"
#endif

namespace
{
    source_t load(input_t const& input)
    {
        switch(input.kind)
        {
        case INPUT_STDIN:
            return source_t::from_stream(input.file.string(), std::cin);
        case INPUT_EXPR:
            return source_t(input.file.string(), input.text);
        default:
            return source_t::from_file(input.path());
        }
    }

    void report_glued_bools(parser_t const& parser)
    {
        for(pstring_t const pstring : parser.glued_bools())
        {
            std::string_view const ident = pstring.view(parser.source().source());
            std::string_view const literal = ident.substr(0, ident.front() == 't' ? 4 : 5);
            parse_warning(pstring, fmt("'%' is read as the literal '%' followed by '%', not as one identifier.",
                                       ident, literal, ident.substr(literal.size())), parser.source());
        }
    }
} // end anon namespace

int main(int argc, char** argv)
{
    auto entry_time = std::chrono::steady_clock::now();

    try
    {
        /////////////////////////////
        // Handle program options: //
        /////////////////////////////
        {
            po::options_description cmdline("Instructional Flags");
            cmdline.add_options()
                ("help,h", "produce help message")
                ("version,v", "version")
            ;

            po::options_description const basic = basic_options();

            po::options_description cmdline_full;
            cmdline_full.add(cmdline).add(basic);

            po::positional_options_description p;
            p.add("input", -1);

            po::variables_map vm;        
            po::store(po::command_line_parser(argc, argv).options(cmdline_full).positional(p).run(), vm);
            po::notify(vm);

            if(vm.count("help")) 
            {
                std::cout << "Usage: relq [options] [input...]\n";
                std::cout << cmdline_full << std::endl;
                return EXIT_SUCCESS;
            }

            if(vm.count("version")) 
            {
                std::cout << "relq " << RELQ_VERSION << " (" << __DATE__ << ")\n";
                return EXIT_SUCCESS;
            }

            _options.color = isatty(STDERR_FILENO);

            handle_options(fs::path(), basic, vm);

            if(relq_options().inputs.empty())
                throw std::runtime_error("No input files.");
        }

        ////////////////////////////////////
        // OK! Now to do the actual work: //
        ////////////////////////////////////

        for(input_t const& input : relq_options().inputs)
        {
            auto const time = std::chrono::steady_clock::now();

            source_t const source = load(input);
            parser_t parser(source);
            exp_t const exp = parser.parse();

            if(relq_options().build_time)
            {
                auto const now = std::chrono::steady_clock::now();
                long long const ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - time).count();
                std::printf("time parse %s %8lli ms\n", source.name().c_str(), ms);
            }

            report_glued_bools(parser);

            if(!relq_options().print_ast)
                continue;

            if(relq_options().print_spans)
                std::cout << to_string_with_spans(exp) << std::endl;
            else
                std::cout << exp << std::endl;
        }
    }
    catch(parse_error_t const& e)
    {
        std::fputs(e.what(), stderr);
        return EXIT_FAILURE;
    }
    catch(std::exception const& e)
    {
        std::fputs(fmt_error(e.what()).c_str(), stderr);
        return EXIT_FAILURE;
    }

    if(relq_options().build_time)
    {
        auto const now = std::chrono::steady_clock::now();
        long long const ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry_time).count();
        std::printf("time total %8lli ms\n", ms);
    }

    return EXIT_SUCCESS;
}
