#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <unistd.h>

#include "format.hpp"

options_t _options;

namespace
{
    std::string to_lower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return str;
    }
} // end anon namespace

po::options_description basic_options()
{
    po::options_description basic("Options");
    basic.add_options()
        ("input,i", po::value<std::vector<std::string>>()->multitoken(), "input file ('-' for stdin, '.cfg' for a configuration file)")
        ("expr,e", po::value<std::vector<std::string>>(), "parse the given text")
        ("quiet,q", "check only; don't print the tree")
        ("spans,s", "print the source span of every node")
        ("error-on-warning,W", "turn warnings into errors")
        ("build-time,B", "print parse times")
        ("color", po::value<std::string>(), "color diagnostics (on, off, auto)")
    ;
    return basic;
}

int option_bool_default(std::string view, std::string_view const default_val)
{
    using namespace std::literals;
    view = to_lower(std::move(view));

    if(view == "0"sv || view == "false"sv || view == "off"sv)
        return 0;

    if(view == "1"sv || view == "true"sv || view == "on"sv)
        return 1;

    if(view == default_val)
        return -1;

    return -2;
}

void handle_options(fs::path dir, po::options_description const& cfg_desc, po::variables_map const& vm, int depth)
{
    using namespace std::literals;

    if(depth > 16)
        throw std::runtime_error("Configuration files nested too deeply.");

    if(vm.count("input"))
    {
        for(std::string const& name : vm["input"].as<std::vector<std::string>>())
        {
            if(name == "-"sv)
            {
                _options.inputs.push_back({ .kind = INPUT_STDIN, .file = "<stdin>" });
                continue;
            }

            fs::path const path = fs::path(name);

            if(path.extension() == ".cfg")
            {
                fs::path const full_path = dir / path;
                std::ifstream ifs(full_path.string(), std::ios::in);
                if(!ifs)
                    throw std::runtime_error(fmt("Unable to open configuration file: %", name));

                fs::path cfg_dir = full_path;
                cfg_dir.remove_filename();

                po::variables_map cfg_vm;
                po::store(po::parse_config_file(ifs, cfg_desc), cfg_vm);
                po::notify(cfg_vm);

                handle_options(cfg_dir, cfg_desc, cfg_vm, depth + 1);
            }
            else
                _options.inputs.push_back({ .kind = INPUT_FILE, .file = path, .dir = dir });
        }
    }

    if(vm.count("expr"))
        for(std::string const& text : vm["expr"].as<std::vector<std::string>>())
            _options.inputs.push_back({ .kind = INPUT_EXPR, .file = "<expr>", .text = text });

    if(vm.count("quiet"))
        _options.print_ast = false;

    if(vm.count("spans"))
        _options.print_spans = true;

    if(vm.count("build-time"))
        _options.build_time = true;

    if(vm.count("error-on-warning"))
        _options.werror = true;

    if(vm.count("color"))
    {
        std::string const str = vm["color"].as<std::string>();

        switch(option_bool_default(str, "auto"sv))
        {
        default:
            throw std::runtime_error(fmt("Unknown color: %", str));
        case -1:
            _options.color = isatty(STDERR_FILENO);
            break;
        case 0:
            _options.color = false;
            break;
        case 1:
            _options.color = true;
            break;
        }
    }
}
