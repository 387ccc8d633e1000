#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Driver options.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace fs = ::std::filesystem;
namespace po = ::boost::program_options;

enum input_kind_t
{
    INPUT_FILE,
    INPUT_STDIN,
    INPUT_EXPR,
};

struct input_t
{
    input_kind_t kind;
    fs::path file; // Relative to 'dir'. Only for INPUT_FILE.
    fs::path dir;
    std::string text; // Only for INPUT_EXPR.

    fs::path path() const { return dir / file; }
};

struct options_t
{
    bool print_ast = true;
    bool print_spans = false;
    bool build_time = false;
    bool werror = false;
    bool color = false;

    std::vector<input_t> inputs;
};

extern options_t _options;
inline options_t const& relq_options() { return _options; }

// The options that can also appear in a '.cfg' file.
po::options_description basic_options();

// Returns 0 or 1 for booleans, -1 for 'default_val', and -2 for anything else.
int option_bool_default(std::string view, std::string_view default_val);

// Adds what 'vm' holds to '_options'.
// '.cfg' inputs are read relative to 'dir' and handled recursively.
void handle_options(fs::path dir, po::options_description const& cfg_desc, po::variables_map const& vm, int depth = 0);

#endif
