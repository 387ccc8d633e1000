#ifndef CONSOLE_HPP
#define CONSOLE_HPP

// Console colors, as ANSI escape sequences.
#define CONSOLE_RED   "\x1B[31m"
#define CONSOLE_YEL   "\x1B[33m"
#define CONSOLE_CYN   "\x1B[36m"
#define CONSOLE_RESET "\x1B[0m"
#define CONSOLE_BOLD  "\x1B[1m"

// Returns 'code', or an empty string when color output is turned off.
char const* console_color(char const* code);

#endif
