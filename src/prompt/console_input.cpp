#include "prompt/console_input.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#include <readline/readline.h>
#include <unistd.h>

namespace provision {

namespace {

std::string read_terminal_line(std::string_view prompt) {
    const std::string prompt_text(prompt);
    char *line = readline(prompt_text.c_str());
    if (line == nullptr) {
        return {};
    }

    std::string input(line);
    std::free(line);
    return input;
}

void wait_for_terminal_key() {
    if (isatty(STDIN_FILENO) == 0) {
        return;
    }

    rl_prep_terminal(0);
    (void)rl_read_key();
    rl_deprep_terminal();
}

} // namespace

ConsoleIo terminal_console() {
    rl_instream = stdin;
    rl_outstream = stdout;

    return ConsoleIo{
        .read_line = &read_terminal_line,
        .wait_for_key = &wait_for_terminal_key,
    };
}

} // namespace provision
