#include "core/command.hpp"

namespace provision {

std::string describe(const Command &command) {
    std::string text = command.program;

    for (const auto &arg : command.args) {
        text += ' ';
        if (arg.find(' ') != std::string::npos) {
            text += '"' + arg + '"';
        } else {
            text += arg;
        }
    }

    return text;
}

} // namespace provision
