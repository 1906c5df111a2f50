#pragma once

#include <string>
#include <vector>

namespace provision {

struct Command {
    std::string program;
    std::vector<std::string> args;
};

struct CommandResult {
    int exit_code{0};
    std::string output;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

[[nodiscard]] std::string describe(const Command &command);

} // namespace provision
