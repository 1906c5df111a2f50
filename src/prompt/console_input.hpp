#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace provision {

// Blocking operator input. Tests swap in scripted functions.
struct ConsoleIo {
    std::function<std::string(std::string_view prompt)> read_line;
    std::function<void()> wait_for_key;
};

// readline-backed input on the controlling terminal. End of input reads as an empty line.
[[nodiscard]] ConsoleIo terminal_console();

} // namespace provision
