#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "prompt/console_input.hpp"
#include "prompt/selection_parser.hpp"

namespace provision {

class Logger;

using OptionList = std::vector<std::string>;

class SelectionPrompt {
  public:
    SelectionPrompt(Logger &logger, const ConsoleIo &console);

    // Throws std::invalid_argument for an empty list or more than 26 options.
    [[nodiscard]] Selection select(
        std::string_view prompt_text, const OptionList &options, std::string_view default_choice, bool allow_multiple);

    [[nodiscard]] std::expected<std::size_t, SelectionError> select_one(
        std::string_view prompt_text, const OptionList &options, std::string_view default_choice);

  private:
    Logger &logger_;
    const ConsoleIo &console_;

    void render(std::string_view prompt_text, const OptionList &options, bool allow_multiple);
    [[nodiscard]] std::string read_answer(std::string_view default_choice);
};

} // namespace provision
