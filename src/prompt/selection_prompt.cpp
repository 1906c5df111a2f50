#include "prompt/selection_prompt.hpp"

#include <format>

#include "logging/logger.hpp"

namespace provision {

SelectionPrompt::SelectionPrompt(Logger &logger, const ConsoleIo &console) : logger_(logger), console_(console) {}

Selection SelectionPrompt::select(
    std::string_view prompt_text, const OptionList &options, std::string_view default_choice, bool allow_multiple) {
    const SelectionParser parser(options.size());

    render(prompt_text, options, allow_multiple);
    const std::string answer = read_answer(default_choice);

    Selection selection;
    if (allow_multiple) {
        selection = parser.parse_multiple(answer);
    } else {
        selection = parser.parse_single(answer).transform([](std::size_t index) {
            return std::vector<std::size_t>{index};
        });
    }

    if (!selection.has_value()) {
        logger_.error(selection.error().message);
    }

    return selection;
}

std::expected<std::size_t, SelectionError> SelectionPrompt::select_one(
    std::string_view prompt_text, const OptionList &options, std::string_view default_choice) {
    return select(prompt_text, options, default_choice, false).transform([](const std::vector<std::size_t> &indices) {
        return indices.front();
    });
}

void SelectionPrompt::render(std::string_view prompt_text, const OptionList &options, bool allow_multiple) {
    logger_.prompt(prompt_text);

    for (std::size_t i = 0; i < options.size(); ++i) {
        logger_.prompt(std::format("{}. {}", option_letter(i), options[i]));
    }

    if (allow_multiple) {
        logger_.prompt("Select one or more options by typing the corresponding letters, separated by commas.");
    } else {
        logger_.prompt("Select an option by typing the corresponding letter.");
    }
}

std::string SelectionPrompt::read_answer(std::string_view default_choice) {
    std::string answer = console_.read_line("");
    logger_.append_output(std::format("> {}\n", answer));

    if (answer.empty()) {
        answer = default_choice;
    }

    return answer;
}

} // namespace provision
