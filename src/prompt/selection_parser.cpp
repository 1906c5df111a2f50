#include "prompt/selection_parser.hpp"

#include <cctype>
#include <format>
#include <stdexcept>

namespace provision {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }

    return text;
}

[[nodiscard]] std::string to_upper(std::string_view text) {
    std::string result(text);
    for (char &c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    return result;
}

} // namespace

SelectionParser::SelectionParser(std::size_t option_count) : option_count_(option_count) {
    if (option_count_ == 0 || option_count_ > max_options) {
        throw std::invalid_argument(std::format("option list must hold 1 to {} entries, got {}", max_options, option_count_));
    }
}

Selection SelectionParser::parse_multiple(std::string_view input) const {
    std::vector<std::size_t> indices;

    std::size_t start = 0;
    while (true) {
        const std::size_t comma = input.find(',', start);
        const std::string_view raw =
            comma == std::string_view::npos ? input.substr(start) : input.substr(start, comma - start);

        const auto index = letter_to_index(to_upper(trim(raw)));
        if (!index.has_value()) {
            return std::unexpected(index.error());
        }

        indices.push_back(*index);

        if (comma == std::string_view::npos) {
            break;
        }

        start = comma + 1;
    }

    return indices;
}

std::expected<std::size_t, SelectionError> SelectionParser::parse_single(std::string_view input) const {
    return letter_to_index(to_upper(input));
}

std::expected<std::size_t, SelectionError> SelectionParser::letter_to_index(std::string_view token) const {
    if (token.size() != 1 || token.front() < 'A' || token.front() > 'Z') {
        return std::unexpected(SelectionError{std::format("Invalid input: {}. Please enter a letter between A and Z.", token)});
    }

    const auto index = static_cast<std::size_t>(token.front() - 'A');
    if (index >= option_count_) {
        return std::unexpected(SelectionError{
            std::format("Invalid input: {}. Please enter letters within the valid range of options.", token)});
    }

    return index;
}

} // namespace provision
