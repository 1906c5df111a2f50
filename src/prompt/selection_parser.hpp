#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace provision {

inline constexpr std::size_t max_options = 26;

struct SelectionError {
    std::string message;
};

using Selection = std::expected<std::vector<std::size_t>, SelectionError>;

[[nodiscard]] constexpr char option_letter(std::size_t index) noexcept { return static_cast<char>('A' + index); }

class SelectionParser {
  public:
    explicit SelectionParser(std::size_t option_count);

    // Comma separated letters; one bad token rejects the whole line.
    [[nodiscard]] Selection parse_multiple(std::string_view input) const;

    // Exactly one letter, no separators or padding.
    [[nodiscard]] std::expected<std::size_t, SelectionError> parse_single(std::string_view input) const;

  private:
    std::size_t option_count_;

    [[nodiscard]] std::expected<std::size_t, SelectionError> letter_to_index(std::string_view token) const;
};

} // namespace provision
