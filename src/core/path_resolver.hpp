#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace provision {

class PathResolver {
  public:
    // Empty when the command is not an executable file in any PATH directory.
    [[nodiscard]] std::string find_command_path(std::string_view command) const;

    // Bare names are looked up on PATH, anything containing '/' is checked as a file.
    [[nodiscard]] std::string resolve(std::string_view candidate) const;

    [[nodiscard]] static bool is_executable_file(const std::filesystem::path &path);
};

} // namespace provision
