#include "core/path_resolver.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <system_error>

namespace provision {

namespace fs = std::filesystem;

bool PathResolver::is_executable_file(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    const auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return false;
    }

    constexpr auto executable_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

    return (perms & executable_bits) != fs::perms::none;
}

std::string PathResolver::find_command_path(std::string_view command) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr || command.empty()) {
        return {};
    }

    std::stringstream path_stream(path_env);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }

        const fs::path candidate = fs::path(dir) / command;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }

    return {};
}

std::string PathResolver::resolve(std::string_view candidate) const {
    if (candidate.find('/') == std::string_view::npos) {
        return find_command_path(candidate);
    }

    const fs::path path(candidate);
    return is_executable_file(path) ? path.string() : std::string{};
}

} // namespace provision
