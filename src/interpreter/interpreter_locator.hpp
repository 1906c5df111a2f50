#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provision {

class Logger;
class PathResolver;
class ProcessExecutor;

struct Version {
    int major{0};
    int minor{0};
    int patch{0};

    auto operator<=>(const Version &) const = default;

    [[nodiscard]] std::string to_string() const;
};

struct LocatedInterpreter {
    std::string path;
    Version version;
};

// First X.Y.Z token in the text, e.g. "Python 3.12.1" -> 3.12.1.
[[nodiscard]] std::optional<Version> parse_version(std::string_view text);

class InterpreterLocator {
  public:
    InterpreterLocator(Logger &logger,
                       const ProcessExecutor &process_executor,
                       const PathResolver &path_resolver,
                       std::vector<std::string> candidates,
                       Version minimum_version = Version{3, 9, 0});

    [[nodiscard]] std::optional<LocatedInterpreter> locate() const;

    [[nodiscard]] const std::vector<std::string> &candidates() const noexcept;

    // Bare names, then versioned names, then well-known install locations, newest first.
    [[nodiscard]] static std::vector<std::string> default_candidates(std::string_view user);

  private:
    Logger &logger_;
    const ProcessExecutor &process_executor_;
    const PathResolver &path_resolver_;
    std::vector<std::string> candidates_;
    Version minimum_version_;

    [[nodiscard]] std::optional<LocatedInterpreter> probe(const std::string &candidate) const;
};

} // namespace provision
