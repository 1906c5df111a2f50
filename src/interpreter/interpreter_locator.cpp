#include "interpreter/interpreter_locator.hpp"

#include <format>
#include <regex>
#include <stdexcept>
#include <utility>

#include "core/path_resolver.hpp"
#include "execution/process_executor.hpp"
#include "logging/logger.hpp"

namespace provision {

namespace {

constexpr int newest_minor = 13;
constexpr int oldest_minor = 9;

} // namespace

std::string Version::to_string() const { return std::format("{}.{}.{}", major, minor, patch); }

std::optional<Version> parse_version(std::string_view text) {
    static const std::regex version_pattern(R"((\d+)\.(\d+)\.(\d+))");

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, version_pattern)) {
        return std::nullopt;
    }

    try {
        return Version{std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str())};
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

InterpreterLocator::InterpreterLocator(Logger &logger,
                                       const ProcessExecutor &process_executor,
                                       const PathResolver &path_resolver,
                                       std::vector<std::string> candidates,
                                       Version minimum_version)
    : logger_(logger),
      process_executor_(process_executor),
      path_resolver_(path_resolver),
      candidates_(std::move(candidates)),
      minimum_version_(minimum_version) {}

std::optional<LocatedInterpreter> InterpreterLocator::locate() const {
    for (const auto &candidate : candidates_) {
        if (auto interpreter = probe(candidate); interpreter.has_value()) {
            return interpreter;
        }
    }

    return std::nullopt;
}

const std::vector<std::string> &InterpreterLocator::candidates() const noexcept { return candidates_; }

std::vector<std::string> InterpreterLocator::default_candidates(std::string_view user) {
    std::vector<std::string> candidates{"python3", "python"};

    for (int minor = newest_minor; minor >= oldest_minor; --minor) {
        candidates.push_back(std::format("python3.{}", minor));
    }

    if (!user.empty()) {
        for (int minor = newest_minor; minor >= oldest_minor; --minor) {
            candidates.push_back(std::format("/home/{}/.local/bin/python3.{}", user, minor));
        }
    }

    for (int minor = newest_minor; minor >= oldest_minor; --minor) {
        candidates.push_back(std::format("/usr/local/bin/python3.{}", minor));
    }

    return candidates;
}

std::optional<LocatedInterpreter> InterpreterLocator::probe(const std::string &candidate) const {
    const std::string path = path_resolver_.resolve(candidate);
    if (path.empty()) {
        logger_.warning(std::format("Python executable '{}' not found.", candidate));
        return std::nullopt;
    }

    const auto result = process_executor_.capture(Command{.program = path, .args = {"--version"}});
    if (!result.succeeded()) {
        logger_.warning(std::format("Python executable '{}' not working correctly.", candidate));
        return std::nullopt;
    }

    const auto version = parse_version(result.output);
    if (!version.has_value()) {
        logger_.warning(std::format("Python executable '{}' did not report a version.", candidate));
        return std::nullopt;
    }

    if (*version < minimum_version_) {
        logger_.warning(std::format("Python executable '{}' is version {}, at least {} is required.",
                                    candidate,
                                    version->to_string(),
                                    minimum_version_.to_string()));
        return std::nullopt;
    }

    logger_.info(std::format("Python version {} found using executable '{}'.", version->to_string(), candidate));
    return LocatedInterpreter{.path = path, .version = *version};
}

} // namespace provision
