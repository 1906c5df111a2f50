#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "core/path_resolver.hpp"
#include "execution/process_executor.hpp"
#include "interpreter/interpreter_locator.hpp"
#include "logging/logger.hpp"

using provision::InterpreterLocator;
using provision::Logger;
using provision::PathResolver;
using provision::ProcessExecutor;
using provision::Version;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/provision_interpreter_locator_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

std::string slurp(const fs::path &path) {
    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

void make_executable_script(const fs::path &path, std::string_view body) {
    std::ofstream file(path);
    assert(file.is_open());
    file << body;
    file.close();

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

void test_parse_version() {
    const auto plain = provision::parse_version("Python 3.12.1\n");
    assert(plain.has_value());
    assert((*plain == Version{3, 12, 1}));

    const auto suffixed = provision::parse_version("Python 3.13.0rc2");
    assert(suffixed.has_value());
    assert((*suffixed == Version{3, 13, 0}));

    assert(!provision::parse_version("Python 3.12").has_value());
    assert(!provision::parse_version("command not found").has_value());

    assert((Version{3, 9, 0} < Version{3, 10, 0}));
    assert((Version{3, 10, 2}.to_string() == "3.10.2"));
}

void test_first_usable_candidate_wins() {
    const fs::path dir = make_temp_dir();
    const fs::path broken = dir / "broken";
    const fs::path silent = dir / "silent";
    const fs::path ancient = dir / "ancient";
    const fs::path good = dir / "good";
    const fs::path also_good = dir / "also_good";

    make_executable_script(broken, "#!/bin/sh\necho 'Python 3.12.0'\nexit 1\n");
    make_executable_script(silent, "#!/bin/sh\necho hello\n");
    make_executable_script(ancient, "#!/bin/sh\necho 'Python 2.7.18' >&2\n");
    make_executable_script(good, "#!/bin/sh\n[ \"$1\" = --version ] && echo 'Python 3.11.4'\n");
    make_executable_script(also_good, "#!/bin/sh\necho 'Python 3.13.1'\n");

    std::ostringstream display;
    Logger logger(dir / "log.txt", display);
    ProcessExecutor executor;
    PathResolver resolver;

    InterpreterLocator locator(logger,
                               executor,
                               resolver,
                               {(dir / "missing").string(),
                                broken.string(),
                                silent.string(),
                                ancient.string(),
                                good.string(),
                                also_good.string()});

    const auto located = locator.locate();
    assert(located.has_value());
    assert(located->path == good.string());
    assert((located->version == Version{3, 11, 4}));

    const std::string log = slurp(dir / "log.txt");
    assert(log.find("WARNING: Python executable '" + (dir / "missing").string() + "' not found.") != std::string::npos);
    assert(log.find("'" + broken.string() + "' not working correctly.") != std::string::npos);
    assert(log.find("'" + silent.string() + "' did not report a version.") != std::string::npos);
    assert(log.find("version 2.7.18, at least 3.9.0 is required.") != std::string::npos);
    assert(log.find("INFO: Python version 3.11.4 found using executable '" + good.string() + "'.") != std::string::npos);
    assert(log.find(also_good.string()) == std::string::npos);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_bare_names_resolve_on_path() {
    EnvVarGuard path_guard("PATH");

    const fs::path dir = make_temp_dir();
    const fs::path bin = dir / "bin";
    fs::create_directories(bin);
    make_executable_script(bin / "python3", "#!/bin/sh\necho 'Python 3.10.12'\n");

    const std::string path_env = bin.string() + ":/bin:/usr/bin";
    setenv("PATH", path_env.c_str(), 1);

    std::ostringstream display;
    Logger logger(dir / "log.txt", display);
    ProcessExecutor executor;
    PathResolver resolver;

    InterpreterLocator locator(logger, executor, resolver, {"python-definitely-missing", "python3"});
    const auto located = locator.locate();
    assert(located.has_value());
    assert(located->path == (bin / "python3").string());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_nothing_usable_returns_nullopt() {
    const fs::path dir = make_temp_dir();
    std::ostringstream display;
    Logger logger(dir / "log.txt", display);
    ProcessExecutor executor;
    PathResolver resolver;

    InterpreterLocator locator(logger, executor, resolver, {"/definitely/missing/python3", "/definitely/missing/python"});
    assert(!locator.locate().has_value());

    InterpreterLocator empty(logger, executor, resolver, {});
    assert(!empty.locate().has_value());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_minimum_version_is_configurable() {
    const fs::path dir = make_temp_dir();
    const fs::path python = dir / "python";
    make_executable_script(python, "#!/bin/sh\necho 'Python 3.10.0'\n");

    std::ostringstream display;
    Logger logger(dir / "log.txt", display);
    ProcessExecutor executor;
    PathResolver resolver;

    InterpreterLocator strict(logger, executor, resolver, {python.string()}, Version{3, 11, 0});
    assert(!strict.locate().has_value());

    InterpreterLocator relaxed(logger, executor, resolver, {python.string()}, Version{3, 10, 0});
    assert(relaxed.locate().has_value());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_default_candidates_order() {
    const auto candidates = InterpreterLocator::default_candidates("alice");

    assert(candidates.size() >= 4);
    assert(candidates[0] == "python3");
    assert(candidates[1] == "python");
    assert(candidates[2] == "python3.13");

    const auto position = [&](const std::string &name) {
        return std::find(candidates.begin(), candidates.end(), name) - candidates.begin();
    };

    assert(position("python3.13") < position("python3.9"));
    assert(position("python3.9") < position("/home/alice/.local/bin/python3.13"));
    assert(position("/home/alice/.local/bin/python3.13") < position("/home/alice/.local/bin/python3.12"));
    assert(position("/home/alice/.local/bin/python3.9") < position("/usr/local/bin/python3.13"));
    assert(candidates.back() == "/usr/local/bin/python3.9");

    const auto anonymous = InterpreterLocator::default_candidates("");
    for (const auto &candidate : anonymous) {
        assert(!candidate.starts_with("/home/"));
    }
}

} // namespace

int main() {
    test_parse_version();
    test_first_usable_candidate_wins();
    test_bare_names_resolve_on_path();
    test_nothing_usable_returns_nullopt();
    test_minimum_version_is_configurable();
    test_default_candidates_order();
    return 0;
}
