#include <cassert>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "execution/environment_activation.hpp"
#include "execution/process_executor.hpp"
#include "logging/logger.hpp"
#include "pipeline/execution_context.hpp"
#include "pipeline/exit_handler.hpp"
#include "prompt/console_input.hpp"

using provision::ConsoleIo;
using provision::EnvironmentActivation;
using provision::ExecutionContext;
using provision::ExitHandler;
using provision::Logger;
using provision::ProcessExecutor;

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
    std::string pattern = "/tmp/provision_exit_handler_XXXXXX";
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

class ScriptedConsole {
  public:
    explicit ScriptedConsole(std::deque<std::string> answers) : answers_(std::move(answers)) {}

    [[nodiscard]] ConsoleIo io() {
        return ConsoleIo{
            .read_line =
                [this](std::string_view) {
                    ++reads_;
                    if (answers_.empty()) {
                        return std::string{};
                    }

                    std::string answer = answers_.front();
                    answers_.pop_front();
                    return answer;
                },
            .wait_for_key = [this] { ++key_waits_; },
        };
    }

    [[nodiscard]] int reads() const noexcept { return reads_; }
    [[nodiscard]] int key_waits() const noexcept { return key_waits_; }

  private:
    std::deque<std::string> answers_;
    int reads_{0};
    int key_waits_{0};
};

struct Fixture {
    fs::path dir{make_temp_dir()};
    fs::path viewer_calls{dir / "viewer_calls.txt"};
    fs::path viewer{dir / "viewer"};
    std::ostringstream display;
    Logger logger{dir / "log.txt", display};
    ProcessExecutor executor;
    ExecutionContext context;

    Fixture() {
        make_executable_script(viewer, "#!/bin/sh\necho \"viewer $*\" >> '" + viewer_calls.string() + "'\n");
        context.project_root = dir;
        context.env_dir = dir / ".venv";
        context.log_file = logger.log_file();
    }

    ~Fixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

void test_failure_opens_log_on_yes() {
    for (const std::string answer : {"Y", "y"}) {
        Fixture fixture;
        ScriptedConsole scripted({answer});
        const ConsoleIo console = scripted.io();

        ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, fixture.viewer.string());
        assert(handler.finish(1, true) == 1);

        assert(scripted.reads() == 1);
        assert(scripted.key_waits() == 0);
        assert(slurp(fixture.viewer_calls) == "viewer " + fixture.logger.log_file().string() + "\n");
        assert(slurp(fixture.logger.log_file()).find("PROMPT: Script failed. Would you like to open the log file? (Y/N)") !=
               std::string::npos);
    }
}

void test_failure_keeps_log_closed_on_other_answers() {
    for (const std::string answer : {"n", "", "yes", "N"}) {
        Fixture fixture;
        ScriptedConsole scripted({answer});
        const ConsoleIo console = scripted.io();

        ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, fixture.viewer.string());
        assert(handler.finish(1, true) == 1);
        assert(!fs::exists(fixture.viewer_calls));
    }
}

void test_missing_viewer_is_only_a_warning() {
    Fixture fixture;
    ScriptedConsole scripted({"y"});
    const ConsoleIo console = scripted.io();

    ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, "/definitely/missing/viewer");
    assert(handler.finish(1, false) == 1);
    assert(slurp(fixture.logger.log_file()).find("WARNING: Log viewer '/definitely/missing/viewer' exited with status 127.") !=
           std::string::npos);
}

void test_success_waits_for_key_only_when_asked() {
    {
        Fixture fixture;
        ScriptedConsole scripted(std::deque<std::string>{});
        const ConsoleIo console = scripted.io();

        ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, fixture.viewer.string());
        assert(handler.finish(0, true) == 0);
        assert(scripted.key_waits() == 1);
        assert(scripted.reads() == 0);
        assert(fixture.display.str().find("Press any key to exit...") != std::string::npos);
    }

    {
        Fixture fixture;
        ScriptedConsole scripted(std::deque<std::string>{});
        const ConsoleIo console = scripted.io();

        ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, fixture.viewer.string());
        assert(handler.finish(0, false) == 0);
        assert(scripted.key_waits() == 0);
        assert(fixture.display.str().empty());
    }
}

void test_environment_is_released_first() {
    EnvVarGuard venv_guard("VIRTUAL_ENV");
    unsetenv("VIRTUAL_ENV");

    Fixture fixture;
    ScriptedConsole scripted(std::deque<std::string>{});
    const ConsoleIo console = scripted.io();

    fixture.context.activation = std::make_unique<EnvironmentActivation>(fixture.context.env_dir);
    assert(std::getenv("VIRTUAL_ENV") != nullptr);

    ExitHandler handler(fixture.logger, console, fixture.executor, fixture.context, fixture.viewer.string());
    assert(handler.finish(0, false) == 0);

    assert(fixture.context.activation == nullptr);
    assert(std::getenv("VIRTUAL_ENV") == nullptr);
}

} // namespace

int main() {
    test_failure_opens_log_on_yes();
    test_failure_keeps_log_closed_on_other_answers();
    test_missing_viewer_is_only_a_warning();
    test_success_waits_for_key_only_when_asked();
    test_environment_is_released_first();
    return 0;
}
