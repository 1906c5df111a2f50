#pragma once

#include <string>

#include "prompt/console_input.hpp"

namespace provision {

class Logger;
class ProcessExecutor;
struct ExecutionContext;

class ExitHandler {
  public:
    ExitHandler(Logger &logger,
                const ConsoleIo &console,
                const ProcessExecutor &process_executor,
                ExecutionContext &context,
                std::string log_viewer);

    // Releases the environment, offers the log on failure, returns exit_code unchanged.
    [[nodiscard]] int finish(int exit_code, bool wait_for_keypress);

  private:
    Logger &logger_;
    const ConsoleIo &console_;
    const ProcessExecutor &process_executor_;
    ExecutionContext &context_;
    std::string log_viewer_;

    void offer_log();
};

} // namespace provision
