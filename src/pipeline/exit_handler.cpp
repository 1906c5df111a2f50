#include "pipeline/exit_handler.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "execution/process_executor.hpp"
#include "logging/logger.hpp"
#include "pipeline/execution_context.hpp"

namespace provision {

ExitHandler::ExitHandler(Logger &logger,
                         const ConsoleIo &console,
                         const ProcessExecutor &process_executor,
                         ExecutionContext &context,
                         std::string log_viewer)
    : logger_(logger),
      console_(console),
      process_executor_(process_executor),
      context_(context),
      log_viewer_(std::move(log_viewer)) {}

int ExitHandler::finish(int exit_code, bool wait_for_keypress) {
    if (context_.activation) {
        context_.activation->release();
        context_.activation.reset();
    }

    if (exit_code != 0) {
        offer_log();
    } else if (wait_for_keypress) {
        logger_.prompt("Press any key to exit...");
        console_.wait_for_key();
    }

    return exit_code;
}

void ExitHandler::offer_log() {
    logger_.prompt("Script failed. Would you like to open the log file? (Y/N)");
    const std::string answer = console_.read_line("");
    if (answer != "Y" && answer != "y") {
        return;
    }

    int status = 0;
    try {
        status = process_executor_.run(Command{.program = log_viewer_, .args = {context_.log_file.string()}});
    } catch (const std::runtime_error &error) {
        logger_.warning(std::format("Could not start log viewer '{}': {}", log_viewer_, error.what()));
        return;
    }

    if (status != 0) {
        logger_.warning(std::format("Log viewer '{}' exited with status {}.", log_viewer_, status));
    }
}

} // namespace provision
