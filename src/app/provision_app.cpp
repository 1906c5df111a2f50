#include "app/provision_app.hpp"

#include <chrono>
#include <iostream>

#include <unistd.h>

namespace provision {

ProvisionApp::ProvisionApp(const std::filesystem::path &project_root)
    : config_(load_config(project_root)),
      logger_(Logger::create_session_log(config_.log_dir, std::chrono::system_clock::now()),
              std::cout,
              isatty(STDOUT_FILENO) != 0),
      console_(terminal_console()),
      path_resolver_(),
      process_executor_(),
      interpreter_locator_(logger_,
                           process_executor_,
                           path_resolver_,
                           config_.interpreter_candidates.empty()
                               ? InterpreterLocator::default_candidates(config_.user)
                               : config_.interpreter_candidates),
      pipeline_(config_, logger_, console_, process_executor_, interpreter_locator_) {}

int ProvisionApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    return pipeline_.run();
}

} // namespace provision
