#pragma once

#include <filesystem>

#include "core/config.hpp"
#include "core/path_resolver.hpp"
#include "execution/process_executor.hpp"
#include "interpreter/interpreter_locator.hpp"
#include "logging/logger.hpp"
#include "pipeline/provisioning_pipeline.hpp"
#include "prompt/console_input.hpp"

namespace provision {

class ProvisionApp {
  public:
    explicit ProvisionApp(const std::filesystem::path &project_root);

    int run();

  private:
    ProvisionConfig config_;
    Logger logger_;
    ConsoleIo console_;
    PathResolver path_resolver_;
    ProcessExecutor process_executor_;
    InterpreterLocator interpreter_locator_;
    ProvisioningPipeline pipeline_;
};

} // namespace provision
