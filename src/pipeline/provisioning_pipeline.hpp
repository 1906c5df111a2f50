#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "core/config.hpp"
#include "pipeline/execution_context.hpp"
#include "pipeline/exit_handler.hpp"
#include "pipeline/step_failure.hpp"
#include "prompt/console_input.hpp"
#include "prompt/selection_prompt.hpp"

namespace provision {

class InterpreterLocator;
class Logger;
class ProcessExecutor;

enum class PipelineState {
    Start,
    InterpreterChecked,
    EnvReady,
    SourceSynced,
    NativeLibReady,
    DepsSelected,
    DepsInstalled,
    AppInstalled,
    UiDecided,
    Done,
    Failed,
};

[[nodiscard]] std::string_view to_string(PipelineState state) noexcept;

enum class FailurePolicy {
    Fatal,
    BestEffort,
};

struct PipelineStep {
    std::string name;
    PipelineState target;
    // Returns true when the step's effect is already in place; empty means always run.
    std::function<bool()> skip_when;
    std::function<StepResult()> action;
    FailurePolicy policy{FailurePolicy::Fatal};
    // Reported when the action throws instead of returning a failure.
    FailureKind failure_kind;
};

class ProvisioningPipeline {
  public:
    ProvisioningPipeline(const ProvisionConfig &config,
                         Logger &logger,
                         const ConsoleIo &console,
                         const ProcessExecutor &process_executor,
                         const InterpreterLocator &interpreter_locator);

    ProvisioningPipeline(const ProvisioningPipeline &) = delete;
    ProvisioningPipeline &operator=(const ProvisioningPipeline &) = delete;

    // Runs every step in order and returns the process exit code.
    [[nodiscard]] int run();

    [[nodiscard]] PipelineState state() const noexcept;
    [[nodiscard]] const std::optional<StepFailure> &last_failure() const noexcept;
    [[nodiscard]] const std::vector<PipelineStep> &steps() const noexcept;
    [[nodiscard]] const ExecutionContext &context() const noexcept;

  private:
    const ProvisionConfig &config_;
    Logger &logger_;
    const ProcessExecutor &process_executor_;
    const InterpreterLocator &interpreter_locator_;
    SelectionPrompt selection_prompt_;
    ExecutionContext context_;
    ExitHandler exit_handler_;
    std::vector<PipelineStep> steps_;
    PipelineState state_{PipelineState::Start};
    std::optional<StepFailure> last_failure_;

    void register_steps();
    [[nodiscard]] bool execute_steps();
    [[nodiscard]] StepResult execute_step(const PipelineStep &step);
    void record_failure(const PipelineStep &step, StepFailure failure);

    StepResult check_interpreter();

    [[nodiscard]] bool environment_exists() const;
    StepResult create_environment();
    StepResult ensure_activated();

    [[nodiscard]] bool working_tree_dirty() const;
    StepResult sync_source();

    [[nodiscard]] bool native_library_present() const;
    StepResult install_native_library();

    StepResult select_dependencies();
    StepResult install_dependencies();
    StepResult install_application();
    StepResult decide_ui();

    [[nodiscard]] int run_logged(const Command &command) const;
    [[nodiscard]] Command env_pip(std::vector<std::string> args) const;
};

} // namespace provision
