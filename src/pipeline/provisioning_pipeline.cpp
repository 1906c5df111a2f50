#include "pipeline/provisioning_pipeline.hpp"

#include <filesystem>
#include <format>
#include <ios>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "execution/environment_activation.hpp"
#include "execution/process_executor.hpp"
#include "interpreter/interpreter_locator.hpp"
#include "logging/logger.hpp"

namespace provision {

namespace fs = std::filesystem;

std::string_view to_string(PipelineState state) noexcept {
    switch (state) {
    case PipelineState::Start:
        return "START";
    case PipelineState::InterpreterChecked:
        return "INTERPRETER_CHECKED";
    case PipelineState::EnvReady:
        return "ENV_READY";
    case PipelineState::SourceSynced:
        return "SOURCE_SYNCED";
    case PipelineState::NativeLibReady:
        return "NATIVE_LIB_READY";
    case PipelineState::DepsSelected:
        return "DEPS_SELECTED";
    case PipelineState::DepsInstalled:
        return "DEPS_INSTALLED";
    case PipelineState::AppInstalled:
        return "APP_INSTALLED";
    case PipelineState::UiDecided:
        return "UI_DECIDED";
    case PipelineState::Done:
        return "DONE";
    case PipelineState::Failed:
        return "FAILED";
    }

    return "FAILED";
}

ProvisioningPipeline::ProvisioningPipeline(const ProvisionConfig &config,
                                           Logger &logger,
                                           const ConsoleIo &console,
                                           const ProcessExecutor &process_executor,
                                           const InterpreterLocator &interpreter_locator)
    : config_(config),
      logger_(logger),
      process_executor_(process_executor),
      interpreter_locator_(interpreter_locator),
      selection_prompt_(logger, console),
      context_{.project_root = config.project_root,
               .env_dir = config.env_path(),
               .log_file = logger.log_file(),
               .interpreter = {},
               .selected_manifests = {},
               .activation = nullptr},
      exit_handler_(logger, console, process_executor, context_, config.log_viewer) {
    register_steps();
}

int ProvisioningPipeline::run() {
    logger_.info("Starting the operations...");
    logger_.info(std::format("Current directory: {}", context_.project_root.string()));
    logger_.info(std::format("Log file: {}", context_.log_file.string()));

    if (!execute_steps()) {
        return exit_handler_.finish(1, config_.wait_for_keypress);
    }

    state_ = PipelineState::Done;
    logger_.info("Update complete!");
    return exit_handler_.finish(0, config_.wait_for_keypress);
}

PipelineState ProvisioningPipeline::state() const noexcept { return state_; }

const std::optional<StepFailure> &ProvisioningPipeline::last_failure() const noexcept { return last_failure_; }

const std::vector<PipelineStep> &ProvisioningPipeline::steps() const noexcept { return steps_; }

const ExecutionContext &ProvisioningPipeline::context() const noexcept { return context_; }

void ProvisioningPipeline::register_steps() {
    steps_.push_back(PipelineStep{.name = "interpreter check",
                                  .target = PipelineState::InterpreterChecked,
                                  .skip_when = {},
                                  .action = [this] { return check_interpreter(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::InterpreterNotFound});

    steps_.push_back(PipelineStep{.name = "virtual environment",
                                  .target = PipelineState::EnvReady,
                                  .skip_when = [this] { return environment_exists(); },
                                  .action = [this] { return create_environment(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::EnvironmentCreationFailed});

    steps_.push_back(PipelineStep{.name = "source sync",
                                  .target = PipelineState::SourceSynced,
                                  .skip_when = [this] { return working_tree_dirty(); },
                                  .action = [this] { return sync_source(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::SyncFailed});

    steps_.push_back(PipelineStep{.name = "native library",
                                  .target = PipelineState::NativeLibReady,
                                  .skip_when = [this] { return native_library_present(); },
                                  .action = [this] { return install_native_library(); },
                                  .policy = FailurePolicy::BestEffort,
                                  .failure_kind = FailureKind::NativeLibraryInstallFailed});

    steps_.push_back(PipelineStep{.name = "dependency selection",
                                  .target = PipelineState::DepsSelected,
                                  .skip_when = {},
                                  .action = [this] { return select_dependencies(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::InvalidSelection});

    steps_.push_back(PipelineStep{.name = "dependency install",
                                  .target = PipelineState::DepsInstalled,
                                  .skip_when = {},
                                  .action = [this] { return install_dependencies(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::DependencyInstallFailed});

    steps_.push_back(PipelineStep{.name = "application install",
                                  .target = PipelineState::AppInstalled,
                                  .skip_when = {},
                                  .action = [this] { return install_application(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::ApplicationInstallFailed});

    steps_.push_back(PipelineStep{.name = "UI install",
                                  .target = PipelineState::UiDecided,
                                  .skip_when = {},
                                  .action = [this] { return decide_ui(); },
                                  .policy = FailurePolicy::Fatal,
                                  .failure_kind = FailureKind::UiInstallFailed});
}

bool ProvisioningPipeline::execute_steps() {
    for (const auto &step : steps_) {
        auto result = execute_step(step);

        if (!result.has_value()) {
            if (step.policy == FailurePolicy::BestEffort) {
                logger_.warning(std::format("{} Continuing without {}.", result.error().message, step.name));
            } else {
                record_failure(step, std::move(result.error()));
                return false;
            }
        }

        state_ = step.target;
    }

    return true;
}

StepResult ProvisioningPipeline::execute_step(const PipelineStep &step) {
    try {
        if (step.skip_when && step.skip_when()) {
            return {};
        }

        return step.action();
    } catch (const std::ios_base::failure &) {
        throw;
    } catch (const std::runtime_error &error) {
        return fail_with(step.failure_kind, std::format("{} step aborted: {}", step.name, error.what()));
    }
}

void ProvisioningPipeline::record_failure(const PipelineStep &step, StepFailure failure) {
    logger_.error(failure.message);
    logger_.append_output(std::format("{} failed in state {} ({})\n", step.name, to_string(state_), to_string(failure.kind)));
    state_ = PipelineState::Failed;
    last_failure_ = std::move(failure);
}

StepResult ProvisioningPipeline::check_interpreter() {
    const auto interpreter = interpreter_locator_.locate();
    if (!interpreter.has_value()) {
        return fail_with(FailureKind::InterpreterNotFound,
                         "No usable Python executable found. Please install Python 3.9 or newer and try again.");
    }

    context_.interpreter = interpreter->path;
    return {};
}

bool ProvisioningPipeline::environment_exists() const {
    std::error_code ec;
    const bool exists = fs::exists(context_.activation_script(), ec) && !ec;
    if (exists) {
        logger_.info(std::format("Virtual environment found at {}.", context_.env_dir.string()));
    }

    return exists;
}

StepResult ProvisioningPipeline::create_environment() {
    logger_.info(std::format("Creating virtual environment at {}...", context_.env_dir.string()));

    const int status =
        run_logged(Command{.program = context_.interpreter, .args = {"-m", "venv", context_.env_dir.string()}});

    std::error_code ec;
    if (status != 0 || !fs::exists(context_.activation_script(), ec)) {
        return fail_with(FailureKind::EnvironmentCreationFailed,
                         std::format("Failed to create virtual environment at {}.", context_.env_dir.string()));
    }

    logger_.info("Virtual environment created.");
    return {};
}

StepResult ProvisioningPipeline::ensure_activated() {
    if (context_.activation) {
        return {};
    }

    auto activation = std::make_unique<EnvironmentActivation>(context_.env_dir);
    if (!activation->is_valid()) {
        return fail_with(FailureKind::EnvironmentCreationFailed,
                         std::format("Failed to activate virtual environment: {}", activation->error()));
    }

    context_.activation = std::move(activation);
    return {};
}

bool ProvisioningPipeline::working_tree_dirty() const {
    const auto status = process_executor_.capture(
        Command{.program = config_.git_program, .args = {"-C", context_.project_root.string(), "status", "--porcelain"}});

    if (!status.succeeded()) {
        logger_.warning("Unable to read the git repository state. Skipping git pull.");
        logger_.append_output(status.output);
        return true;
    }

    if (!status.output.empty()) {
        logger_.info("Changes in local git repository. Skipping git pull.");
        return true;
    }

    return false;
}

StepResult ProvisioningPipeline::sync_source() {
    logger_.info("Pulling latest updates...");

    std::vector<std::string> args{"-C", context_.project_root.string(), "pull"};
    if (!config_.sync_remote.empty()) {
        args.push_back(config_.sync_remote);
    }

    if (run_logged(Command{.program = config_.git_program, .args = std::move(args)}) != 0) {
        return fail_with(FailureKind::SyncFailed, "Failed to pull from Git repository.");
    }

    logger_.info("Repository updated.");
    return {};
}

bool ProvisioningPipeline::native_library_present() const {
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(context_.env_dir / "lib", ec)) {
        if (ec) {
            break;
        }

        if (!entry.path().filename().string().starts_with("python")) {
            continue;
        }

        if (fs::is_directory(entry.path() / "site-packages" / config_.native_library_module, ec)) {
            logger_.info(std::format("{} is already installed.", config_.native_library_package));
            return true;
        }
    }

    return false;
}

StepResult ProvisioningPipeline::install_native_library() {
    if (auto activated = ensure_activated(); !activated.has_value()) {
        return fail_with(FailureKind::NativeLibraryInstallFailed, activated.error().message);
    }

    logger_.info(std::format("Installing {}...", config_.native_library_package));

    const std::string find_links = std::format("--find-links={}/", config_.package_cache_path().string());
    if (run_logged(env_pip({"install", find_links, "--prefer-binary", config_.native_library_package})) != 0) {
        return fail_with(FailureKind::NativeLibraryInstallFailed,
                         std::format("Failed to install {}.", config_.native_library_package));
    }

    return {};
}

StepResult ProvisioningPipeline::select_dependencies() {
    const auto selection = selection_prompt_.select(
        "Select which requirements files to install:", config_.manifests, "A", true);
    if (!selection.has_value()) {
        return fail_with(FailureKind::InvalidSelection, "Invalid selection. Exiting...");
    }

    context_.selected_manifests.clear();
    for (const std::size_t index : *selection) {
        const fs::path manifest = context_.project_root / config_.manifests[index];

        std::error_code ec;
        if (!fs::exists(manifest, ec)) {
            return fail_with(FailureKind::ManifestNotFound, std::format("Requirements file not found: {}", manifest.string()));
        }

        context_.selected_manifests.push_back(manifest);
    }

    return {};
}

StepResult ProvisioningPipeline::install_dependencies() {
    if (auto activated = ensure_activated(); !activated.has_value()) {
        return activated;
    }

    std::vector<std::string> args{"install"};
    for (const auto &manifest : context_.selected_manifests) {
        args.push_back("-r");
        args.push_back(manifest.string());
    }

    logger_.info("Installing selected requirements...");
    if (run_logged(env_pip(std::move(args))) != 0) {
        return fail_with(FailureKind::DependencyInstallFailed, "Failed to install requirements.");
    }

    return {};
}

StepResult ProvisioningPipeline::install_application() {
    if (auto activated = ensure_activated(); !activated.has_value()) {
        return activated;
    }

    logger_.info("Installing application in editable mode...");
    if (run_logged(env_pip({"install", "-e", context_.project_root.string()})) != 0) {
        return fail_with(FailureKind::ApplicationInstallFailed, "Failed to install the application.");
    }

    return {};
}

StepResult ProvisioningPipeline::decide_ui() {
    const auto choice = selection_prompt_.select_one(
        std::format("Do you want to install the {} UI?", config_.app_command), {"Yes", "No"}, "B");
    if (!choice.has_value()) {
        return fail_with(FailureKind::InvalidSelection, "Invalid selection. Exiting...");
    }

    if (*choice == 1) {
        logger_.info("Skipping UI installation.");
        return {};
    }

    // select_one only yields 0 or 1 for a two-entry list.
    if (*choice != 0) {
        return fail_with(FailureKind::InvalidSelection, std::format("Unexpected UI selection index {}.", *choice));
    }

    if (auto activated = ensure_activated(); !activated.has_value()) {
        return activated;
    }

    logger_.info("Installing the UI...");
    if (run_logged(Command{.program = config_.app_command, .args = config_.ui_install_args}) != 0) {
        return fail_with(FailureKind::UiInstallFailed, "Failed to install the UI.");
    }

    return {};
}

int ProvisioningPipeline::run_logged(const Command &command) const {
    logger_.append_output(std::format("$ {}\n", describe(command)));
    return process_executor_.run(command, [this](std::string_view chunk) { logger_.tool_output(chunk); });
}

Command ProvisioningPipeline::env_pip(std::vector<std::string> args) const {
    std::vector<std::string> full_args{"-m", "pip"};
    full_args.insert(full_args.end(), args.begin(), args.end());
    return Command{.program = context_.env_python().string(), .args = std::move(full_args)};
}

} // namespace provision
