#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace provision {

enum class FailureKind {
    InterpreterNotFound,
    EnvironmentCreationFailed,
    SyncFailed,
    NativeLibraryInstallFailed,
    ManifestNotFound,
    DependencyInstallFailed,
    ApplicationInstallFailed,
    InvalidSelection,
    UiInstallFailed,
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

struct StepFailure {
    FailureKind kind;
    std::string message;
};

using StepResult = std::expected<void, StepFailure>;

[[nodiscard]] inline StepResult fail_with(FailureKind kind, std::string message) {
    return std::unexpected(StepFailure{.kind = kind, .message = std::move(message)});
}

} // namespace provision
