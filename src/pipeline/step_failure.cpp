#include "pipeline/step_failure.hpp"

namespace provision {

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::InterpreterNotFound:
        return "InterpreterNotFound";
    case FailureKind::EnvironmentCreationFailed:
        return "EnvironmentCreationFailed";
    case FailureKind::SyncFailed:
        return "SyncFailed";
    case FailureKind::NativeLibraryInstallFailed:
        return "NativeLibraryInstallFailed";
    case FailureKind::ManifestNotFound:
        return "ManifestNotFound";
    case FailureKind::DependencyInstallFailed:
        return "DependencyInstallFailed";
    case FailureKind::ApplicationInstallFailed:
        return "ApplicationInstallFailed";
    case FailureKind::InvalidSelection:
        return "InvalidSelection";
    case FailureKind::UiInstallFailed:
        return "UiInstallFailed";
    }

    return "Unknown";
}

} // namespace provision
