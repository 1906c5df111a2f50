#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "execution/environment_activation.hpp"

namespace provision {

struct ExecutionContext {
    std::filesystem::path project_root;
    std::filesystem::path env_dir;
    std::filesystem::path log_file;
    std::string interpreter;
    std::vector<std::filesystem::path> selected_manifests;
    std::unique_ptr<EnvironmentActivation> activation;

    [[nodiscard]] std::filesystem::path activation_script() const { return env_dir / "bin" / "activate"; }
    [[nodiscard]] std::filesystem::path env_python() const { return env_dir / "bin" / "python"; }
};

} // namespace provision
