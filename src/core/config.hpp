#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace provision {

struct ProvisionConfig {
    std::filesystem::path project_root;
    std::filesystem::path env_dir{".venv"};
    std::filesystem::path package_cache_dir{"build_helpers"};
    std::filesystem::path log_dir{"/tmp"};

    // Probed in order; empty means the platform defaults for `user`.
    std::vector<std::string> interpreter_candidates;
    std::string user;

    std::string git_program{"git"};
    std::string sync_remote;

    std::string native_library_package{"TA-Lib"};
    std::string native_library_module{"talib"};

    std::vector<std::string> manifests{
        "requirements.txt",
        "requirements-dev.txt",
        "requirements-hyperopt.txt",
        "requirements-freqai.txt",
        "requirements-freqai-rl.txt",
        "requirements-plot.txt",
    };

    std::string app_command{"freqtrade"};
    std::vector<std::string> ui_install_args{"install-ui"};

    std::string log_viewer{"less"};
    bool wait_for_keypress{true};

    [[nodiscard]] std::filesystem::path env_path() const { return project_root / env_dir; }
    [[nodiscard]] std::filesystem::path package_cache_path() const { return project_root / package_cache_dir; }
};

// Reads USER, TMPDIR and PAGER on top of the built-in defaults.
[[nodiscard]] ProvisionConfig load_config(const std::filesystem::path &project_root);

} // namespace provision
