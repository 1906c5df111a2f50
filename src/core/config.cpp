#include "core/config.hpp"

#include <cstdlib>

namespace provision {

namespace {

[[nodiscard]] std::string env_or(const char *name, const std::string &fallback) {
    const char *value = std::getenv(name);
    return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}

} // namespace

ProvisionConfig load_config(const std::filesystem::path &project_root) {
    ProvisionConfig config;
    config.project_root = project_root;
    config.user = env_or("USER", "");
    config.log_dir = env_or("TMPDIR", config.log_dir.string());
    config.log_viewer = env_or("PAGER", config.log_viewer);
    return config;
}

} // namespace provision
