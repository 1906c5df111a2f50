#include "execution/environment_activation.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

namespace provision {

namespace {

const char *posix_getenv(const char *name) { return std::getenv(name); }

int posix_setenv(const char *name, const char *value, int overwrite) { return setenv(name, value, overwrite); }

int posix_unsetenv(const char *name) { return unsetenv(name); }

const EnvironmentSyscalls default_syscalls{
    .getenv_fn = &posix_getenv,
    .setenv_fn = &posix_setenv,
    .unsetenv_fn = &posix_unsetenv,
};

} // namespace

EnvironmentActivation::EnvironmentActivation(const std::filesystem::path &env_dir, const EnvironmentSyscalls *syscalls)
    : syscalls_(syscalls != nullptr ? syscalls : &default_syscalls) {
    const std::string bin_dir = (env_dir / "bin").string();

    const char *current_path = syscalls_->getenv_fn("PATH");
    const std::string new_path =
        current_path != nullptr && *current_path != '\0' ? bin_dir + ":" + current_path : bin_dir;

    if (!set_variable("VIRTUAL_ENV", env_dir.string()) || !set_variable("PATH", new_path) ||
        !unset_variable("PYTHONHOME")) {
        valid_ = false;
        release();
    }
}

EnvironmentActivation::~EnvironmentActivation() { release(); }

bool EnvironmentActivation::is_valid() const noexcept { return valid_; }

const std::string &EnvironmentActivation::error() const noexcept { return error_; }

void EnvironmentActivation::release() noexcept {
    for (auto it = saved_variables_.rbegin(); it != saved_variables_.rend(); ++it) {
        if (it->value.has_value()) {
            syscalls_->setenv_fn(it->name.c_str(), it->value->c_str(), 1);
        } else {
            syscalls_->unsetenv_fn(it->name.c_str());
        }
    }

    saved_variables_.clear();
}

bool EnvironmentActivation::set_variable(const std::string &name, const std::string &value) {
    save(name);

    if (syscalls_->setenv_fn(name.c_str(), value.c_str(), 1) == -1) {
        error_ = std::format("failed to set {}: {}", name, std::strerror(errno));
        return false;
    }

    return true;
}

bool EnvironmentActivation::unset_variable(const std::string &name) {
    save(name);

    if (syscalls_->unsetenv_fn(name.c_str()) == -1) {
        error_ = std::format("failed to unset {}: {}", name, std::strerror(errno));
        return false;
    }

    return true;
}

void EnvironmentActivation::save(const std::string &name) {
    for (const auto &saved : saved_variables_) {
        if (saved.name == name) {
            return;
        }
    }

    const char *value = syscalls_->getenv_fn(name.c_str());
    saved_variables_.push_back(SavedVariable{
        .name = name, .value = value != nullptr ? std::optional<std::string>(value) : std::nullopt});
}

} // namespace provision
