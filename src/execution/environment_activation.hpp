#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace provision {

struct EnvironmentSyscalls {
    const char *(*getenv_fn)(const char *name);
    int (*setenv_fn)(const char *name, const char *value, int overwrite);
    int (*unsetenv_fn)(const char *name);
};

// Puts a virtual environment in front of the process environment the way its
// activate script would, and puts everything back on release or destruction.
class EnvironmentActivation {
  public:
    explicit EnvironmentActivation(
        const std::filesystem::path &env_dir, const EnvironmentSyscalls *syscalls = nullptr);
    ~EnvironmentActivation();

    EnvironmentActivation(const EnvironmentActivation &) = delete;
    EnvironmentActivation &operator=(const EnvironmentActivation &) = delete;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] const std::string &error() const noexcept;

    void release() noexcept;

  private:
    struct SavedVariable {
        std::string name;
        std::optional<std::string> value;
    };

    std::vector<SavedVariable> saved_variables_;
    bool valid_{true};
    std::string error_;
    const EnvironmentSyscalls *syscalls_;

    [[nodiscard]] bool set_variable(const std::string &name, const std::string &value);
    [[nodiscard]] bool unset_variable(const std::string &name);
    void save(const std::string &name);
};

} // namespace provision
