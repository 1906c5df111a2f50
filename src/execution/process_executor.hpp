#pragma once

#include <functional>
#include <string_view>
#include <sys/types.h>

#include "core/command.hpp"

namespace provision {

class ProcessExecutor {
  public:
    using OutputSink = std::function<void(std::string_view chunk)>;

    // Child inherits the terminal; used for interactive tools such as the log viewer.
    [[nodiscard]] int run(const Command &command) const;

    // Child stdout and stderr are merged and handed to `sink` as they arrive.
    [[nodiscard]] int run(const Command &command, const OutputSink &sink) const;

    [[nodiscard]] CommandResult capture(const Command &command) const;

  private:
    [[noreturn]] static void execute_in_child(const Command &command) noexcept;

    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace provision
