#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <string>
#include <string_view>

namespace provision {

enum class LogLevel {
    Info,
    Warning,
    Error,
    Prompt,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

class Logger {
  public:
    Logger(std::filesystem::path log_file, std::ostream &display, bool use_color = false);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    void log(std::string_view message, LogLevel level = LogLevel::Info);

    void info(std::string_view message) { log(message, LogLevel::Info); }
    void warning(std::string_view message) { log(message, LogLevel::Warning); }
    void error(std::string_view message) { log(message, LogLevel::Error); }
    void prompt(std::string_view message) { log(message, LogLevel::Prompt); }

    // Raw text from external tools, kept in the file without a level prefix.
    void append_output(std::string_view chunk);

    // External tool output shown on the display and kept in the file.
    void tool_output(std::string_view chunk);

    [[nodiscard]] const std::filesystem::path &log_file() const noexcept;

    [[nodiscard]] static std::filesystem::path session_log_path(
        const std::filesystem::path &directory, std::chrono::system_clock::time_point start_time);

    // Creates an empty log file named after `start_time` that no other run owns.
    // A name already on disk gets a numeric suffix instead of being shared.
    [[nodiscard]] static std::filesystem::path create_session_log(
        const std::filesystem::path &directory, std::chrono::system_clock::time_point start_time);

  private:
    std::filesystem::path log_file_;
    std::ostream &display_;
    bool use_color_;
    std::ofstream file_;

    std::ofstream &file();
    void write_record(const LogRecord &record);
    void render(const LogRecord &record);
};

} // namespace provision
