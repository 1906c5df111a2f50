#include "logging/logger.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <format>
#include <ios>
#include <ostream>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace provision {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view reset_style = "\033[0m";

constexpr int max_session_log_attempts = 100;

[[nodiscard]] std::string_view style_for(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Info:
        return "";
    case LogLevel::Warning:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Prompt:
        return "\033[36m";
    }

    return "";
}

} // namespace

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Prompt:
        return "PROMPT";
    }

    return "INFO";
}

Logger::Logger(fs::path log_file, std::ostream &display, bool use_color)
    : log_file_(std::move(log_file)), display_(display), use_color_(use_color) {}

void Logger::log(std::string_view message, LogLevel level) {
    const LogRecord record{.level = level, .message = std::string(message), .timestamp = std::chrono::system_clock::now()};
    write_record(record);
    render(record);
}

void Logger::append_output(std::string_view chunk) {
    auto &stream = file();
    stream.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    stream.flush();
}

void Logger::tool_output(std::string_view chunk) {
    display_ << chunk << std::flush;
    append_output(chunk);
}

const fs::path &Logger::log_file() const noexcept { return log_file_; }

fs::path Logger::session_log_path(const fs::path &directory, std::chrono::system_clock::time_point start_time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(start_time);
    std::tm local_time{};
    localtime_r(&seconds, &local_time);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &local_time);

    return directory / std::format("provision_log_{}.txt", stamp);
}

fs::path Logger::create_session_log(const fs::path &directory, std::chrono::system_clock::time_point start_time) {
    const fs::path base = session_log_path(directory, start_time);

    for (int attempt = 0; attempt < max_session_log_attempts; ++attempt) {
        fs::path candidate = base;
        if (attempt > 0) {
            candidate.replace_filename(std::format("{}_{}{}", base.stem().string(), attempt, base.extension().string()));
        }

        const int fd = open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd != -1) {
            close(fd);
            return candidate;
        }

        if (errno != EEXIST) {
            throw std::ios_base::failure(
                std::format("cannot create log file '{}': {}", candidate.string(), std::strerror(errno)));
        }
    }

    throw std::ios_base::failure(std::format("no free log file name next to '{}'", base.string()));
}

std::ofstream &Logger::file() {
    if (!file_.is_open()) {
        file_.open(log_file_, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            throw std::ios_base::failure(std::format("cannot open log file '{}'", log_file_.string()));
        }

        file_.exceptions(std::ios::badbit | std::ios::failbit);
    }

    return file_;
}

void Logger::write_record(const LogRecord &record) {
    auto &stream = file();
    stream << to_string(record.level) << ": " << record.message << '\n';
    stream.flush();
}

void Logger::render(const LogRecord &record) {
    const auto style = style_for(record.level);
    if (use_color_ && !style.empty()) {
        display_ << style << record.message << reset_style << std::endl;
        return;
    }

    display_ << record.message << std::endl;
}

} // namespace provision
