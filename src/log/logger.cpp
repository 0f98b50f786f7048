/**
 * @file logger.cpp
 * @brief Реализация консольного журнала
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace qtc::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* CYAN = "\033[36m";
}

namespace {

const char* level_color(Level level) noexcept {
    switch (level) {
        case Level::Error: return ansi::RED;
        case Level::Warn:  return ansi::YELLOW;
        case Level::Info:  return ansi::GREEN;
        case Level::Debug: return ansi::CYAN;
        default: return ansi::RESET;
    }
}

std::string current_time() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

Result<Level> parse_level(std::string_view name) {
    if (name == "error") return Level::Error;
    if (name == "warn") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return Err<Level>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: {}", name)
    );
}

// =============================================================================
// Реализация
// =============================================================================

struct Logger::Impl {
    mutable std::mutex mutex;
    Level level = Level::Info;
    bool color = false;
    std::ostream* output = nullptr;

    std::ostream& stream() const {
        return output != nullptr ? *output : std::clog;
    }
};

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::set_level(Level level) {
    std::lock_guard lock(impl_->mutex);
    impl_->level = level;
}

Level Logger::level() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->level;
}

void Logger::set_color(bool enabled) {
    std::lock_guard lock(impl_->mutex);
    impl_->color = enabled;
}

void Logger::set_output(std::ostream* stream) {
    std::lock_guard lock(impl_->mutex);
    impl_->output = stream;
}

bool Logger::enabled(Level level) const {
    std::lock_guard lock(impl_->mutex);
    return static_cast<int>(level) <= static_cast<int>(impl_->level);
}

std::string Logger::format_line(
    Level level,
    std::string_view component,
    std::string_view message
) {
    return std::format("[{}] [{}] [{}] {}", current_time(), to_string(level), component, message);
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
    std::lock_guard lock(impl_->mutex);
    if (static_cast<int>(level) > static_cast<int>(impl_->level)) {
        return;
    }

    auto& out = impl_->stream();
    if (impl_->color) {
        out << ansi::DIM << "[" << current_time() << "]" << ansi::RESET << " "
            << level_color(level) << "[" << to_string(level) << "]" << ansi::RESET
            << " [" << component << "] " << message << '\n';
    } else {
        out << format_line(level, component, message) << '\n';
    }
    out.flush();
}

} // namespace qtc::log
