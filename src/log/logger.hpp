/**
 * @file logger.hpp
 * @brief Консольный журнал узла
 *
 * Формат строки:
 * @code
 * [2025-01-01 12:00:00] [INFO] [Consensus] Блок принят: высота 12
 * @endcode
 *
 * Вывод сериализуется мьютексом; поток вывода можно заменить
 * (тесты перехватывают строки через std::ostringstream).
 */

#pragma once

#include "../core/types.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace qtc::log {

/**
 * @brief Уровень журнала
 */
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] Result<Level> parse_level(std::string_view name);

/**
 * @brief Журнал процесса
 *
 * Thread-safe.
 */
class Logger {
public:
    /**
     * @brief Глобальный экземпляр
     */
    [[nodiscard]] static Logger& instance();

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level level);
    [[nodiscard]] Level level() const;

    /**
     * @brief Включить ANSI цвета
     */
    void set_color(bool enabled);

    /**
     * @brief Заменить поток вывода
     *
     * @param stream Поток (должен пережить журнал) или nullptr для std::clog
     */
    void set_output(std::ostream* stream);

    /**
     * @brief Будет ли записано сообщение данного уровня
     */
    [[nodiscard]] bool enabled(Level level) const;

    /**
     * @brief Записать строку
     */
    void write(Level level, std::string_view component, std::string_view message);

    /**
     * @brief Сформировать строку без цветов (без записи)
     */
    [[nodiscard]] static std::string format_line(
        Level level,
        std::string_view component,
        std::string_view message
    );

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Удобные функции
// =============================================================================

inline void error(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Error, component, message);
}

inline void warn(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Warn, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Info, component, message);
}

inline void debug(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Debug, component, message);
}

} // namespace qtc::log
