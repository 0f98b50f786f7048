/**
 * @file network_time.hpp
 * @brief Время узла с поправкой на медианное смещение пиров
 *
 * Проверка "timestamp не дальше 2 часов в будущем" выполняется
 * относительно скорректированного времени. Смещения пиров поступают
 * извне (транспорт не входит в ядро); без них поправка нулевая.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace qtc::core {

/**
 * @brief Источник скорректированного времени
 *
 * Thread-safe.
 */
class NetworkTime {
public:
    /// @brief Функция, возвращающая текущий Unix time в секундах
    using Clock = std::function<int64_t()>;

    /// @brief Максимальная применяемая поправка (70 минут)
    static constexpr int64_t MAX_OFFSET = 70 * 60;

    /// @brief Количество хранимых образцов
    static constexpr std::size_t MAX_SAMPLES = 200;

    /**
     * @param clock Источник системного времени (по умолчанию system_clock)
     */
    explicit NetworkTime(Clock clock = {});

    /**
     * @brief Добавить смещение времени пира (peer_time - local_time)
     */
    void add_sample(int64_t offset_seconds);

    /**
     * @brief Текущая поправка: медиана образцов, 0 если она вне MAX_OFFSET
     *        или образцов меньше 5
     */
    [[nodiscard]] int64_t offset() const;

    /**
     * @brief Системное время без поправки
     */
    [[nodiscard]] int64_t local_now() const;

    /**
     * @brief Скорректированное время
     */
    [[nodiscard]] int64_t now() const;

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<int64_t> samples_;
};

} // namespace qtc::core
