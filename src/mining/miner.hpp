/**
 * @file miner.hpp
 * @brief Фоновый майнер
 *
 * Каждое уведомление о новом tip увеличивает счётчик поколений и
 * прерывает текущий перебор. Найденный блок отправляется, только если
 * его поколение всё ещё текущее: устаревшая работа не публикуется.
 */

#pragma once

#include "block_assembler.hpp"
#include "../core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace qtc::mining {

/**
 * @brief Настройки майнера
 */
struct MinerConfig {
    /// @brief Хешей между проверками поколения
    uint64_t hashes_per_round{1u << 16};

    /// @brief Пауза перед повтором, если шаблон недоступен
    std::chrono::milliseconds retry_interval{100};
};

/**
 * @brief Статистика майнера
 */
struct MinerStats {
    uint64_t templates{0};
    uint64_t blocks_found{0};

    /// @brief Блоки, найденные для устаревшего tip
    uint64_t stale_blocks{0};

    /// @brief Прерывания перебора из-за смены tip
    uint64_t aborts{0};
};

/**
 * @brief Источник шаблонов (вызывается из потока майнера)
 */
using TemplateProvider = std::function<Result<BlockTemplate>()>;

/**
 * @brief Получатель найденных блоков
 *
 * Получает поколение, для которого найден блок; получатель может
 * повторно проверить его через Miner::is_current под своей блокировкой.
 */
using BlockSink = std::function<void(const core::Block& block, uint64_t generation)>;

/**
 * @brief Майнер в отдельном потоке
 *
 * Thread-safe: notify_tip, stop и запросы можно вызывать из любого потока.
 */
class Miner {
public:
    Miner(MinerConfig config, TemplateProvider provider, BlockSink sink);
    ~Miner();

    Miner(const Miner&) = delete;
    Miner& operator=(const Miner&) = delete;

    /**
     * @brief Запустить поток майнинга
     */
    void start();

    /**
     * @brief Остановить поток и дождаться его завершения
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Сообщить о смене tip: прервать перебор и начать заново
     */
    void notify_tip();

    /**
     * @brief Текущее поколение
     */
    [[nodiscard]] uint64_t generation() const noexcept;

    /**
     * @brief Является ли поколение текущим
     */
    [[nodiscard]] bool is_current(uint64_t generation) const noexcept;

    [[nodiscard]] MinerStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qtc::mining
