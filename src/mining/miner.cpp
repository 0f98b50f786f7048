/**
 * @file miner.cpp
 * @brief Реализация фонового майнера
 */

#include "miner.hpp"
#include "../log/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

namespace qtc::mining {

namespace {

constexpr const char* COMPONENT = "Miner";

} // namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct Miner::Impl {
    MinerConfig config;
    TemplateProvider provider;
    BlockSink sink;

    std::atomic<bool> running{false};
    std::atomic<bool> abort{false};
    std::atomic<uint64_t> generation{0};

    std::atomic<uint64_t> templates{0};
    std::atomic<uint64_t> blocks_found{0};
    std::atomic<uint64_t> stale_blocks{0};
    std::atomic<uint64_t> aborts{0};

    std::mutex wait_mutex;
    std::condition_variable wait_cv;
    std::thread thread;

    Impl(MinerConfig cfg, TemplateProvider p, BlockSink s)
        : config(cfg)
        , provider(std::move(p))
        , sink(std::move(s)) {}

    /**
     * @brief Подождать смены поколения, остановки или таймаута
     */
    void wait_for_change(uint64_t gen) {
        std::unique_lock<std::mutex> lock(wait_mutex);
        wait_cv.wait_for(lock, config.retry_interval, [&] {
            return !running.load() || generation.load() != gen;
        });
    }

    void run() {
        log::info(COMPONENT, "Майнер запущен");

        while (running.load()) {
            abort.store(false);
            const uint64_t gen = generation.load();

            auto tmpl = provider();
            if (!tmpl) {
                log::debug(COMPONENT, std::format("Шаблон недоступен: {}", tmpl.error().message));
                wait_for_change(gen);
                continue;
            }
            ++templates;

            auto& block = tmpl->block;
            auto result = SearchResult::Exhausted;
            while (running.load() && generation.load() == gen) {
                result = BlockAssembler::search(block, abort, config.hashes_per_round);
                if (result != SearchResult::Exhausted) {
                    break;
                }
            }

            const bool superseded = result == SearchResult::Exhausted && generation.load() != gen;
            if (result == SearchResult::Cancelled || superseded) {
                ++aborts;
                log::debug(COMPONENT, std::format("Перебор на высоте {} прерван", tmpl->height));
                continue;
            }
            if (result != SearchResult::Found) {
                continue;
            }

            if (generation.load() != gen) {
                ++stale_blocks;
                log::debug(COMPONENT, std::format("Блок на высоте {} устарел, отброшен", tmpl->height));
                continue;
            }

            ++blocks_found;
            log::info(COMPONENT, std::format("Найден блок на высоте {}: {}, nonce {}",
                tmpl->height, hash_to_hex(block.hash()), block.header.nonce));
            sink(block, gen);

            // Без смены tip не повторяем тот же шаблон сразу
            wait_for_change(gen);
        }

        log::info(COMPONENT, "Майнер остановлен");
    }
};

// =============================================================================
// Публичный API
// =============================================================================

Miner::Miner(MinerConfig config, TemplateProvider provider, BlockSink sink)
    : impl_(std::make_unique<Impl>(config, std::move(provider), std::move(sink))) {}

Miner::~Miner() {
    stop();
}

void Miner::start() {
    if (impl_->running.exchange(true)) {
        return;  // Уже запущен
    }
    impl_->abort.store(false);
    impl_->thread = std::thread([this]() {
        impl_->run();
    });
}

void Miner::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->running.store(false);
        impl_->abort.store(true);
    }
    impl_->wait_cv.notify_all();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
}

bool Miner::is_running() const noexcept {
    return impl_->running.load();
}

void Miner::notify_tip() {
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->generation.fetch_add(1);
        impl_->abort.store(true);
    }
    impl_->wait_cv.notify_all();
}

uint64_t Miner::generation() const noexcept {
    return impl_->generation.load();
}

bool Miner::is_current(uint64_t generation) const noexcept {
    return impl_->generation.load() == generation;
}

MinerStats Miner::stats() const {
    MinerStats stats;
    stats.templates = impl_->templates.load();
    stats.blocks_found = impl_->blocks_found.load();
    stats.stale_blocks = impl_->stale_blocks.load();
    stats.aborts = impl_->aborts.load();
    return stats;
}

} // namespace qtc::mining
