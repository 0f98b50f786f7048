/**
 * @file file_chain_store.hpp
 * @brief Хранилище цепочки на диске
 *
 * Каталог данных:
 * - chain.log: журнал записей только на дозапись
 * - utxo.snapshot: снимок UTXO set и метаданных на смещении журнала
 *
 * Формат записи журнала:
 * @code
 * [magic: 4][type: 1][length: 4][payload: length][checksum: 4]
 * @endcode
 * checksum - первые 4 байта SHA256d(payload). Каждая запись сбрасывается
 * на диск (fsync) до возврата из операции.
 *
 * Снимок записывается атомарно: временный файл, fsync, rename.
 *
 * Восстановление: загрузка снимка, воспроизведение записей после его
 * смещения, усечение оборванной или повреждённой последней записи.
 */

#pragma once

#include "chain_store.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <unordered_map>

namespace qtc::chain {

/**
 * @brief Настройки файлового хранилища
 */
struct FileStoreOptions {
    /// @brief Вызывать fsync после каждой записи
    bool fsync{true};

    /// @brief Период записи снимка UTXO (в фиксациях)
    uint64_t snapshot_interval{1000};
};

/**
 * @brief Тип записи журнала
 */
enum class LogRecordType : uint8_t {
    Block = 1,
    Commit = 2,
    Invalid = 3,
};

/**
 * @brief Файловое хранилище
 *
 * Не thread-safe: синхронизацию обеспечивает node::Node.
 */
class FileChainStore final : public ChainStore {
public:
    /// @brief Имя файла журнала
    static constexpr const char* LOG_FILE = "chain.log";

    /// @brief Имя файла снимка
    static constexpr const char* SNAPSHOT_FILE = "utxo.snapshot";

    /**
     * @brief Открыть или создать хранилище
     *
     * После открытия нужно вызвать recover().
     *
     * @param directory Каталог данных (создаётся при отсутствии)
     */
    [[nodiscard]] static Result<std::unique_ptr<FileChainStore>> open(
        const std::filesystem::path& directory,
        FileStoreOptions options = {}
    );

    ~FileChainStore() override;

    FileChainStore(const FileChainStore&) = delete;
    FileChainStore& operator=(const FileChainStore&) = delete;

    [[nodiscard]] Result<void> put_block(const core::Block& block) override;
    [[nodiscard]] Result<void> commit(const CommitRecord& record) override;
    [[nodiscard]] Result<void> mark_invalid(const Hash256& hash) override;
    [[nodiscard]] std::optional<ChainMeta> read_tip() const override;
    [[nodiscard]] Result<core::Block> read_block(const Hash256& hash) const override;
    [[nodiscard]] Result<core::Block> read_block(uint32_t height) const override;
    [[nodiscard]] Result<BlockUndo> read_undo(const Hash256& hash) const override;
    [[nodiscard]] Result<StoredChain> recover() override;

    /**
     * @brief Записать снимок UTXO set немедленно
     */
    [[nodiscard]] Result<void> write_snapshot();

    /**
     * @brief Текущий размер журнала в байтах
     */
    [[nodiscard]] uint64_t log_size() const noexcept {
        return log_size_;
    }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept {
        return directory_;
    }

private:
    /**
     * @brief Положение тела блока в журнале
     */
    struct BlockPosition {
        uint64_t offset{0};
        uint32_t size{0};
    };

    FileChainStore(std::filesystem::path directory, FileStoreOptions options, int fd, uint64_t size);

    /**
     * @brief Дописать запись в журнал
     *
     * @return Смещение payload записи
     */
    [[nodiscard]] Result<uint64_t> append_record(LogRecordType type, ByteSpan payload);

    /**
     * @brief Загрузить снимок; при отсутствии или повреждении - nullopt
     */
    [[nodiscard]] std::optional<uint64_t> load_snapshot();

    std::filesystem::path directory_;
    FileStoreOptions options_;
    int fd_{-1};
    uint64_t log_size_{0};

    /// @brief После ошибки записи хранилище только читает
    bool write_failed_{false};

    uint64_t commits_since_snapshot_{0};
    StoreIndex index_;
    std::unordered_map<Hash256, BlockPosition> positions_;
};

} // namespace qtc::chain
