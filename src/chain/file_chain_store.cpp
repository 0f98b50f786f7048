/**
 * @file file_chain_store.cpp
 * @brief Реализация файлового хранилища
 */

#include "file_chain_store.hpp"
#include "../core/constants.hpp"
#include "../core/byte_order.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/sha256.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace qtc::chain {

using core::serialization::ReadStream;
using core::serialization::StreamError;
using core::serialization::WriteStream;

namespace {

/// @brief Размер заголовка записи: magic + type + length
constexpr std::size_t RECORD_HEADER_SIZE = 4 + 1 + 4;

/// @brief Размер контрольной суммы записи
constexpr std::size_t RECORD_CHECKSUM_SIZE = 4;

/// @brief Предел количества элементов дельты при чтении
constexpr std::size_t MAX_DELTA_ITEMS = 10'000'000;

constexpr const char* COMPONENT = "Storage";

std::array<uint8_t, RECORD_CHECKSUM_SIZE> checksum(ByteSpan payload) {
    auto digest = crypto::sha256d(payload);
    std::array<uint8_t, RECORD_CHECKSUM_SIZE> result{};
    std::copy_n(digest.begin(), RECORD_CHECKSUM_SIZE, result.begin());
    return result;
}

std::string errno_message(std::string_view what) {
    return std::format("{}: {}", what, std::strerror(errno));
}

// =============================================================================
// Ввод/вывод
// =============================================================================

bool write_all(int fd, ByteSpan data, uint64_t offset) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd, data.data() + written, data.size() - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

/**
 * @brief Прочитать ровно size байт
 *
 * @return false при ошибке или конце файла
 */
bool read_exact(int fd, uint64_t offset, MutableByteSpan out) {
    std::size_t done = 0;
    while (done < out.size()) {
        ssize_t n = ::pread(fd, out.data() + done, out.size() - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool sync_fd(int fd) {
    return ::fsync(fd) == 0;
}

bool sync_directory(const std::filesystem::path& directory) {
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return false;
    }
    bool ok = sync_fd(fd);
    ::close(fd);
    return ok;
}

// =============================================================================
// Кодирование записей
// =============================================================================

void write_coin_entry(WriteStream& stream, const CoinEntry& entry) {
    stream.write_hash256(entry.outpoint.txid);
    stream.write_u32_le(entry.outpoint.index);
    stream.write_i64_le(entry.coin.out.amount);
    stream.write_hash256(entry.coin.out.lock);
    stream.write_u32_le(entry.coin.height);
    stream.write_u8(entry.coin.coinbase ? 1 : 0);
}

CoinEntry read_coin_entry(ReadStream& stream) {
    CoinEntry entry;
    entry.outpoint.txid = stream.read_hash256();
    entry.outpoint.index = stream.read_u32_le();
    entry.coin.out.amount = stream.read_i64_le();
    entry.coin.out.lock = stream.read_hash256();
    entry.coin.height = stream.read_u32_le();
    uint8_t coinbase = stream.read_u8();
    if (coinbase > 1) {
        throw StreamError("Некорректный флаг coinbase");
    }
    entry.coin.coinbase = coinbase == 1;
    return entry;
}

void write_entries(WriteStream& stream, const std::vector<CoinEntry>& entries) {
    stream.write_varint(entries.size());
    for (const auto& entry : entries) {
        write_coin_entry(stream, entry);
    }
}

std::vector<CoinEntry> read_entries(ReadStream& stream) {
    std::size_t count = stream.read_count(MAX_DELTA_ITEMS);
    std::vector<CoinEntry> entries;
    entries.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        entries.push_back(read_coin_entry(stream));
    }
    return entries;
}

void write_meta(WriteStream& stream, const ChainMeta& meta) {
    stream.write_hash256(meta.tip_hash);
    stream.write_u32_le(meta.height);
    stream.write_hash256(meta.chain_work.to_hash256());
    stream.write_i64_le(meta.total_minted);
}

ChainMeta read_meta(ReadStream& stream) {
    ChainMeta meta;
    meta.tip_hash = stream.read_hash256();
    meta.height = stream.read_u32_le();
    meta.chain_work = core::uint256{stream.read_hash256()};
    meta.total_minted = stream.read_i64_le();
    return meta;
}

Bytes encode_commit(const CommitRecord& record) {
    WriteStream stream;
    stream.write_u8(static_cast<uint8_t>(record.kind));
    stream.write_hash256(record.block_hash);
    stream.write_u32_le(record.height);
    write_meta(stream, record.meta);
    write_entries(stream, record.delta.spent);
    write_entries(stream, record.delta.created);
    return stream.take_data();
}

CommitRecord decode_commit(ByteSpan payload) {
    ReadStream stream(payload);
    CommitRecord record;
    uint8_t kind = stream.read_u8();
    if (kind != static_cast<uint8_t>(CommitKind::Connect) &&
        kind != static_cast<uint8_t>(CommitKind::Disconnect)) {
        throw StreamError(std::format("Неизвестный тип фиксации {}", kind));
    }
    record.kind = static_cast<CommitKind>(kind);
    record.block_hash = stream.read_hash256();
    record.height = stream.read_u32_le();
    record.meta = read_meta(stream);
    record.delta.spent = read_entries(stream);
    record.delta.created = read_entries(stream);
    if (!stream.eof()) {
        throw StreamError("Лишние данные в записи фиксации");
    }
    return record;
}

} // namespace

// =============================================================================
// Открытие
// =============================================================================

FileChainStore::FileChainStore(
    std::filesystem::path directory,
    FileStoreOptions options,
    int fd,
    uint64_t size
)
    : directory_(std::move(directory))
    , options_(options)
    , fd_(fd)
    , log_size_(size) {}

FileChainStore::~FileChainStore() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Result<std::unique_ptr<FileChainStore>> FileChainStore::open(
    const std::filesystem::path& directory,
    FileStoreOptions options
) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return Err<std::unique_ptr<FileChainStore>>(
            ErrorCode::StorageOpenFailed,
            std::format("Не удалось создать каталог {}: {}", directory.string(), ec.message())
        );
    }

    const auto log_path = directory / LOG_FILE;
    int fd = ::open(log_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Err<std::unique_ptr<FileChainStore>>(
            ErrorCode::StorageOpenFailed,
            errno_message(std::format("Не удалось открыть {}", log_path.string()))
        );
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        auto message = errno_message("fstat");
        ::close(fd);
        return Err<std::unique_ptr<FileChainStore>>(ErrorCode::StorageOpenFailed, message);
    }

    return std::unique_ptr<FileChainStore>(
        new FileChainStore(directory, options, fd, static_cast<uint64_t>(st.st_size))
    );
}

// =============================================================================
// Запись
// =============================================================================

Result<uint64_t> FileChainStore::append_record(LogRecordType type, ByteSpan payload) {
    if (write_failed_) {
        return Err<uint64_t>(ErrorCode::StorageWriteFailed, "Хранилище в режиме только чтения после ошибки");
    }
    if (payload.size() > constants::MAX_LOG_RECORD_SIZE) {
        return Err<uint64_t>(
            ErrorCode::StorageWriteFailed,
            std::format("Запись слишком велика: {} байт", payload.size())
        );
    }

    Bytes record;
    record.reserve(RECORD_HEADER_SIZE + payload.size() + RECORD_CHECKSUM_SIZE);
    record.resize(RECORD_HEADER_SIZE);
    write_le32(record.data(), constants::LOG_RECORD_MAGIC);
    record[4] = static_cast<uint8_t>(type);
    write_le32(record.data() + 5, static_cast<uint32_t>(payload.size()));
    record.insert(record.end(), payload.begin(), payload.end());
    auto sum = checksum(payload);
    record.insert(record.end(), sum.begin(), sum.end());

    const uint64_t start = log_size_;
    if (!write_all(fd_, record, start) || (options_.fsync && !sync_fd(fd_))) {
        auto message = errno_message("Ошибка записи chain.log");
        write_failed_ = true;
        // Попытка убрать оборванную запись; при неудаче её усечёт recover()
        if (::ftruncate(fd_, static_cast<off_t>(start)) != 0) {
            log::warn(COMPONENT, errno_message("Не удалось усечь chain.log"));
        }
        return Err<uint64_t>(ErrorCode::StorageWriteFailed, message);
    }

    log_size_ = start + record.size();
    return start + RECORD_HEADER_SIZE;
}

Result<void> FileChainStore::put_block(const core::Block& block) {
    const auto hash = block.hash();
    if (index_.has_block(hash)) {
        return {};
    }

    auto payload = block.serialize();
    auto offset = append_record(LogRecordType::Block, payload);
    if (!offset) {
        return std::unexpected(offset.error());
    }
    positions_[hash] = BlockPosition{*offset, static_cast<uint32_t>(payload.size())};
    index_.add_block(hash);
    return {};
}

Result<void> FileChainStore::commit(const CommitRecord& record) {
    auto written = append_record(LogRecordType::Commit, encode_commit(record));
    if (!written) {
        return std::unexpected(written.error());
    }
    index_.apply_commit(record);

    if (options_.snapshot_interval > 0 && ++commits_since_snapshot_ >= options_.snapshot_interval) {
        if (auto snapshot = write_snapshot(); !snapshot) {
            // Журнал уже содержит запись, снимок только ускоряет восстановление
            log::warn(COMPONENT, std::format("Снимок не записан: {}", snapshot.error().message));
        }
    }
    return {};
}

Result<void> FileChainStore::mark_invalid(const Hash256& hash) {
    auto written = append_record(LogRecordType::Invalid, hash);
    if (!written) {
        return std::unexpected(written.error());
    }
    index_.add_invalid(hash);
    return {};
}

Result<void> FileChainStore::write_snapshot() {
    WriteStream stream;
    stream.write_u32_le(constants::SNAPSHOT_MAGIC);
    stream.write_u32_le(constants::SNAPSHOT_VERSION);
    stream.write_u64_le(log_size_);

    const auto& meta = index_.meta();
    stream.write_u8(meta ? 1 : 0);
    if (meta) {
        write_meta(stream, *meta);
    }

    const auto& utxo = index_.utxo();
    stream.write_u64_le(utxo.size());
    utxo.for_each([&](const core::OutPoint& outpoint, const Coin& coin) {
        write_coin_entry(stream, CoinEntry{outpoint, coin});
    });

    auto data = stream.take_data();
    auto sum = checksum(data);
    data.insert(data.end(), sum.begin(), sum.end());

    const auto path = directory_ / SNAPSHOT_FILE;
    const auto tmp_path = directory_ / (std::string(SNAPSHOT_FILE) + ".tmp");

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Err<void>(ErrorCode::StorageWriteFailed, errno_message("Не удалось создать снимок"));
    }
    const bool written = write_all(fd, data, 0) && (!options_.fsync || sync_fd(fd));
    ::close(fd);
    if (!written) {
        return Err<void>(ErrorCode::StorageWriteFailed, errno_message("Ошибка записи снимка"));
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return Err<void>(
            ErrorCode::StorageWriteFailed,
            std::format("Не удалось переименовать снимок: {}", ec.message())
        );
    }
    if (options_.fsync && !sync_directory(directory_)) {
        return Err<void>(ErrorCode::StorageWriteFailed, errno_message("fsync каталога"));
    }

    commits_since_snapshot_ = 0;
    log::debug(COMPONENT, std::format("Снимок UTXO записан: {} выходов, смещение {}", utxo.size(), log_size_));
    return {};
}

// =============================================================================
// Чтение
// =============================================================================

std::optional<ChainMeta> FileChainStore::read_tip() const {
    return index_.meta();
}

Result<core::Block> FileChainStore::read_block(const Hash256& hash) const {
    auto it = positions_.find(hash);
    if (it == positions_.end()) {
        return Err<core::Block>(
            ErrorCode::QueryNotFound,
            std::format("Блок {} не найден", hash_to_hex(hash))
        );
    }

    Bytes payload(it->second.size);
    if (!read_exact(fd_, it->second.offset, payload)) {
        return Err<core::Block>(ErrorCode::StorageReadFailed, errno_message("Ошибка чтения блока"));
    }
    auto block = core::Block::decode(payload);
    if (!block) {
        return Err<core::Block>(ErrorCode::StorageCorrupted, block.error().message);
    }
    return block;
}

Result<core::Block> FileChainStore::read_block(uint32_t height) const {
    auto hash = index_.hash_at(height);
    if (!hash) {
        return Err<core::Block>(
            ErrorCode::QueryNotFound,
            std::format("Нет блока на высоте {}", height)
        );
    }
    return read_block(*hash);
}

Result<BlockUndo> FileChainStore::read_undo(const Hash256& hash) const {
    return index_.undo(hash);
}

// =============================================================================
// Восстановление
// =============================================================================

std::optional<uint64_t> FileChainStore::load_snapshot() {
    const auto path = directory_ / SNAPSHOT_FILE;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        log::warn(COMPONENT, errno_message("Не удалось открыть снимок"));
        return std::nullopt;
    }
    struct stat st{};
    Bytes data;
    bool ok = ::fstat(fd, &st) == 0;
    if (ok) {
        data.resize(static_cast<std::size_t>(st.st_size));
        ok = read_exact(fd, 0, data);
    }
    ::close(fd);

    if (!ok || data.size() < RECORD_CHECKSUM_SIZE) {
        log::warn(COMPONENT, "Снимок не прочитан, воспроизводим журнал целиком");
        return std::nullopt;
    }

    const ByteSpan body(data.data(), data.size() - RECORD_CHECKSUM_SIZE);
    auto expected = checksum(body);
    if (!std::equal(expected.begin(), expected.end(), data.end() - RECORD_CHECKSUM_SIZE)) {
        log::warn(COMPONENT, "Контрольная сумма снимка не совпадает, снимок пропущен");
        return std::nullopt;
    }

    try {
        ReadStream stream(body);
        if (stream.read_u32_le() != constants::SNAPSHOT_MAGIC ||
            stream.read_u32_le() != constants::SNAPSHOT_VERSION) {
            log::warn(COMPONENT, "Неизвестный формат снимка, снимок пропущен");
            return std::nullopt;
        }
        uint64_t offset = stream.read_u64_le();
        if (offset > log_size_) {
            log::warn(COMPONENT, "Снимок новее журнала, снимок пропущен");
            return std::nullopt;
        }

        std::optional<ChainMeta> meta;
        if (stream.read_u8() == 1) {
            meta = read_meta(stream);
        }

        UtxoSet utxo;
        uint64_t count = stream.read_u64_le();
        UtxoDelta delta;
        delta.created.reserve(static_cast<std::size_t>(std::min<uint64_t>(count, MAX_DELTA_ITEMS)));
        for (uint64_t i = 0; i < count; ++i) {
            delta.created.push_back(read_coin_entry(stream));
        }
        if (!stream.eof()) {
            throw StreamError("Лишние данные в снимке");
        }
        utxo.commit(delta);

        index_.restore(std::move(utxo), std::move(meta));
        return offset;
    } catch (const StreamError& e) {
        log::warn(COMPONENT, std::format("Снимок повреждён: {}", e.what()));
        return std::nullopt;
    }
}

Result<StoredChain> FileChainStore::recover() {
    index_.clear();
    positions_.clear();
    commits_since_snapshot_ = 0;

    const uint64_t snapshot_offset = load_snapshot().value_or(0);
    if (snapshot_offset == 0) {
        index_.restore(UtxoSet{}, std::nullopt);
    }

    uint64_t offset = 0;
    std::size_t records = 0;
    std::string torn_reason;

    while (offset < log_size_) {
        std::array<uint8_t, RECORD_HEADER_SIZE> header{};
        if (log_size_ - offset < RECORD_HEADER_SIZE || !read_exact(fd_, offset, header)) {
            torn_reason = "оборванный заголовок";
            break;
        }

        const uint32_t magic = read_le32(header.data());
        const uint8_t type = header[4];
        const uint32_t length = read_le32(header.data() + 5);
        if (magic != constants::LOG_RECORD_MAGIC || length > constants::MAX_LOG_RECORD_SIZE) {
            torn_reason = "некорректный заголовок";
            break;
        }

        const uint64_t record_size = RECORD_HEADER_SIZE + length + RECORD_CHECKSUM_SIZE;
        if (log_size_ - offset < record_size) {
            torn_reason = "оборванная запись";
            break;
        }

        Bytes body(length + RECORD_CHECKSUM_SIZE);
        if (!read_exact(fd_, offset + RECORD_HEADER_SIZE, body)) {
            return Err<StoredChain>(ErrorCode::StorageReadFailed, errno_message("Ошибка чтения chain.log"));
        }
        const ByteSpan payload(body.data(), length);
        auto sum = checksum(payload);
        if (!std::equal(sum.begin(), sum.end(), body.begin() + length)) {
            torn_reason = "неверная контрольная сумма";
            break;
        }

        const uint64_t payload_offset = offset + RECORD_HEADER_SIZE;
        try {
            switch (static_cast<LogRecordType>(type)) {
                case LogRecordType::Block: {
                    if (length < core::BLOCK_HEADER_SIZE) {
                        throw StreamError("Запись блока короче заголовка");
                    }
                    auto hash = crypto::sha256d(payload.first(core::BLOCK_HEADER_SIZE));
                    positions_[hash] = BlockPosition{payload_offset, length};
                    index_.add_block(hash);
                    break;
                }
                case LogRecordType::Commit: {
                    auto record = decode_commit(payload);
                    index_.apply_commit(record, offset >= snapshot_offset);
                    break;
                }
                case LogRecordType::Invalid: {
                    ReadStream stream(payload);
                    index_.add_invalid(stream.read_hash256());
                    break;
                }
                default:
                    throw StreamError(std::format("Неизвестный тип записи {}", type));
            }
        } catch (const StreamError& e) {
            // Контрольная сумма совпала, но содержимое некорректно
            return Err<StoredChain>(
                ErrorCode::StorageCorrupted,
                std::format("Запись на смещении {}: {}", offset, e.what())
            );
        }

        offset += record_size;
        ++records;
    }

    if (offset < log_size_) {
        log::warn(COMPONENT, std::format(
            "Усечение chain.log: {} на смещении {}, отброшено {} байт",
            torn_reason, offset, log_size_ - offset));
        if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0 || (options_.fsync && !sync_fd(fd_))) {
            return Err<StoredChain>(ErrorCode::StorageWriteFailed, errno_message("Не удалось усечь chain.log"));
        }
        log_size_ = offset;
    }

    log::info(COMPONENT, std::format(
        "Восстановлено {} записей журнала, снимок на смещении {}", records, snapshot_offset));
    return index_.snapshot();
}

} // namespace qtc::chain
