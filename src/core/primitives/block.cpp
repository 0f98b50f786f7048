/**
 * @file block.cpp
 * @brief Реализация блока
 */

#include "block.hpp"
#include "merkle.hpp"

#include <format>

namespace qtc::core {

using serialization::ReadStream;
using serialization::StreamError;
using serialization::WriteStream;

std::vector<Hash256> Block::txids() const {
    std::vector<Hash256> ids;
    ids.reserve(transactions.size());
    for (const auto& tx : transactions) {
        ids.push_back(tx.txid());
    }
    return ids;
}

Hash256 Block::compute_merkle_root() const {
    return core::compute_merkle_root(txids());
}

Bytes Block::serialize() const {
    WriteStream stream(serialized_size());
    auto header_bytes = header.serialize();
    stream.write_bytes(header_bytes);
    stream.write_varint(transactions.size());
    for (const auto& tx : transactions) {
        tx.write(stream);
    }
    return stream.take_data();
}

std::size_t Block::serialized_size() const {
    std::size_t size = BLOCK_HEADER_SIZE + serialization::varint_size(transactions.size());
    for (const auto& tx : transactions) {
        size += tx.serialized_size();
    }
    return size;
}

Result<Block> Block::decode(ByteSpan data) {
    if (data.size() < BLOCK_HEADER_SIZE) {
        return Err<Block>(
            ErrorCode::DecodeTruncated,
            std::format("Блок короче заголовка: {} байт", data.size())
        );
    }

    try {
        Block block;
        block.header = BlockHeader::deserialize(data.first<BLOCK_HEADER_SIZE>());

        ReadStream stream(data.subspan(BLOCK_HEADER_SIZE));
        std::size_t count = stream.read_count(MAX_BLOCK_ITEMS);
        block.transactions.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            block.transactions.push_back(Transaction::read(stream));
        }

        if (!stream.eof()) {
            return Err<Block>(
                ErrorCode::DecodeTrailingData,
                std::format("{} лишних байт после блока", stream.remaining())
            );
        }
        return block;
    } catch (const StreamError& e) {
        return Err<Block>(ErrorCode::DecodeMalformed, e.what());
    }
}

} // namespace qtc::core
