/**
 * @file transaction.cpp
 * @brief Реализация транзакции
 */

#include "transaction.hpp"
#include "../../crypto/sha256.hpp"

#include <format>
#include <limits>

namespace qtc::core {

using serialization::ReadStream;
using serialization::StreamError;
using serialization::WriteStream;

namespace {

void write_transaction(WriteStream& stream, const Transaction& tx, bool with_signatures) {
    stream.write_i32_le(tx.version);

    stream.write_varint(tx.inputs.size());
    for (const auto& input : tx.inputs) {
        stream.write_hash256(input.prevout.txid);
        stream.write_u32_le(input.prevout.index);
        stream.write_var_bytes(input.public_key);
        if (with_signatures) {
            stream.write_var_bytes(input.signature);
        } else {
            stream.write_varint(0);
        }
    }

    stream.write_varint(tx.outputs.size());
    for (const auto& output : tx.outputs) {
        stream.write_i64_le(output.amount);
        stream.write_hash256(output.lock);
    }

    stream.write_u32_le(tx.lock_time);
}

} // namespace

void Transaction::write(WriteStream& stream) const {
    write_transaction(stream, *this, true);
}

Bytes Transaction::serialize() const {
    WriteStream stream(serialized_size());
    write(stream);
    return stream.take_data();
}

Transaction Transaction::read(ReadStream& stream) {
    Transaction tx;
    tx.version = stream.read_i32_le();

    std::size_t input_count = stream.read_count(MAX_TX_ITEMS);
    tx.inputs.reserve(input_count);
    for (std::size_t i = 0; i < input_count; ++i) {
        TxIn input;
        input.prevout.txid = stream.read_hash256();
        input.prevout.index = stream.read_u32_le();
        input.public_key = stream.read_var_bytes(MAX_PUBLIC_KEY_SIZE);
        input.signature = stream.read_var_bytes(MAX_SIGNATURE_SIZE);
        tx.inputs.push_back(std::move(input));
    }

    std::size_t output_count = stream.read_count(MAX_TX_ITEMS);
    tx.outputs.reserve(output_count);
    for (std::size_t i = 0; i < output_count; ++i) {
        TxOut output;
        output.amount = stream.read_i64_le();
        output.lock = stream.read_hash256();
        tx.outputs.push_back(output);
    }

    tx.lock_time = stream.read_u32_le();
    return tx;
}

Result<Transaction> Transaction::decode(ByteSpan data) {
    try {
        ReadStream stream(data);
        auto tx = read(stream);
        if (!stream.eof()) {
            return Err<Transaction>(
                ErrorCode::DecodeTrailingData,
                std::format("{} лишних байт после транзакции", stream.remaining())
            );
        }
        return tx;
    } catch (const StreamError& e) {
        return Err<Transaction>(ErrorCode::DecodeMalformed, e.what());
    }
}

std::size_t Transaction::serialized_size() const {
    using serialization::varint_size;

    std::size_t size = 4 + varint_size(inputs.size());
    for (const auto& input : inputs) {
        size += 32 + 4;
        size += varint_size(input.public_key.size()) + input.public_key.size();
        size += varint_size(input.signature.size()) + input.signature.size();
    }
    size += varint_size(outputs.size()) + outputs.size() * (8 + 32);
    size += 4;
    return size;
}

Hash256 Transaction::txid() const {
    auto bytes = serialize();
    return crypto::sha256d(bytes);
}

Hash256 Transaction::signature_hash() const {
    WriteStream stream(serialized_size());
    write_transaction(stream, *this, false);
    return crypto::sha256d(stream.data());
}

std::optional<Amount> Transaction::total_output() const noexcept {
    Amount total = 0;
    for (const auto& output : outputs) {
        if (output.amount < 0 ||
            total > std::numeric_limits<Amount>::max() - output.amount) {
            return std::nullopt;
        }
        total += output.amount;
    }
    return total;
}

} // namespace qtc::core
