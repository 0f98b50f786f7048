/**
 * @file test_transaction.cpp
 * @brief Тесты транзакций: кодировка, txid, хеш подписи, подпись входов
 */

#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "test_helpers.hpp"
#include "chain/tx_signer.hpp"
#include "core/primitives/transaction.hpp"
#include "crypto/dilithium.hpp"

namespace qtc::tests {

/**
 * @brief Класс тестов для Transaction
 */
class TransactionTest : public ::testing::Test {
protected:
    static core::Transaction sample() {
        core::Transaction tx;
        core::TxIn input;
        input.prevout.txid[0] = 0x11;
        input.prevout.index = 3;
        input.public_key = Bytes(16, 0x22);
        input.signature = Bytes(8, 0x33);
        tx.inputs.push_back(input);

        Hash256 lock{};
        lock[31] = 0x44;
        tx.outputs.push_back(core::TxOut{5000, lock});
        tx.outputs.push_back(core::TxOut{7000, lock});
        tx.lock_time = 9;
        return tx;
    }
};

/**
 * @brief Тест: структура канонической кодировки
 */
TEST_F(TransactionTest, Encoding) {
    auto tx = sample();
    auto bytes = tx.serialize();

    // version + count + (32 + 4 + 1 + 16 + 1 + 8) + count + 2 × 40 + lock_time
    EXPECT_EQ(bytes.size(), 4u + 1 + 62 + 1 + 80 + 4);
    EXPECT_EQ(bytes.size(), tx.serialized_size());

    EXPECT_EQ(bytes[0], 0x01);  // version
    EXPECT_EQ(bytes[4], 0x01);  // один вход
    EXPECT_EQ(bytes[5], 0x11);  // txid
    EXPECT_EQ(bytes[37], 0x03); // index
    EXPECT_EQ(bytes[41], 16);   // длина ключа
    EXPECT_EQ(bytes.back(), 0x00);
    EXPECT_EQ(bytes[bytes.size() - 4], 0x09);
}

/**
 * @brief Тест: декодирование восстанавливает транзакцию и txid
 */
TEST_F(TransactionTest, Decode) {
    auto tx = sample();
    auto decoded = core::Transaction::decode(tx.serialize());
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, tx);
    EXPECT_EQ(decoded->txid(), tx.txid());

    auto bytes = tx.serialize();
    bytes.push_back(0);
    auto trailing = core::Transaction::decode(bytes);
    ASSERT_FALSE(trailing.has_value());
    EXPECT_EQ(trailing.error().code, ErrorCode::DecodeTrailingData);

    auto truncated = core::Transaction::decode(ByteSpan{bytes.data(), 10});
    EXPECT_FALSE(truncated.has_value());
}

/**
 * @brief Тест: txid покрывает подписи, хеш подписи - нет
 */
TEST_F(TransactionTest, SignatureHashExcludesSignatures) {
    auto tx = sample();
    auto other = tx;
    other.inputs[0].signature = Bytes(8, 0x99);

    EXPECT_NE(tx.txid(), other.txid());
    EXPECT_EQ(tx.signature_hash(), other.signature_hash());

    // Публичный ключ и выходы покрыты хешем подписи
    auto key_changed = tx;
    key_changed.inputs[0].public_key[0] ^= 1;
    EXPECT_NE(key_changed.signature_hash(), tx.signature_hash());

    auto amount_changed = tx;
    amount_changed.outputs[1].amount += 1;
    EXPECT_NE(amount_changed.signature_hash(), tx.signature_hash());
}

/**
 * @brief Тест: coinbase и сумма выходов
 */
TEST_F(TransactionTest, CoinbaseAndTotals) {
    core::Transaction coinbase;
    coinbase.lock_time = 5;
    coinbase.outputs.push_back(core::TxOut{100, Hash256{}});
    EXPECT_TRUE(coinbase.is_coinbase());
    EXPECT_FALSE(sample().is_coinbase());

    auto total = sample().total_output();
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 12000);

    auto negative = sample();
    negative.outputs[0].amount = -1;
    EXPECT_FALSE(negative.total_output().has_value());

    auto overflow = sample();
    overflow.outputs[0].amount = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(overflow.total_output().has_value());

    // lock_time делает txid coinbase уникальным по высоте
    auto next = coinbase;
    next.lock_time = 6;
    EXPECT_NE(next.txid(), coinbase.txid());
}

/**
 * @brief Тест: подписанные входы проходят проверку Dilithium2
 */
TEST_F(TransactionTest, SignAndVerify) {
    auto key = make_key();
    auto tx = make_spend({core::OutPoint{Hash256{}, 0}, core::OutPoint{Hash256{}, 1}}, key,
                         {core::TxOut{1000, key.lock}});

    ASSERT_EQ(tx.inputs.size(), 2u);
    const auto sighash = tx.signature_hash();
    for (const auto& input : tx.inputs) {
        EXPECT_EQ(input.public_key, key.pair.public_key);
        EXPECT_EQ(input.signature.size(), crypto::DILITHIUM2_SIGNATURE_SIZE);
        EXPECT_TRUE(crypto::verify(input.public_key, sighash, input.signature));
    }

    // Изменение выхода делает подпись недействительной
    tx.outputs[0].amount = 2000;
    EXPECT_FALSE(crypto::verify(tx.inputs[0].public_key, tx.signature_hash(), tx.inputs[0].signature));
}

/**
 * @brief Тест: количество ключей должно совпадать с количеством входов
 */
TEST_F(TransactionTest, SignerRejectsKeyCountMismatch) {
    auto key = make_key();
    auto tx = sample();
    std::vector<const crypto::KeyPair*> keys{&key.pair, &key.pair};

    auto result = chain::sign_transaction(tx, keys);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CryptoInvalidLength);
}

/**
 * @brief Тест: подпись неверной длины отвергается без обращения к liboqs
 */
TEST_F(TransactionTest, VerifyRejectsWrongLengths) {
    auto key = make_key();
    Hash256 message{};
    auto signature = crypto::sign(key.pair.secret_key, message);
    ASSERT_TRUE(signature.has_value());

    EXPECT_TRUE(crypto::verify(key.pair.public_key, message, *signature));
    EXPECT_FALSE(crypto::verify(Bytes(10, 0), message, *signature));
    EXPECT_FALSE(crypto::verify(key.pair.public_key, message, Bytes(10, 0)));
}

} // namespace qtc::tests
