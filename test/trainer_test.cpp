// see LICENSE.md for license.
#include "test_util.hpp"
#include "zerocompressxx/trainer.hpp"

using namespace zerocompress;

static transaction_t
call(const char *selector, const bytes_t &argument, const uint8_t to)
{
    transaction_t transaction;
    transaction.input = from_hex(selector);
    transaction.input.resize(transaction.input.size() + 12, 0);
    transaction.input.insert(transaction.input.end(), argument.begin(), argument.end());
    transaction.to = address_of(to);
    transaction.from = address_of(0x01);
    return transaction;
}

static uint_fast32_t
index_of(const dictionary_t *dictionary, const bytes_t &pattern)
{
    uint_fast32_t index = 0xFFFFFFFF;
    EXPECT_TRUE(dictionary != NULL);
    if (dictionary) EXPECT_TRUE(dictionary->lookup(pattern.data(), pattern.size(), &index));
    return index;
}

TEST(trainer, collects_selectors) {
    transactions_t transactions;
    transactions.push_back(call("a9059cbb", address_of(0x10), 0x50));
    transactions.push_back(call("095ea7b3", address_of(0x10), 0x50));
    transaction_t transfer;
    transfer.input = from_hex("a905");
    transactions.push_back(transfer);
    dictionary_t::corpus_t corpus;
    collect_selectors(transactions, corpus);
    ASSERT_EQ(2u, corpus.size());
    EXPECT_EQ(from_hex("a9059cbb"), corpus[0]);
    EXPECT_EQ(from_hex("095ea7b3"), corpus[1]);
}

TEST(trainer, collects_padded_addresses) {
    transactions_t transactions;
    transactions.push_back(call("a9059cbb", address_of(0x10), 0x50));
    // a word whose padding is not zero is not an address
    bytes_t word(32, 0x01);
    transaction_t other;
    other.input = from_hex("a9059cbb");
    other.input.insert(other.input.end(), word.begin(), word.end());
    transactions.push_back(other);
    dictionary_t::corpus_t corpus;
    collect_addresses(transactions, corpus);
    ASSERT_EQ(3u, corpus.size());
    EXPECT_EQ(address_of(0x50), corpus[0]);
    EXPECT_EQ(address_of(0x01), corpus[1]);
    EXPECT_EQ(address_of(0x10), corpus[2]);
}

TEST(trainer, zero_word_is_not_an_address) {
    transaction_t transaction;
    transaction.input = from_hex("a9059cbb");
    transaction.input.resize(4 + 32, 0);
    dictionary_t::corpus_t corpus;
    collect_addresses(transactions_t(1, transaction), corpus);
    EXPECT_TRUE(corpus.empty());
}

TEST(trainer, collects_word_aligned_ngrams) {
    transaction_t transaction;
    transaction.input = from_hex("a9059cbb");
    for (unsigned i = 0; i < 16; ++i) transaction.input.push_back((uint8_t)i);
    training_options_t options;
    dictionary_t::corpus_t corpus;
    collect_patterns(transactions_t(1, transaction), options, corpus);
    // 8 byte windows at 0, 4, 8 and one 16 byte window
    ASSERT_EQ(4u, corpus.size());
    EXPECT_EQ(from_hex("0001020304050607"), corpus[0]);
    EXPECT_EQ(from_hex("08090a0b0c0d0e0f"), corpus[2]);
    EXPECT_EQ(16u, corpus[3].size());
}

TEST(trainer, publishes_every_dictionary) {
    transactions_t transactions;
    for (int i = 0; i < 3; ++i) {
        transactions.push_back(call("a9059cbb", address_of(0x10), 0x50));
        transactions.push_back(call("095ea7b3", address_of(0x20), 0x50));
    }
    transactions.push_back(call("095ea7b3", address_of(0x20), 0x50));
    dictionary_set_t dictionaries;
    statistics_t statistics;
    ASSERT_EQ(state_ok, train(transactions, training_options_t(), dictionaries, &statistics));
    const dictionary_set_t::snapshot_t snapshot = dictionaries.snapshot();

    EXPECT_EQ(1u, index_of(snapshot.get(stage_selector), from_hex("a9059cbb")));
    EXPECT_EQ(0u, index_of(snapshot.get(stage_selector), from_hex("095ea7b3")));
    EXPECT_EQ(0u, index_of(snapshot.get(stage_address), address_of(0x50)));
    EXPECT_EQ(1u, index_of(snapshot.get(stage_address), address_of(0x01)));
    EXPECT_EQ(2u, snapshot.get(stage_address)->get_index_width());
    ASSERT_TRUE(snapshot.get(stage_pattern) != NULL);
    EXPECT_LT(0u, snapshot.get(stage_pattern)->size());
    EXPECT_EQ(2u, statistics.get_stage(stage_selector).dictionary_size);
    EXPECT_EQ(4u, statistics.get_stage(stage_address).dictionary_size);
}

TEST(trainer, capacity_overflow_is_recorded) {
    transactions_t transactions;
    for (uint8_t i = 0; i < 10; ++i) {
        transaction_t transaction;
        transaction.input = from_hex("00000000");
        transaction.input[3] = i;
        transactions.push_back(transaction);
    }
    training_options_t options;
    options.targets[stage_selector].capacity = 4;
    dictionary_set_t dictionaries;
    statistics_t statistics;
    ASSERT_EQ(state_ok, train(transactions, options, dictionaries, &statistics));
    EXPECT_EQ(4u, dictionaries.get(stage_selector)->size());
    EXPECT_EQ(6u, statistics.get_stage(stage_selector).dictionary_dropped);
}

TEST(trainer, invalid_width_publishes_nothing) {
    training_options_t options;
    options.targets[stage_pattern].index_width = 3;
    dictionary_set_t dictionaries;
    transactions_t transactions(1, call("a9059cbb", address_of(0x10), 0x50));
    EXPECT_EQ(state_error_invalid_input, train(transactions, options, dictionaries));
    EXPECT_TRUE(dictionaries.get(stage_selector).get() == NULL);
}
