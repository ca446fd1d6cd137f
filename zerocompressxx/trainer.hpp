// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/statistics.hpp"
#include "zerocompressxx/token.def.hpp"

namespace zerocompress {
    struct transaction_t {
        bytes_t input;
        bytes_t to;      // empty for contract creation
        bytes_t from;
    };
    typedef std::vector<transaction_t> transactions_t;

    struct training_options_t {
        struct target_t {
            uint_fast32_t capacity;
            uint_fast8_t index_width;
            uint_fast64_t min_count;
        } targets[dictionary_stage_count];
        std::vector<uint_fast32_t> ngram_sizes;
        uint_fast32_t ngram_step;

        training_options_t(void);
    };

    const uint_fast32_t abi_word_size = 32;
    const uint_fast32_t abi_padding_size = abi_word_size - address_size;

    void collect_selectors(const transactions_t &transactions, dictionary_t::corpus_t &corpus);
    void collect_addresses(const transactions_t &transactions, dictionary_t::corpus_t &corpus);
    void collect_patterns(const transactions_t &transactions, const training_options_t &options,
                          dictionary_t::corpus_t &corpus);

    // Builds the three dictionaries and publishes them into dictionaries.
    state_t train(const transactions_t &transactions, const training_options_t &options,
                  dictionary_set_t &dictionaries, statistics_t *statistics = NULL);
}
