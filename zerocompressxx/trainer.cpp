// see LICENSE.md for license.
#include "zerocompressxx/trainer.hpp"

namespace zerocompress {
    training_options_t::training_options_t(void)
        : ngram_step(4)
    {
        targets[stage_selector].capacity = 256;
        targets[stage_selector].index_width = 1;
        targets[stage_selector].min_count = 1;
        targets[stage_address].capacity = 65536;
        targets[stage_address].index_width = 2;
        targets[stage_address].min_count = 1;
        targets[stage_pattern].capacity = 256;
        targets[stage_pattern].index_width = 1;
        targets[stage_pattern].min_count = 3;
        ngram_sizes.push_back(8);
        ngram_sizes.push_back(16);
        ngram_sizes.push_back(32);
    }

    void
    collect_selectors(const transactions_t &transactions, dictionary_t::corpus_t &corpus)
    {
        for (size_t i = 0; i < transactions.size(); ++i) {
            const bytes_t &input = transactions[i].input;
            if (input.size() < selector_size) continue;
            corpus.push_back(bytes_t(input.begin(), input.begin() + selector_size));
        }
    }

    static inline bool
    padded_address(const uint8_t *word)
    {
        for (uint_fast32_t i = 0; i < abi_padding_size; ++i)
            if (word[i]) return false;
        for (uint_fast32_t i = abi_padding_size; i < abi_word_size; ++i)
            if (word[i]) return true;
        return false;
    }

    void
    collect_addresses(const transactions_t &transactions, dictionary_t::corpus_t &corpus)
    {
        for (size_t i = 0; i < transactions.size(); ++i) {
            const transaction_t &transaction = transactions[i];
            if (transaction.to.size() == address_size) corpus.push_back(transaction.to);
            if (transaction.from.size() == address_size) corpus.push_back(transaction.from);
            const bytes_t &input = transaction.input;
            for (size_t offset = selector_size; offset + abi_word_size <= input.size();
                 offset += abi_word_size) {
                const uint8_t *word = &input[offset];
                if (padded_address(word))
                    corpus.push_back(bytes_t(word + abi_padding_size, word + abi_word_size));
            }
        }
    }

    void
    collect_patterns(const transactions_t &transactions, const training_options_t &options,
                     dictionary_t::corpus_t &corpus)
    {
        const uint_fast32_t step = options.ngram_step ? options.ngram_step: 1;
        for (size_t i = 0; i < transactions.size(); ++i) {
            const bytes_t &input = transactions[i].input;
            if (input.size() <= selector_size) continue;
            for (size_t n = 0; n < options.ngram_sizes.size(); ++n) {
                const size_t size = options.ngram_sizes[n];
                if (!size) continue;
                for (size_t offset = selector_size; offset + size <= input.size(); offset += step)
                    corpus.push_back(bytes_t(input.begin() + offset,
                                             input.begin() + offset + size));
            }
        }
    }

    state_t
    train(const transactions_t &transactions, const training_options_t &options,
          dictionary_set_t &dictionaries, statistics_t *statistics)
    {
        dictionary_t::corpus_t corpora[dictionary_stage_count];
        dictionary_ptr_t built[dictionary_stage_count];
        collect_selectors(transactions, corpora[stage_selector]);
        collect_addresses(transactions, corpora[stage_address]);
        collect_patterns(transactions, options, corpora[stage_pattern]);
        // Nothing is published unless every dictionary could be built
        for (size_t i = 0; i < dictionary_stage_count; ++i) {
            const training_options_t::target_t &target = options.targets[i];
            built[i] = dictionary_t::build(corpora[i], target.capacity, target.index_width,
                                           target.min_count, statistics, (stage_t)i);
            if (!built[i]) return state_error_invalid_input;
        }
        for (size_t i = 0; i < dictionary_stage_count; ++i)
            dictionaries.publish((stage_t)i, built[i]);
        return state_ok;
    }
}
