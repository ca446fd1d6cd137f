// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/dictionary.hpp"

namespace zerocompress {
    // statistics: observational counters, never consulted by the codec.
    class statistics_t {
    public:
        struct stage_statistics_t {
            uint_fast64_t applied;
            uint_fast64_t items;
            uint_fast64_t bytes_saved;
            uint_fast64_t dictionary_size;
            uint_fast64_t dictionary_dropped;
        };

        inline statistics_t(void) { reset(); }
        void reset(void);

        inline void record_compress(const uint_fast64_t szin, const uint_fast64_t szout)
        {   ++payloads_compressed; bytes_in += szin; bytes_compressed += szout; }
        inline void record_decompress(const uint_fast64_t szin, const uint_fast64_t szout)
        {   ++payloads_decompressed; bytes_decoded_in += szin; bytes_decoded_out += szout; }
        inline void record_stage(const stage_t stage, const uint_fast64_t items,
                                 const uint_fast64_t saved)
        {   ++stages[stage].applied; stages[stage].items += items;
            stages[stage].bytes_saved += saved; }
        inline void record_dictionary(const stage_t stage, const dictionary_t *dictionary)
        {   stages[stage].dictionary_size = dictionary ? dictionary->size(): 0; }
        void record_build(const stage_t stage, const dictionary_t *dictionary);
        inline void record_error(const state_t state) { ++errors[state]; }

        inline uint_fast64_t get_payloads_compressed(void) const { return payloads_compressed; }
        inline uint_fast64_t get_payloads_decompressed(void) const { return payloads_decompressed; }
        inline uint_fast64_t get_bytes_in(void) const { return bytes_in; }
        inline uint_fast64_t get_bytes_compressed(void) const { return bytes_compressed; }
        inline uint_fast64_t get_bytes_decoded_in(void) const { return bytes_decoded_in; }
        inline uint_fast64_t get_bytes_decoded_out(void) const { return bytes_decoded_out; }
        inline const stage_statistics_t &get_stage(const stage_t stage) const
        {   return stages[stage]; }
        inline uint_fast64_t get_errors(const state_t state) const { return errors[state]; }

        double compression_ratio(void) const;
        std::string render(void) const;
    private:
        static const size_t state_count = 4;

        uint_fast64_t payloads_compressed, payloads_decompressed;
        uint_fast64_t bytes_in, bytes_compressed;
        uint_fast64_t bytes_decoded_in, bytes_decoded_out;
        stage_statistics_t stages[stage_count];
        uint_fast64_t errors[state_count];
    };

    std::string format_decimal(uint64_t number);
}
