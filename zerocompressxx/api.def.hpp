// see LICENSE.md for license.
#pragma once
#include "zerocompressxx/format.hpp"
#include "zerocompressxx/statistics.hpp"

namespace zerocompress {
    // options: runtime configuration shared by compress and decompress.
    struct options_t {
        uint_fast16_t marker_base;       // first value of the reserved marker block
        uint_fast32_t min_run_length;    // shortest zero run worth a token
        uint_fast32_t max_output_size;   // largest escaped body either direction handles
        bool enabled[stage_count];

        inline options_t(void)
            : marker_base(ZEROCOMPRESS_DEFAULT_MARKER_BASE),
              min_run_length(ZEROCOMPRESS_DEFAULT_MIN_RUN_LENGTH),
              max_output_size(ZEROCOMPRESS_DEFAULT_MAX_OUTPUT_SIZE)
        {   for (size_t i = 0; i < stage_count; ++i) enabled[i] = true; }

        inline state_t check(void) const
        {   if (!marker_table_t::valid_base(marker_base)) return state_error_invalid_input;
            if (!min_run_length) return state_error_invalid_input;
            return state_ok; }
        inline marker_table_t markers(void) const { return marker_table_t((uint8_t)marker_base); }
    };

    struct processing_result_t {
        state_t state;
        uint_fast64_t bytes_read, bytes_written;
    };

    processing_result_t
    compress(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
             const dictionary_set_t &dictionaries, const options_t &options = options_t(),
             statistics_t *statistics = NULL);
    processing_result_t
    decompress(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
               const dictionary_set_t &dictionaries, const options_t &options = options_t(),
               statistics_t *statistics = NULL);

    // config: the options and every dictionary of a set in one record.
    //   magic:u32 length:u32, then length bytes of
    //   marker_base:u8 min_run_length:u32 max_output_size:u32 enabled:u8 dictionary set
    const uint32_t config_magic = 0x5A434331U;  // "ZCC1"
    const uint_fast32_t config_prefix_size = 8;
    const uint_fast32_t config_read_chunk = 1 << 16;

    void save_config(const dictionary_set_t &dictionaries, const options_t &options,
                     bytes_t &out);
    // Nothing is replaced unless the whole record is valid.
    state_t load_config(location_t *RESTRICT in, dictionary_set_t &dictionaries,
                        options_t &options);
    bool write_config(FILE *RESTRICT wfp, const dictionary_set_t &dictionaries,
                      const options_t &options);
    state_t read_config(FILE *RESTRICT rfp, dictionary_set_t &dictionaries,
                        options_t &options);

    // hex boundary, "0x" prefix optional on input.
    state_t hex_decode(const std::string &text, bytes_t &out);
    std::string hex_encode(const uint8_t *in, const uint_fast64_t szin, const bool prefix = true);

    state_t compress_hex(const std::string &in, std::string &out,
                         const dictionary_set_t &dictionaries,
                         const options_t &options = options_t(),
                         statistics_t *statistics = NULL);
    state_t decompress_hex(const std::string &in, std::string &out,
                           const dictionary_set_t &dictionaries,
                           const options_t &options = options_t(),
                           statistics_t *statistics = NULL);
}
