// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/kernel.hpp"

namespace zerocompress {
    // zero_run: tiered run length coding of literal zero bytes.
    //   L <= 255         -> [short, L]
    //   L <= 65535       -> [medium, L_hi, L_lo]
    //   L <= 2^32 - 1    -> [long, 4 bytes big endian]
    class zero_run_kernel_t: public kernel_t {
    public:
        static const uint_fast64_t short_limit = 0xFF;
        static const uint_fast64_t medium_limit = 0xFFFF;
        static const uint_fast64_t long_limit = 0xFFFFFFFFULL;

        inline zero_run_kernel_t(const uint_fast32_t min_run_length,
                                 const uint_fast64_t output_limit =
                                 ZEROCOMPRESS_DEFAULT_MAX_OUTPUT_SIZE)
            : kernel_t(output_limit), min_run_length(min_run_length) {}

        inline stage_t stage(void) const { return stage_zero_run; }
        inline uint_fast8_t layout_width(void) const { return 0; }

        state_t encode(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
                       bytes_t &out, uint_fast64_t *items) const;
        state_t decode(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
                       bytes_t &out) const;
    private:
        uint_fast32_t min_run_length;

        void flush(uint_fast64_t run, const marker_table_t &markers, bytes_t &out,
                   uint_fast64_t *items) const;
    };
}
