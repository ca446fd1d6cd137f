// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/kernel.hpp"
#include "zerocompressxx/dictionary.hpp"

namespace zerocompress {
    const uint_fast8_t selector_size = 4;
    const uint_fast8_t address_size = 20;

    // token_scan: how a token stage finds dictionary entries in literal bytes.
    class token_scan_t {
    public:
        virtual ~token_scan_t() {}
        // only the leading bytes of the payload are considered.
        virtual bool anchored(void) const = 0;
        // length of the entry matching at in[0] (0 when none), index in *index.
        virtual uint_fast64_t match(const dictionary_t &dictionary, const uint8_t *in,
                                    const uint_fast64_t available,
                                    uint_fast32_t *index) const = 0;
    };

    class fixed_width_scan_t: public token_scan_t {
    public:
        inline fixed_width_scan_t(const uint_fast64_t width, const bool anchored_at_start)
            : width(width), anchored_at_start(anchored_at_start) {}

        inline bool anchored(void) const { return anchored_at_start; }
        uint_fast64_t match(const dictionary_t &dictionary, const uint8_t *in,
                            const uint_fast64_t available, uint_fast32_t *index) const;
    private:
        uint_fast64_t width;
        bool anchored_at_start;
    };

    // longest entry wins, ties go to the lowest index.
    class greedy_scan_t: public token_scan_t {
    public:
        inline greedy_scan_t(void) {}

        inline bool anchored(void) const { return false; }
        uint_fast64_t match(const dictionary_t &dictionary, const uint8_t *in,
                            const uint_fast64_t available, uint_fast32_t *index) const;
    };

    class token_kernel_t: public kernel_t {
    public:
        token_kernel_t(const stage_t stage, const dictionary_t &dictionary,
                       const token_scan_t &scan,
                       const uint_fast64_t output_limit = ZEROCOMPRESS_DEFAULT_MAX_OUTPUT_SIZE);

        inline stage_t stage(void) const { return token_stage; }
        inline uint_fast8_t layout_width(void) const { return dictionary.get_index_width(); }

        state_t encode(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
                       bytes_t &out, uint_fast64_t *items) const;
        state_t decode(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
                       bytes_t &out) const;
    private:
        const stage_t token_stage;
        const dictionary_t &dictionary;
        const token_scan_t &scan;

        inline marker_table_t::marker_t marker(void) const
        {   return token_stage == stage_address ? marker_table_t::marker_address:
                marker_table_t::marker_pattern; }

        void substitute(const bytes_t &run, const marker_table_t &markers, bytes_t &out,
                        uint_fast64_t *items) const;
        state_t encode_anchored(const layout_t &layout, const uint8_t *in,
                                const uint_fast64_t szin, bytes_t &out,
                                uint_fast64_t *items) const;
        state_t decode_anchored(const layout_t &layout, const uint8_t *in,
                                const uint_fast64_t szin, bytes_t &out) const;
    };
}
