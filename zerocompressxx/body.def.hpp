// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/format.hpp"

namespace zerocompress {
    // layout: which tokens may appear in a body and how long they are.
    class layout_t {
    public:
        marker_table_t markers;
        uint_fast8_t prefix_size;     // positional selector index, 0 when absent
        uint_fast8_t address_width;   // 0 while the address stage is inactive
        uint_fast8_t pattern_width;   // 0 while the pattern stage is inactive
        bool zero_run;

        inline layout_t(const marker_table_t &markers)
            : markers(markers), prefix_size(0), address_width(0), pattern_width(0),
              zero_run(false) {}

        void activate(const stage_t stage, const uint_fast8_t width);
        void deactivate(const stage_t stage);
        uint_fast8_t token_size(const uint8_t marker) const;
    };

    typedef enum {
        token_literal,
        token_reference,
        token_prefix,
    } token_t;

    // segment: one token of a body.
    struct segment_t {
        token_t token;
        uint8_t value;            // literal byte, or the leading marker of a reference
        const uint8_t *pointer;   // encoded form inside the body
        uint_fast8_t size;
    };

    class body_reader_t {
    public:
        body_reader_t(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin);

        inline bool at_end(void) const { return !prefix_pending && !in.available_bytes; }
        inline uint_fast64_t position(void) const { return in.used(); }
        state_t next(segment_t *segment);
    private:
        const layout_t &layout;
        location_t in;
        bool prefix_pending;
    };

    void emit_literal(bytes_t &out, const uint8_t byte, const marker_table_t &markers);
    void emit_literals(bytes_t &out, const uint8_t *in, const uint_fast64_t szin,
                       const marker_table_t &markers);
    void emit_segment(bytes_t &out, const segment_t &segment);

    void escape(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
                const marker_table_t &markers);
    state_t unescape(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
                     bytes_t &out);
}
