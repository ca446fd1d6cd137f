// see LICENSE.md for license.
#include "zerocompressxx/zero_run.hpp"

namespace zerocompress {
    void
    zero_run_kernel_t::flush(uint_fast64_t run, const marker_table_t &markers,
                             bytes_t &out, uint_fast64_t *items) const
    {
        uint_fast64_t length;
        while (run && run >= min_run_length) {
            length = run > long_limit ? (uint_fast64_t)long_limit: run;
            if (length <= short_limit) {
                out.push_back(markers.value(marker_table_t::marker_zero_run_short));
                out.push_back((uint8_t)length);
            } else if (length <= medium_limit) {
                out.push_back(markers.value(marker_table_t::marker_zero_run_medium));
                write_big_endian(out, (uint_fast32_t)length, 2);
            } else {
                out.push_back(markers.value(marker_table_t::marker_zero_run_long));
                write_big_endian(out, (uint_fast32_t)length, 4);
            }
            run -= length;
            ++*items;
        }
        for (; run; --run) emit_literal(out, 0, markers);
    }

    state_t
    zero_run_kernel_t::encode(const layout_t &layout, const uint8_t *in,
                              const uint_fast64_t szin, bytes_t &out,
                              uint_fast64_t *items) const
    {
        state_t state;
        segment_t segment;
        uint_fast64_t run = 0;
        ZEROCOMPRESS_SHOW_IN(in, szin);
        body_reader_t reader(layout, in, szin);
        out.reserve(szin);
        while (!reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token == token_literal && !segment.value) {
                ++run;
                continue;
            }
            flush(run, layout.markers, out, items);
            run = 0;
            emit_segment(out, segment);
        }
        flush(run, layout.markers, out, items);
        ZEROCOMPRESS_SHOW_OUT(out.data(), out.size());
        return state_ok;
    }

    state_t
    zero_run_kernel_t::decode(const layout_t &layout, const uint8_t *in,
                              const uint_fast64_t szin, bytes_t &out) const
    {
        state_t state;
        segment_t segment;
        uint_fast64_t length;
        body_reader_t reader(layout, in, szin);
        const bool zero_reserved = layout.markers.reserved(0);
        out.reserve(szin * 2);
        while (!reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token != token_reference) {
                emit_segment(out, segment);
                continue;
            }
            switch (layout.markers.kind(segment.value)) {
            case marker_table_t::marker_zero_run_short:
            case marker_table_t::marker_zero_run_medium:
            case marker_table_t::marker_zero_run_long:
                length = peek_big_endian(segment.pointer + 1, segment.size - 1);
                break;
            default:
                emit_segment(out, segment);
                continue;
            }
            if (!length) return state_error_invalid_input;
            if (exceeds(out, zero_reserved ? 2 * length: length))
                return state_error_invalid_input;
            if (ZEROCOMPRESS_LIKELY(!zero_reserved))
                out.insert(out.end(), (size_t)length, (uint8_t)0);
            else
                for (; length; --length) emit_literal(out, 0, layout.markers);
        }
        return state_ok;
    }
}
