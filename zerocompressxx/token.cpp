// see LICENSE.md for license.
#include "zerocompressxx/token.hpp"

namespace zerocompress {
    token_kernel_t::token_kernel_t(const stage_t stage, const dictionary_t &dictionary,
                                   const token_scan_t &scan, const uint_fast64_t output_limit)
        : kernel_t(output_limit), token_stage(stage), dictionary(dictionary), scan(scan)
    {
    }

    void
    token_kernel_t::substitute(const bytes_t &run, const marker_table_t &markers,
                               bytes_t &out, uint_fast64_t *items) const
    {
        uint_fast64_t offset = 0, length;
        uint_fast32_t index;
        while (offset < run.size()) {
            length = scan.match(dictionary, &run[offset], run.size() - offset, &index);
            if (length) {
                out.push_back(markers.value(marker()));
                write_big_endian(out, index, dictionary.get_index_width());
                offset += length;
                ++*items;
            } else {
                emit_literal(out, run[offset], markers);
                ++offset;
            }
        }
    }

    state_t
    token_kernel_t::encode(const layout_t &layout, const uint8_t *in,
                           const uint_fast64_t szin, bytes_t &out,
                           uint_fast64_t *items) const
    {
        state_t state;
        segment_t segment;
        bytes_t run;
        if (scan.anchored()) return encode_anchored(layout, in, szin, out, items);
        ZEROCOMPRESS_SHOW_IN(in, szin);
        body_reader_t reader(layout, in, szin);
        out.reserve(szin);
        // Literal runs only, tokens of earlier stages pass through untouched
        while (!reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token == token_literal) {
                run.push_back(segment.value);
                continue;
            }
            substitute(run, layout.markers, out, items);
            run.clear();
            emit_segment(out, segment);
        }
        substitute(run, layout.markers, out, items);
        ZEROCOMPRESS_SHOW_OUT(out.data(), out.size());
        return state_ok;
    }

    state_t
    token_kernel_t::encode_anchored(const layout_t &layout, const uint8_t *in,
                                    const uint_fast64_t szin, bytes_t &out,
                                    uint_fast64_t *items) const
    {
        state_t state;
        segment_t segment;
        bytes_t head;
        uint_fast32_t index;
        body_reader_t reader(layout, in, szin);
        if (layout.prefix_size) goto unchanged;
        while (head.size() < dictionary.longest() && !reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token != token_literal) break;
            head.push_back(segment.value);
        }
        if (head.empty()) goto unchanged;
        {
            const uint_fast64_t length = scan.match(dictionary, &head[0], head.size(), &index);
            if (!length) goto unchanged;
            // Re-read from the start, the head may have hit a token
            body_reader_t rest(layout, in, szin);
            for (uint_fast64_t consumed = 0; consumed < length; ++consumed)
                if ((state = rest.next(&segment))) return state;
            write_big_endian(out, index, dictionary.get_index_width());
            out.insert(out.end(), in + rest.position(), in + szin);
            ++*items;
            return state_ok;
        }
    unchanged:
        out.insert(out.end(), in, in + szin);
        return state_ok;
    }

    state_t
    token_kernel_t::decode(const layout_t &layout, const uint8_t *in,
                           const uint_fast64_t szin, bytes_t &out) const
    {
        state_t state;
        segment_t segment;
        const bytes_t *pattern;
        const uint8_t own_marker = layout.markers.value(marker());
        if (scan.anchored()) return decode_anchored(layout, in, szin, out);
        body_reader_t reader(layout, in, szin);
        out.reserve(szin * 2);
        while (!reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token != token_reference || segment.value != own_marker) {
                emit_segment(out, segment);
                continue;
            }
            pattern = dictionary.reverse(peek_big_endian(segment.pointer + 1,
                                                         dictionary.get_index_width()));
            if (!pattern) return state_error_dictionary_miss;
            if (exceeds(out, pattern->size())) return state_error_invalid_input;
            emit_literals(out, &(*pattern)[0], pattern->size(), layout.markers);
        }
        if (exceeds(out, 0)) return state_error_invalid_input;
        return state_ok;
    }

    state_t
    token_kernel_t::decode_anchored(const layout_t &layout, const uint8_t *in,
                                    const uint_fast64_t szin, bytes_t &out) const
    {
        const uint_fast8_t width = dictionary.get_index_width();
        if (layout.prefix_size != width || szin < width) return state_error_invalid_input;
        const bytes_t *pattern = dictionary.reverse(peek_big_endian(in, width));
        if (!pattern) return state_error_dictionary_miss;
        if (exceeds(out, szin - width + pattern->size())) return state_error_invalid_input;
        out.reserve(szin + pattern->size());
        emit_literals(out, &(*pattern)[0], pattern->size(), layout.markers);
        out.insert(out.end(), in + width, in + szin);
        return state_ok;
    }
}
