// see LICENSE.md for license.
#include "zerocompressxx/body.hpp"

namespace zerocompress {
    body_reader_t::body_reader_t(const layout_t &layout, const uint8_t *in,
                                 const uint_fast64_t szin)
        : layout(layout), prefix_pending(layout.prefix_size > 0)
    {
        this->in.encapsulate(in, szin);
    }

    state_t
    body_reader_t::next(segment_t *segment)
    {
        uint8_t byte;
        segment->pointer = in.pointer;
        if (ZEROCOMPRESS_UNLIKELY(prefix_pending)) {
            if (layout.prefix_size > in.available_bytes) return state_error_invalid_input;
            prefix_pending = false;
            segment->token = token_prefix;
            segment->value = 0;
            segment->size = layout.prefix_size;
            in.consume(segment->size);
            return state_ok;
        }
        if (!in.read_byte(&byte)) return state_error_invalid_input;
        if (ZEROCOMPRESS_LIKELY(!layout.markers.reserved(byte))) {
            segment->token = token_literal;
            segment->value = byte;
            segment->size = 1;
            return state_ok;
        }
        if (layout.markers.kind(byte) == marker_table_t::marker_escape) {
            // Only reserved values are ever escaped
            if (!in.read_byte(&segment->value)) return state_error_invalid_input;
            if (!layout.markers.reserved(segment->value)) return state_error_invalid_input;
            segment->token = token_literal;
            segment->size = 2;
            return state_ok;
        }
        segment->token = token_reference;
        segment->value = byte;
        segment->size = layout.token_size(byte);
        if (!segment->size) return state_error_invalid_input;
        if ((uint_fast64_t)(segment->size - 1) > in.available_bytes)
            return state_error_invalid_input;
        in.consume(segment->size - 1);
        return state_ok;
    }

    void
    escape(const uint8_t *in, const uint_fast64_t szin, bytes_t &out,
           const marker_table_t &markers)
    {
        out.clear();
        out.reserve(szin + szin / 16);
        emit_literals(out, in, szin, markers);
    }

    state_t
    unescape(const layout_t &layout, const uint8_t *in, const uint_fast64_t szin,
             bytes_t &out)
    {
        state_t state;
        segment_t segment;
        body_reader_t reader(layout, in, szin);
        out.clear();
        out.reserve(szin);
        while (!reader.at_end()) {
            if ((state = reader.next(&segment))) return state;
            if (segment.token != token_literal) return state_error_invalid_input;
            out.push_back(segment.value);
        }
        return state_ok;
    }
}
