// see LICENSE.md for license.
#pragma once
#include "zerocompressxx/body.def.hpp"

namespace zerocompress {
    // layout_t.
    inline void
    layout_t::activate(const stage_t stage, const uint_fast8_t width)
    {
        switch (stage) {
        case stage_selector: prefix_size = width; break;
        case stage_address: address_width = width; break;
        case stage_pattern: pattern_width = width; break;
        case stage_zero_run: zero_run = true; break;
        }
    }
    inline void
    layout_t::deactivate(const stage_t stage)
    {
        activate(stage, 0);
        if (stage == stage_zero_run) zero_run = false;
    }
    inline uint_fast8_t
    layout_t::token_size(const uint8_t marker) const
    {
        switch (markers.kind(marker)) {
        case marker_table_t::marker_address: return address_width ? 1 + address_width: 0;
        case marker_table_t::marker_pattern: return pattern_width ? 1 + pattern_width: 0;
        case marker_table_t::marker_zero_run_short: return zero_run ? 2: 0;
        case marker_table_t::marker_zero_run_medium: return zero_run ? 3: 0;
        case marker_table_t::marker_zero_run_long: return zero_run ? 5: 0;
        case marker_table_t::marker_escape: return 2;
        default: return 0;  // selector marker never appears inside a body
        }
    }

    // emitters.
    inline void
    emit_literal(bytes_t &out, const uint8_t byte, const marker_table_t &markers)
    {
        if (ZEROCOMPRESS_UNLIKELY(markers.reserved(byte)))
            out.push_back(markers.value(marker_table_t::marker_escape));
        out.push_back(byte);
    }
    inline void
    emit_literals(bytes_t &out, const uint8_t *in, const uint_fast64_t szin,
                  const marker_table_t &markers)
    {
        for (uint_fast64_t i = 0; i < szin; ++i) emit_literal(out, in[i], markers);
    }
    inline void
    emit_segment(bytes_t &out, const segment_t &segment)
    {
        out.insert(out.end(), segment.pointer, segment.pointer + segment.size);
    }
}
