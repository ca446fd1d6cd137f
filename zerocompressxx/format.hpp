// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/memory.hpp"

namespace zerocompress {
    // marker_table: the reserved byte block shared by every stage.
    class marker_table_t {
    public:
        typedef enum {
            marker_selector = 0,
            marker_address,
            marker_pattern,
            marker_zero_run_short,
            marker_zero_run_medium,
            marker_zero_run_long,
            marker_escape,
        } marker_t;
        static const uint_fast16_t reserved_count = 7;

        inline marker_table_t(const uint8_t base = ZEROCOMPRESS_DEFAULT_MARKER_BASE): base(base) {}

        static inline bool valid_base(const uint_fast16_t base)
        {   return base + reserved_count <= 0x100; }

        inline uint8_t get_base(void) const { return base; }
        inline uint8_t value(const marker_t marker) const { return (uint8_t)(base + marker); }
        inline bool reserved(const uint8_t byte) const
        {   return byte >= base && (uint_fast16_t)(byte - base) < reserved_count; }
        inline marker_t kind(const uint8_t byte) const { return (marker_t)(byte - base); }

        inline uint8_t stage_marker(const stage_t stage) const
        {   switch (stage) {
            case stage_selector: return value(marker_selector);
            case stage_address: return value(marker_address);
            case stage_pattern: return value(marker_pattern);
            default: return value(marker_zero_run_short); } }
        inline bool stage_of(const uint8_t byte, stage_t *stage) const
        {   if (!reserved(byte)) return false;
            switch (kind(byte)) {
            case marker_selector: *stage = stage_selector; return true;
            case marker_address: *stage = stage_address; return true;
            case marker_pattern: *stage = stage_pattern; return true;
            case marker_zero_run_short: *stage = stage_zero_run; return true;
            default: return false; } }
    private:
        uint8_t base;
    };

    // header: version, stage count, stage markers in application order.
    class stream_header_t {
    public:
        uint8_t version;
        uint8_t count;
        uint8_t record[stage_count];

        inline void setup(void) { version = format_version; count = 0; }
        inline void append(const uint8_t marker) { record[count++] = marker; }
        inline uint_fast32_t size(void) const { return 2 + count; }

        inline uint_fast32_t write(bytes_t &out) const
        {   out.push_back(version);
            out.push_back(count);
            out.insert(out.end(), record, record + count);
            return size(); }

        state_t read(location_t *RESTRICT in, const marker_table_t &markers,
                     bool applied[stage_count]);
    };

    inline state_t
    stream_header_t::read(location_t *RESTRICT in, const marker_table_t &markers,
                          bool applied[stage_count])
    {
        stage_t stage;
        int_fast8_t last = -1;
        for (size_t i = 0; i < stage_count; ++i) applied[i] = false;
        if (!in->read_byte(&version)) return state_error_invalid_input;
        if (version != format_version) return state_error_version_mismatch;
        if (!in->read_byte(&count)) return state_error_invalid_input;
        if (count > stage_count) return state_error_invalid_input;
        if (!in->read(record, count)) return state_error_invalid_input;
        for (uint_fast8_t i = 0; i < count; ++i) {
            // Record must follow the pipeline order without repeats
            if (!markers.stage_of(record[i], &stage)) return state_error_invalid_input;
            if ((int_fast8_t)stage <= last) return state_error_invalid_input;
            applied[stage] = true;
            last = (int_fast8_t)stage;
        }
        return state_ok;
    }
}
