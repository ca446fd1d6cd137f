// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/globals.hpp"

namespace zerocompress {
    // read cursor over a caller owned buffer.
    class location_t {
    public:
        const uint8_t *pointer;
        uint_fast64_t available_bytes;
        uint_fast64_t initial_available_bytes;

        void consume(uint_fast64_t sz);
        bool read(void *data, uint_fast64_t szdata);
        bool read_byte(uint8_t *value);
        bool read_big_endian(uint_fast32_t *value, const uint_fast8_t width);
        void encapsulate(const uint8_t *pointer, const uint_fast64_t bytes);
        uint_fast64_t used(void) const;
    };

    void write_big_endian(bytes_t &out, const uint_fast32_t value, const uint_fast8_t width);
    uint_fast32_t peek_big_endian(const uint8_t *in, const uint_fast8_t width);
}
