// see LICENSE.md for license.
#pragma once
#include "zerocompressxx/memory.def.hpp"

namespace zerocompress {
    // location_t.
    inline void
    location_t::consume(uint_fast64_t sz)
    {
        pointer += sz;
        available_bytes -= sz;
    }
    inline bool
    location_t::read(void *data, uint_fast64_t szdata)
    {
        if (ZEROCOMPRESS_UNLIKELY(szdata > available_bytes)) return false;
        ZEROCOMPRESS_MEMCPY(data, pointer, szdata);
        consume(szdata);
        return true;
    }
    inline bool
    location_t::read_byte(uint8_t *value)
    {
        if (ZEROCOMPRESS_UNLIKELY(!available_bytes)) return false;
        *value = *pointer;
        consume(1);
        return true;
    }
    inline bool
    location_t::read_big_endian(uint_fast32_t *value, const uint_fast8_t width)
    {
        if (ZEROCOMPRESS_UNLIKELY(width > available_bytes)) return false;
        *value = peek_big_endian(pointer, width);
        consume(width);
        return true;
    }
    inline void
    location_t::encapsulate(const uint8_t *RESTRICT pointer, const uint_fast64_t bytes)
    {
        this->pointer = pointer;
        available_bytes = bytes;
        initial_available_bytes = bytes;
    }
    inline uint_fast64_t
    location_t::used(void) const
    {
        return initial_available_bytes - available_bytes;
    }

    // big endian helpers, width in 1..4.
    inline void
    write_big_endian(bytes_t &out, const uint_fast32_t value, const uint_fast8_t width)
    {
        for (uint_fast8_t shift = width; shift > 0; --shift)
            out.push_back((uint8_t)(value >> (8 * (shift - 1))));
    }
    inline uint_fast32_t
    peek_big_endian(const uint8_t *in, const uint_fast8_t width)
    {
        uint_fast32_t value = 0;
        for (uint_fast8_t count = 0; count < width; ++count)
            value = (value << 8) | in[count];
        return value;
    }
}
