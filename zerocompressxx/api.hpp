// see LICENSE.md for license.
#pragma once
#include "zerocompressxx/api.def.hpp"
#include "zerocompressxx/token.hpp"
#include "zerocompressxx/zero_run.hpp"

namespace zerocompress {
    static inline int
    hex_value(const char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline state_t
    hex_decode(const std::string &text, bytes_t &out)
    {
        size_t start = 0;
        int high, low;
        out.clear();
        if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) start = 2;
        if ((text.size() - start) & 1) return state_error_invalid_input;
        out.reserve((text.size() - start) / 2);
        for (size_t i = start; i < text.size(); i += 2) {
            if ((high = hex_value(text[i])) < 0 || (low = hex_value(text[i + 1])) < 0) {
                out.clear();
                return state_error_invalid_input;
            }
            out.push_back((uint8_t)((high << 4) | low));
        }
        return state_ok;
    }

    inline std::string
    hex_encode(const uint8_t *in, const uint_fast64_t szin, const bool prefix)
    {
        static const char digits[] = "0123456789abcdef";
        std::string text(prefix ? "0x": "");
        text.reserve(text.size() + 2 * szin);
        for (uint_fast64_t i = 0; i < szin; ++i) {
            text += digits[in[i] >> 4];
            text += digits[in[i] & 0xF];
        }
        return text;
    }
}
