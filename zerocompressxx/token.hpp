// see LICENSE.md for license.
#pragma once
#include "zerocompressxx/token.def.hpp"

namespace zerocompress {
    inline uint_fast64_t
    fixed_width_scan_t::match(const dictionary_t &dictionary, const uint8_t *in,
                              const uint_fast64_t available, uint_fast32_t *index) const
    {
        if (available < width) return 0;
        return dictionary.lookup(in, width, index) ? width: 0;
    }

    inline uint_fast64_t
    greedy_scan_t::match(const dictionary_t &dictionary, const uint8_t *in,
                         const uint_fast64_t available, uint_fast32_t *index) const
    {
        if (!available) return 0;
        const std::vector<uint32_t> &candidates = dictionary.candidates(in[0]);
        for (size_t i = 0; i < candidates.size(); ++i) {
            const bytes_t *pattern = dictionary.reverse(candidates[i]);
            if (pattern->size() > available) continue;
            if (memcmp(&(*pattern)[0], in, pattern->size())) continue;
            *index = candidates[i];
            return pattern->size();
        }
        return 0;
    }
}
