// see LICENSE.md for license.
#pragma once

#include <memory>
#include <unordered_map>
#include "zerocompressxx/memory.hpp"

namespace zerocompress {
    class dictionary_t;
    class statistics_t;
    typedef std::shared_ptr<const dictionary_t> dictionary_ptr_t;

    // dictionary: immutable bijection between byte patterns and indices.
    class dictionary_t {
    public:
        typedef std::vector<bytes_t> corpus_t;

        static const uint32_t record_magic = 0x5A434431U;  // "ZCD1"
        static const uint_fast32_t max_pattern_length = 0xFFFF;

        // Entries dropped for capacity are counted under stage in statistics.
        static dictionary_ptr_t build(const corpus_t &corpus, uint_fast32_t capacity,
                                      const uint_fast8_t index_width,
                                      const uint_fast64_t min_count = 1,
                                      statistics_t *statistics = NULL,
                                      const stage_t stage = stage_pattern);
        static state_t load(location_t *RESTRICT in, dictionary_ptr_t &dictionary);
        static state_t read(FILE *RESTRICT rfp, dictionary_ptr_t &dictionary);

        bool lookup(const uint8_t *pattern, const uint_fast64_t szpattern,
                    uint_fast32_t *index) const;
        const bytes_t *reverse(const uint_fast32_t index) const;
        const std::vector<uint32_t> &candidates(const uint8_t first) const;

        void save(bytes_t &out) const;
        bool write(FILE *RESTRICT wfp) const;

        inline uint_fast32_t size(void) const { return (uint_fast32_t)entries.size(); }
        inline uint_fast32_t get_capacity(void) const { return capacity; }
        inline uint_fast8_t get_index_width(void) const { return index_width; }
        inline uint_fast64_t dropped(void) const { return dropped_count; }
        inline uint_fast64_t shortest(void) const { return shortest_length; }
        inline uint_fast64_t longest(void) const { return longest_length; }

        static inline uint_fast32_t index_limit(const uint_fast8_t index_width)
        {   return (uint_fast32_t)1 << (8 * index_width); }
        static inline bool valid_index_width(const uint_fast8_t index_width)
        {   return index_width == 1 || index_width == 2; }
    private:
        dictionary_t(const uint_fast32_t capacity, const uint_fast8_t index_width);

        bool insert(const uint8_t *pattern, const uint_fast64_t szpattern, const uint32_t index);
        void sort_candidates(void);

        uint_fast32_t capacity;
        uint_fast8_t index_width;
        uint_fast64_t dropped_count;
        uint_fast64_t shortest_length, longest_length;

        std::unordered_map<std::string, uint32_t> entries;
        std::vector<bytes_t> patterns;
        // entries starting with a given byte, longest first then lowest index.
        std::vector<uint32_t> by_first_byte[256];
    };
}
