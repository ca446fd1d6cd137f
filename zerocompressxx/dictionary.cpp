// see LICENSE.md for license.
#include <algorithm>
#include "zerocompressxx/statistics.hpp"

namespace zerocompress {
    struct ranked_pattern_t {
        std::string pattern;
        uint_fast64_t count;
    };
    static inline bool
    more_frequent(const ranked_pattern_t &a, const ranked_pattern_t &b)
    {
        return a.count > b.count;
    }
    struct below_min_count_t {
        uint_fast64_t min_count;
        inline bool operator()(const ranked_pattern_t &entry) const
        {   return entry.count < min_count; }
    };

    dictionary_t::dictionary_t(const uint_fast32_t capacity, const uint_fast8_t index_width)
        : capacity(capacity), index_width(index_width), dropped_count(0),
          shortest_length(0), longest_length(0)
    {
    }

    bool
    dictionary_t::insert(const uint8_t *pattern, const uint_fast64_t szpattern,
                         const uint32_t index)
    {
        if (!szpattern || szpattern > max_pattern_length) return false;
        if (index >= index_limit(index_width)) return false;
        if (index < patterns.size() && !patterns[index].empty()) return false;
        if (!entries.insert(std::make_pair(std::string((const char *)pattern, szpattern),
                                           index)).second)
            return false;
        if (index >= patterns.size()) patterns.resize(index + 1);
        patterns[index].assign(pattern, pattern + szpattern);
        by_first_byte[pattern[0]].push_back(index);
        if (!shortest_length || szpattern < shortest_length) shortest_length = szpattern;
        if (szpattern > longest_length) longest_length = szpattern;
        return true;
    }

    struct candidate_order_t {
        const std::vector<bytes_t> *patterns;
        inline bool operator()(const uint32_t a, const uint32_t b) const
        {   const size_t sza = (*patterns)[a].size(), szb = (*patterns)[b].size();
            return sza != szb ? sza > szb: a < b; }
    };
    void
    dictionary_t::sort_candidates(void)
    {
        candidate_order_t order;
        order.patterns = &patterns;
        for (size_t i = 0; i < 256; ++i)
            std::sort(by_first_byte[i].begin(), by_first_byte[i].end(), order);
    }

    dictionary_ptr_t
    dictionary_t::build(const corpus_t &corpus, uint_fast32_t capacity,
                        const uint_fast8_t index_width, const uint_fast64_t min_count,
                        statistics_t *statistics, const stage_t stage)
    {
        if (!valid_index_width(index_width)) return dictionary_ptr_t();
        capacity = std::min(capacity, index_limit(index_width));

        // Count in first appearance order
        std::unordered_map<std::string, size_t> slot;
        std::vector<ranked_pattern_t> ranked;
        for (corpus_t::const_iterator it = corpus.begin(); it != corpus.end(); ++it) {
            if (it->empty() || it->size() > max_pattern_length) continue;
            std::string key((const char *)&(*it)[0], it->size());
            std::unordered_map<std::string, size_t>::iterator found = slot.find(key);
            if (found != slot.end()) {
                ++ranked[found->second].count;
                continue;
            }
            slot.insert(std::make_pair(key, ranked.size()));
            ranked_pattern_t entry;
            entry.pattern.swap(key);
            entry.count = 1;
            ranked.push_back(entry);
        }
        if (min_count > 1) {
            below_min_count_t below;
            below.min_count = min_count;
            ranked.erase(std::remove_if(ranked.begin(), ranked.end(), below), ranked.end());
        }
        std::stable_sort(ranked.begin(), ranked.end(), more_frequent);

        dictionary_t *dictionary = new dictionary_t(capacity, index_width);
        if (ranked.size() > capacity) {
            dictionary->dropped_count = ranked.size() - capacity;
            ranked.resize(capacity);
        }
        for (size_t i = 0; i < ranked.size(); ++i)
            dictionary->insert((const uint8_t *)ranked[i].pattern.data(),
                               ranked[i].pattern.size(), (uint32_t)i);
        dictionary->sort_candidates();
        if (statistics) statistics->record_build(stage, dictionary);
        return dictionary_ptr_t(dictionary);
    }

    // record: magic:u32 capacity:u32 index_width:u8 count:u32
    //         then count x { index:index_width length:u16 bytes[length] }
    void
    dictionary_t::save(bytes_t &out) const
    {
        write_big_endian(out, record_magic, 4);
        write_big_endian(out, capacity, 4);
        out.push_back(index_width);
        write_big_endian(out, (uint_fast32_t)entries.size(), 4);
        for (size_t index = 0; index < patterns.size(); ++index) {
            if (patterns[index].empty()) continue;
            write_big_endian(out, (uint_fast32_t)index, index_width);
            write_big_endian(out, (uint_fast32_t)patterns[index].size(), 2);
            out.insert(out.end(), patterns[index].begin(), patterns[index].end());
        }
    }

    state_t
    dictionary_t::load(location_t *RESTRICT in, dictionary_ptr_t &dictionary)
    {
        uint_fast32_t magic, capacity, count, index, length;
        uint8_t index_width;
        if (!in->read_big_endian(&magic, 4) || magic != record_magic)
            return state_error_invalid_input;
        if (!in->read_big_endian(&capacity, 4) || !in->read_byte(&index_width) ||
            !in->read_big_endian(&count, 4))
            return state_error_invalid_input;
        if (!valid_index_width(index_width) || capacity > index_limit(index_width) ||
            count > capacity)
            return state_error_invalid_input;

        std::unique_ptr<dictionary_t> loaded(new dictionary_t(capacity, index_width));
        for (uint_fast32_t i = 0; i < count; ++i) {
            if (!in->read_big_endian(&index, index_width) ||
                !in->read_big_endian(&length, 2))
                return state_error_invalid_input;
            if (length > in->available_bytes) return state_error_invalid_input;
            if (!loaded->insert(in->pointer, length, (uint32_t)index))
                return state_error_invalid_input;
            in->consume(length);
        }
        loaded->sort_candidates();
        dictionary.reset(loaded.release());
        return state_ok;
    }

    bool
    dictionary_t::write(FILE *RESTRICT wfp) const
    {
        bytes_t record;
        save(record);
        return fwrite(&record[0], 1, record.size(), wfp) == record.size();
    }

    state_t
    dictionary_t::read(FILE *RESTRICT rfp, dictionary_ptr_t &dictionary)
    {
        bytes_t record(13);
        uint_fast32_t count, length;
        uint_fast8_t index_width;
        if (fread(&record[0], 1, record.size(), rfp) != record.size())
            return state_error_invalid_input;
        index_width = record[8];
        if (!valid_index_width(index_width)) return state_error_invalid_input;
        count = peek_big_endian(&record[9], 4);
        for (uint_fast32_t i = 0; i < count; ++i) {
            size_t offset = record.size();
            record.resize(offset + index_width + 2);
            if (fread(&record[offset], 1, index_width + 2, rfp) != (size_t)(index_width + 2))
                return state_error_invalid_input;
            length = peek_big_endian(&record[offset + index_width], 2);
            offset = record.size();
            record.resize(offset + length);
            if (length && fread(&record[offset], 1, length, rfp) != length)
                return state_error_invalid_input;
        }
        location_t in;
        in.encapsulate(&record[0], record.size());
        return load(&in, dictionary);
    }

    void
    dictionary_set_t::save(bytes_t &out) const
    {
        const snapshot_t current = snapshot();
        for (size_t i = 0; i < dictionary_stage_count; ++i) {
            bytes_t record;
            if (current.dictionaries[i]) current.dictionaries[i]->save(record);
            write_big_endian(out, (uint_fast32_t)record.size(), 4);
            out.insert(out.end(), record.begin(), record.end());
        }
    }

    state_t
    dictionary_set_t::load(location_t *RESTRICT in, snapshot_t &snapshot)
    {
        state_t state;
        uint_fast32_t size;
        snapshot_t loaded;
        for (size_t i = 0; i < dictionary_stage_count; ++i) {
            if (!in->read_big_endian(&size, 4)) return state_error_invalid_input;
            if (!size) continue;
            if (size > in->available_bytes) return state_error_invalid_input;
            location_t record;
            record.encapsulate(in->pointer, size);
            if ((state = dictionary_t::load(&record, loaded.dictionaries[i]))) return state;
            // Trailing bytes mean the size prefix and the record disagree
            if (record.available_bytes) return state_error_invalid_input;
            in->consume(size);
        }
        snapshot = loaded;
        return state_ok;
    }
}
