// see LICENSE.md for license.
#pragma once
#include <atomic>
#include "zerocompressxx/dictionary.def.hpp"

namespace zerocompress {
    inline bool
    dictionary_t::lookup(const uint8_t *pattern, const uint_fast64_t szpattern,
                         uint_fast32_t *index) const
    {
        if (!szpattern || by_first_byte[pattern[0]].empty()) return false;
        std::unordered_map<std::string, uint32_t>::const_iterator found =
            entries.find(std::string((const char *)pattern, szpattern));
        if (found == entries.end()) return false;
        *index = found->second;
        return true;
    }
    inline const bytes_t *
    dictionary_t::reverse(const uint_fast32_t index) const
    {
        if (index >= patterns.size() || patterns[index].empty()) return NULL;
        return &patterns[index];
    }
    inline const std::vector<uint32_t> &
    dictionary_t::candidates(const uint8_t first) const
    {
        return by_first_byte[first];
    }

    // dictionary_set: the active dictionary of every token stage.
    class dictionary_set_t {
    public:
        struct snapshot_t {
            dictionary_ptr_t dictionaries[dictionary_stage_count];
            inline const dictionary_t *get(const stage_t stage) const
            {   return stage < dictionary_stage_count ? dictionaries[stage].get(): NULL; }
        };

        inline dictionary_ptr_t get(const stage_t stage) const
        {   return std::atomic_load(&slots[stage]); }
        inline void publish(const stage_t stage, const dictionary_ptr_t &dictionary)
        {   std::atomic_store(&slots[stage], dictionary); }
        inline snapshot_t snapshot(void) const
        {   snapshot_t snapshot;
            for (size_t i = 0; i < dictionary_stage_count; ++i)
                snapshot.dictionaries[i] = std::atomic_load(&slots[i]);
            return snapshot; }
        inline void publish(const snapshot_t &snapshot)
        {   for (size_t i = 0; i < dictionary_stage_count; ++i)
                std::atomic_store(&slots[i], snapshot.dictionaries[i]); }

        // record: per stage size:u32 then a dictionary record, size 0 when absent.
        void save(bytes_t &out) const;
        static state_t load(location_t *RESTRICT in, snapshot_t &snapshot);
    private:
        dictionary_ptr_t slots[dictionary_stage_count];
    };
}
