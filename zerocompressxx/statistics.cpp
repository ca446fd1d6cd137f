// see LICENSE.md for license.
#include "zerocompressxx/statistics.hpp"

namespace zerocompress {
    void
    statistics_t::reset(void)
    {
        payloads_compressed = payloads_decompressed = 0;
        bytes_in = bytes_compressed = 0;
        bytes_decoded_in = bytes_decoded_out = 0;
        memset(stages, 0, sizeof(stages));
        memset(errors, 0, sizeof(errors));
    }

    void
    statistics_t::record_build(const stage_t stage, const dictionary_t *dictionary)
    {
        // Capacity overflow is only a warning, the truncated dictionary is kept
        record_dictionary(stage, dictionary);
        if (dictionary) stages[stage].dictionary_dropped += dictionary->dropped();
    }

    double
    statistics_t::compression_ratio(void) const
    {
        if (!bytes_in) return 0.0;
        return 1.0 - (double)bytes_compressed / (double)bytes_in;
    }

    std::string
    format_decimal(uint64_t number)
    {
        char buf[128], *cur = buf, *last = buf + sizeof(buf);
        uint64_t mod = 1;
        while (number / mod >= 1000) mod *= 1000;
        cur += snprintf(cur, last - cur, "%u", (unsigned)(number / mod));
        while (mod > 1) {
            mod /= 1000;
            cur += snprintf(cur, last - cur, ",%03u", (unsigned)(number / mod % 1000));
        }
        return std::string(buf);
    }

    std::string
    statistics_t::render(void) const
    {
        char line[160];
        std::string text;
        snprintf(line, sizeof(line),
                 "compressed %s payloads, %s bytes to %s bytes (ratio %.2f%%)\n",
                 format_decimal(payloads_compressed).c_str(), format_decimal(bytes_in).c_str(),
                 format_decimal(bytes_compressed).c_str(), compression_ratio() * 100.0);
        text += line;
        snprintf(line, sizeof(line), "decompressed %s payloads, %s bytes to %s bytes\n",
                 format_decimal(payloads_decompressed).c_str(),
                 format_decimal(bytes_decoded_in).c_str(),
                 format_decimal(bytes_decoded_out).c_str());
        text += line;
        for (size_t i = 0; i < stage_count; ++i) {
            const stage_statistics_t &stage = stages[i];
            snprintf(line, sizeof(line),
                     "  %-16s applied %s, items %s, saved %s, dictionary %s (dropped %s)\n",
                     stage_render((stage_t)i).c_str(), format_decimal(stage.applied).c_str(),
                     format_decimal(stage.items).c_str(),
                     format_decimal(stage.bytes_saved).c_str(),
                     format_decimal(stage.dictionary_size).c_str(),
                     format_decimal(stage.dictionary_dropped).c_str());
            text += line;
        }
        for (size_t i = 1; i < state_count; ++i) {
            if (!errors[i]) continue;
            snprintf(line, sizeof(line), "  %s: %s\n", state_render((state_t)i).c_str(),
                     format_decimal(errors[i]).c_str());
            text += line;
        }
        return text;
    }
}
